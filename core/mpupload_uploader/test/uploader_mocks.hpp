// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_UPLOADER_MOCKS_HPP
#define MPUPLOAD_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <cstdint>
#include <ios>
#include <memory>
#include <string>

#include "object_store.hpp"
#include "uploader_interfaces.hpp"

namespace mpupload {
namespace uploader {
namespace test {

/**
 * Mock implementation of IObjectStore for testing
 */
class MockObjectStore : public IObjectStore {
public:
  MOCK_METHOD(RemoteResult, initiateUpload, (const UploadTarget& target), (override));
  MOCK_METHOD(
    RemoteResult, uploadPart,
    (const UploadSession& session, int part_number, const char* data, uint64_t size),
    (override)
  );
  MOCK_METHOD(
    RemoteResult, completeUpload,
    (const UploadSession& session, const CompletionManifest& manifest), (override)
  );
};

/**
 * Mock implementation of IFileStream for testing
 */
class MockFileStream : public IFileStream {
public:
  MOCK_METHOD(IFileStream&, read, (char* buffer, std::streamsize size), (override));
  MOCK_METHOD(
    IFileStream&, seekg, (std::streamoff offset, std::ios_base::seekdir origin), (override)
  );
  MOCK_METHOD(std::streampos, tellg, (), (override));
  MOCK_METHOD(std::streamsize, gcount, (), (const, override));
  MOCK_METHOD(bool, good, (), (const, override));
  MOCK_METHOD(bool, fail, (), (const, override));
};

/**
 * Mock implementation of IFileStreamFactory for testing
 */
class MockFileStreamFactory : public IFileStreamFactory {
public:
  MOCK_METHOD(
    std::unique_ptr<IFileStream>, create_file_stream,
    (const std::string& path, std::ios_base::openmode mode), (override)
  );
};

}  // namespace test
}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_UPLOADER_MOCKS_HPP
