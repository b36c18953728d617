// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_MULTIPART_UPLOADER_TEST_HELPERS_HPP
#define MPUPLOAD_MULTIPART_UPLOADER_TEST_HELPERS_HPP

// Testing only: exposes internals of multipart_uploader.cpp for dependency injection.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace mpupload {
namespace uploader {

/**
 * Size of a local file
 * @return Size in bytes, or std::nullopt if the file cannot be opened or sized
 */
std::optional<uint64_t> getFileSizeImpl(
  const std::string& local_path, IFileStreamFactory& stream_factory
);

/**
 * Read exactly the byte range of one part through a fresh stream.
 *
 * @param buffer Resized to part.length and filled on success
 * @param error_msg Set on failure
 * @return true if the whole range was read
 */
bool readPartImpl(
  const std::string& local_path, const Part& part, IFileStreamFactory& stream_factory,
  std::vector<char>& buffer, std::string& error_msg
);

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_MULTIPART_UPLOADER_TEST_HELPERS_HPP
