// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_UPLOADER_IMPL_HPP
#define MPUPLOAD_UPLOADER_IMPL_HPP

#include <fstream>
#include <memory>

#include "uploader_interfaces.hpp"

namespace mpupload {
namespace uploader {

/**
 * IFileStream backed by std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode | std::ios_base::in) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streampos tellg() override { return stream_.tellg(); }

  std::streamsize gcount() const override { return stream_.gcount(); }

  bool good() const override { return stream_.good(); }

  bool fail() const override { return stream_.fail(); }

private:
  std::ifstream stream_;
};

class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->good()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_UPLOADER_IMPL_HPP
