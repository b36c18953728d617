// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_UPLOADER_INTERFACES_HPP
#define MPUPLOAD_UPLOADER_INTERFACES_HPP

#include <ios>
#include <memory>
#include <string>

namespace mpupload {
namespace uploader {

/**
 * Read-only file stream seam, so part reads can be mocked in tests.
 * Each part upload task owns its own stream.
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;

  /**
   * Current read position, -1 on error
   */
  virtual std::streampos tellg() = 0;

  /**
   * Number of characters extracted by the last read()
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool good() const = 0;
  virtual bool fail() const = 0;
};

/**
 * Factory for file streams.
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * Open a file stream
   * @return The stream, or nullptr if the file could not be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_UPLOADER_INTERFACES_HPP
