// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_OBJECT_STORE_HPP
#define MPUPLOAD_OBJECT_STORE_HPP

#include <cstdint>

#include "upload_types.hpp"

namespace mpupload {
namespace uploader {

/**
 * Remote operations required by the multipart upload engine.
 *
 * Implementations must allow uploadPart() to be called concurrently from
 * several worker threads. The engine never calls an abort operation.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Start a multipart upload session.
   * @return Upload id on success
   */
  virtual RemoteResult initiateUpload(const UploadTarget& target) = 0;

  /**
   * Upload one part of an open session.
   * @param part_number 1-based part number
   * @param data Part bytes, valid for the duration of the call
   * @param size Number of bytes in data
   * @return Part ETag on success
   */
  virtual RemoteResult uploadPart(
    const UploadSession& session, int part_number, const char* data, uint64_t size
  ) = 0;

  /**
   * Assemble the object from its uploaded parts.
   * @param manifest Parts in ascending part number order
   * @return Object ETag on success
   */
  virtual RemoteResult completeUpload(
    const UploadSession& session, const CompletionManifest& manifest
  ) = 0;
};

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_OBJECT_STORE_HPP
