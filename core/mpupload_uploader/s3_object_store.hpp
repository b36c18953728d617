// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_S3_OBJECT_STORE_HPP
#define MPUPLOAD_S3_OBJECT_STORE_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "object_store.hpp"

namespace mpupload {
namespace uploader {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "https://10.0.0.5:9440/api/prism/v4.0/objects/"
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = false;  // Objectslite appliances ship self-signed certificates

  // Used as given; resolving them from the environment or a prompt is up to the caller
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;
};

/**
 * IObjectStore backed by the AWS SDK for C++.
 *
 * Works against AWS S3 and S3-compatible stores. A custom endpoint switches
 * to path-style addressing. The SDK's own retries are disabled: failures are
 * reported to the caller unchanged.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  RemoteResult initiateUpload(const UploadTarget& target) override;

  RemoteResult uploadPart(
    const UploadSession& session, int part_number, const char* data, uint64_t size
  ) override;

  RemoteResult completeUpload(
    const UploadSession& session, const CompletionManifest& manifest
  ) override;

  /**
   * Upload a whole file with a single PutObject request.
   *
   * @return Object ETag on success
   */
  RemoteResult putObject(const std::string& local_path, const UploadTarget& target);

  /**
   * Upload a file through the SDK's TransferManager.
   *
   * The SDK picks PutObject or a multipart upload by file size and schedules
   * the parts itself on a pool of max_concurrency threads. part_size is
   * clamped to the S3 limits of 5 MiB to 5 GiB. Unlike MultipartUploader,
   * the SDK aborts the multipart session when a part fails.
   *
   * @param progress_cb Polled on the calling thread while the transfer runs
   * @return Object ETag on success
   */
  RemoteResult uploadFile(
    const std::string& local_path, const UploadTarget& target, uint64_t part_size,
    int max_concurrency, ProgressCallback progress_cb = nullptr
  );

  /**
   * Part size the transfer manager uses for a requested part size.
   */
  static uint64_t transferPartSize(uint64_t requested);

  /**
   * Check if an S3 error code denotes a transient condition.
   * Informational only: nothing in mpupload retries.
   */
  static bool isRetryableError(const std::string& error_code);

  const std::string& bucket() const;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Objectslite credential encoding: base64("username:password"), used as both
 * access key and secret key.
 */
std::string encodeCredentials(const std::string& username, const std::string& password);

/**
 * Remove one pair of surrounding double quotes from an ETag, if present.
 */
std::string stripEtagQuotes(const std::string& etag);

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_S3_OBJECT_STORE_HPP
