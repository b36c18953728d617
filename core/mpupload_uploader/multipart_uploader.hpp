// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_MULTIPART_UPLOADER_HPP
#define MPUPLOAD_MULTIPART_UPLOADER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "object_store.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace mpupload {
namespace uploader {

/**
 * Bounded-concurrency multipart upload engine.
 *
 * Splits a local file into fixed-size parts and uploads them through an
 * IObjectStore with at most max_concurrency part uploads in flight:
 *
 *   Initiating -> Chunking -> Dispatching/Aggregating -> Completing -> Done
 *                                                     \-> Failed
 *
 * - Parts are dispatched in ascending part number order on a pool of
 *   min(max_concurrency, part count) worker threads.
 * - Results are aggregated in completion order; the completion manifest is
 *   always re-sorted by part number before it is submitted.
 * - On the first failed part no further parts are dispatched, in-flight parts
 *   run to completion and their results are discarded. The upload fails with
 *   PartUploadFailed and the complete call is never made.
 * - Nothing is retried.
 *
 * Orphaned sessions: the engine never aborts a session it initiated. When an
 * upload fails after initiation, MultipartUploadResult::upload_id names the
 * open session; the caller is responsible for aborting it (or for a bucket
 * lifecycle rule that expires incomplete multipart uploads).
 *
 * A file needing more than kMaxParts parts at the requested part size is
 * rejected with InvalidConfiguration before the session is initiated.
 *
 * Zero-length files are rejected with EmptyFileNotSupported before any remote
 * call, since an S3 multipart upload cannot be completed without a part.
 */
class MultipartUploader {
public:
  /// Concurrency ceiling documented by the object store
  static constexpr int kMaxConcurrency = 8;
  /// Highest part number the object store accepts
  static constexpr int kMaxParts = 10000;

  /**
   * @param store Object store used for the remote calls (must outlive the uploader)
   */
  explicit MultipartUploader(IObjectStore& store);

  /**
   * @param store Object store used for the remote calls (must outlive the uploader)
   * @param stream_factory Source of part read streams
   */
  MultipartUploader(IObjectStore& store, std::shared_ptr<IFileStreamFactory> stream_factory);

  MultipartUploader(const MultipartUploader&) = delete;
  MultipartUploader& operator=(const MultipartUploader&) = delete;

  /**
   * Upload a local file as a multipart object.
   *
   * Blocks until every dispatched part has settled and, on success, the
   * upload has been completed.
   *
   * @param local_path Path to the local file
   * @param target Destination bucket and key
   * @param part_size Bytes per part (last part may be smaller), must be > 0
   * @param max_concurrency Maximum in-flight part uploads, 1..kMaxConcurrency
   * @param progress_cb Optional callback, invoked on the calling thread after
   *        each successfully uploaded part
   * @return Success with the object ETag and manifest, or a failure describing
   *         the error kind, phase and (for part failures) the part number
   */
  MultipartUploadResult upload(
    const std::string& local_path, const UploadTarget& target, uint64_t part_size,
    int max_concurrency, ProgressCallback progress_cb = nullptr
  );

  /**
   * Check part size and concurrency without touching the store.
   *
   * @param error_msg Set to a description of the first invalid setting
   * @return true if both settings are acceptable
   */
  static bool validateSettings(uint64_t part_size, int max_concurrency, std::string& error_msg);

private:
  PartResult uploadOnePart(
    const std::string& local_path, const UploadSession& session, const Part& part
  );

  IObjectStore& store_;
  std::shared_ptr<IFileStreamFactory> stream_factory_;
};

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_MULTIPART_UPLOADER_HPP
