// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_UPLOAD_TYPES_HPP
#define MPUPLOAD_UPLOAD_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace mpupload {
namespace uploader {

/**
 * One contiguous byte range of the source file, uploaded as an independent unit.
 * Part numbers start at 1.
 */
struct Part {
  int number = 0;
  uint64_t offset = 0;
  uint64_t length = 0;

  bool operator==(const Part& other) const {
    return number == other.number && offset == other.offset && length == other.length;
  }
};

/**
 * Destination of an upload (bucket + object key).
 */
struct UploadTarget {
  std::string bucket;
  std::string key;
};

/**
 * Server-side multipart upload session.
 */
struct UploadSession {
  std::string upload_id;  // Opaque token issued by the object store
  UploadTarget target;
};

/**
 * Outcome of a single part upload task.
 */
struct PartResult {
  int part_number = 0;
  bool success = false;
  std::string etag;
  uint64_t bytes = 0;
  std::string error_message;
  std::string error_code;
  bool is_retryable = false;

  static PartResult Success(int part_number, const std::string& etag, uint64_t bytes) {
    PartResult r;
    r.part_number = part_number;
    r.success = true;
    r.etag = etag;
    r.bytes = bytes;
    return r;
  }

  static PartResult Failure(
    int part_number, const std::string& message, const std::string& code = "",
    bool retryable = false
  ) {
    PartResult r;
    r.part_number = part_number;
    r.error_message = message;
    r.error_code = code;
    r.is_retryable = retryable;
    return r;
  }
};

/**
 * Entry of the completion manifest.
 */
struct CompletedPart {
  int part_number = 0;
  std::string etag;

  bool operator==(const CompletedPart& other) const {
    return part_number == other.part_number && etag == other.etag;
  }
};

// Strictly ascending by part_number, one entry per part.
using CompletionManifest = std::vector<CompletedPart>;

/**
 * Result of one remote object store call.
 *
 * On success, `value` holds the call's payload: the upload id for
 * initiate, the part ETag for upload-part, the object ETag for complete.
 */
struct RemoteResult {
  bool success = false;
  std::string value;
  std::string error_message;
  std::string error_code;
  bool is_retryable = false;

  static RemoteResult Success(const std::string& value) {
    return {true, value, "", "", false};
  }

  static RemoteResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, "", message, code, retryable};
  }
};

enum class UploadErrorKind {
  None,
  InvalidConfiguration,   // Bad part size or concurrency, detected before any remote call
  EmptyFileNotSupported,  // Zero-length source file
  FileReadFailed,         // Source file could not be opened or sized
  RemoteCallFailed,       // Initiate or complete call failed
  PartUploadFailed,       // A part upload (or the read of its byte range) failed
};

/**
 * Per-invocation state of the upload engine.
 */
enum class UploadPhase { Initiating, Chunking, Dispatching, Aggregating, Completing, Done, Failed };

const char* toString(UploadErrorKind kind);
const char* toString(UploadPhase phase);

inline std::ostream& operator<<(std::ostream& os, UploadErrorKind kind) {
  return os << toString(kind);
}

inline std::ostream& operator<<(std::ostream& os, UploadPhase phase) {
  return os << toString(phase);
}

struct UploadStats {
  int part_count = 0;
  uint64_t total_bytes = 0;
  uint64_t bytes_uploaded = 0;
  int peak_in_flight = 0;  // Highest number of simultaneously running part uploads
  std::chrono::milliseconds elapsed{0};
};

/**
 * Result of a multipart upload.
 *
 * When a failure happens after the session was initiated, `upload_id` is set:
 * the session is left open on the object store and must be aborted by the caller.
 */
struct MultipartUploadResult {
  bool success = false;
  std::string etag;  // ETag of the assembled object
  std::string upload_id;
  CompletionManifest manifest;

  UploadErrorKind error_kind = UploadErrorKind::None;
  UploadPhase failed_phase = UploadPhase::Done;
  int failed_part = 0;  // Set for PartUploadFailed
  std::string error_message;
  std::string error_code;
  bool is_retryable = false;

  UploadStats stats;

  static MultipartUploadResult Success(
    const std::string& etag, const std::string& upload_id, CompletionManifest manifest
  ) {
    MultipartUploadResult r;
    r.success = true;
    r.etag = etag;
    r.upload_id = upload_id;
    r.manifest = std::move(manifest);
    return r;
  }

  static MultipartUploadResult Failure(
    UploadErrorKind kind, UploadPhase phase, const std::string& message,
    const std::string& code = "", bool retryable = false
  ) {
    MultipartUploadResult r;
    r.error_kind = kind;
    r.failed_phase = phase;
    r.error_message = message;
    r.error_code = code;
    r.is_retryable = retryable;
    return r;
  }
};

/**
 * Progress callback type
 *
 * @param bytes_uploaded Bytes of successfully uploaded parts so far
 * @param total_bytes Total file size
 */
using ProgressCallback = std::function<void(uint64_t bytes_uploaded, uint64_t total_bytes)>;

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_UPLOAD_TYPES_HPP
