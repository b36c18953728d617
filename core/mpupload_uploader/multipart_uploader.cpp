// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_uploader.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "multipart_uploader_test_helpers.hpp"
#include "part_chunker.hpp"
#include "part_result_collector.hpp"
#include "uploader_impl.hpp"

#define MPUPLOAD_LOG_COMPONENT "multipart_uploader"
#include <mpupload_log_macros.hpp>

namespace mpupload {
namespace uploader {

using logging::kv;

namespace {

/**
 * Joins the part workers on every exit path. Cancels first so that workers
 * still holding undispatched parts stop early.
 */
class WorkerJoinGuard {
public:
  explicit WorkerJoinGuard(PartResultCollector& collector)
      : collector_(collector) {}

  ~WorkerJoinGuard() {
    collector_.cancel();
    join();
  }

  WorkerJoinGuard(const WorkerJoinGuard&) = delete;
  WorkerJoinGuard& operator=(const WorkerJoinGuard&) = delete;

  template <typename Fn>
  void spawn(size_t count, Fn fn) {
    threads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      threads_.emplace_back(fn);
    }
  }

  void join() {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

private:
  PartResultCollector& collector_;
  std::vector<std::thread> threads_;
};

void recordPeak(std::atomic<int>& peak, int value) {
  int current = peak.load();
  while (value > current && !peak.compare_exchange_weak(current, value)) {
  }
}

}  // namespace

std::optional<uint64_t> getFileSizeImpl(
  const std::string& local_path, IFileStreamFactory& stream_factory
) {
  auto file = stream_factory.create_file_stream(local_path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }
  std::streampos pos = file->tellg();
  if (pos == std::streampos(-1) || !file->good()) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(pos);
}

bool readPartImpl(
  const std::string& local_path, const Part& part, IFileStreamFactory& stream_factory,
  std::vector<char>& buffer, std::string& error_msg
) {
  auto file = stream_factory.create_file_stream(local_path, std::ios::binary);
  if (!file) {
    error_msg = "Cannot open local file: " + local_path;
    return false;
  }

  file->seekg(static_cast<std::streamoff>(part.offset), std::ios::beg);
  if (file->fail()) {
    error_msg = "Cannot seek to offset " + std::to_string(part.offset) + " in " + local_path;
    return false;
  }

  buffer.resize(static_cast<size_t>(part.length));
  file->read(buffer.data(), static_cast<std::streamsize>(part.length));
  const auto got = file->gcount();
  if (got < 0 || static_cast<uint64_t>(got) != part.length) {
    error_msg = "Short read of part " + std::to_string(part.number) + ": expected " +
                std::to_string(part.length) + " bytes, got " + std::to_string(got);
    return false;
  }
  return true;
}

MultipartUploader::MultipartUploader(IObjectStore& store)
    : MultipartUploader(store, std::make_shared<FileStreamFactoryImpl>()) {}

MultipartUploader::MultipartUploader(
  IObjectStore& store, std::shared_ptr<IFileStreamFactory> stream_factory
)
    : store_(store)
    , stream_factory_(std::move(stream_factory)) {}

bool MultipartUploader::validateSettings(
  uint64_t part_size, int max_concurrency, std::string& error_msg
) {
  if (part_size == 0) {
    error_msg = "part_size must be greater than zero";
    return false;
  }
  if (max_concurrency < 1 || max_concurrency > kMaxConcurrency) {
    error_msg = "max_concurrency must be between 1 and " + std::to_string(kMaxConcurrency) +
                ", got " + std::to_string(max_concurrency);
    return false;
  }
  return true;
}

PartResult MultipartUploader::uploadOnePart(
  const std::string& local_path, const UploadSession& session, const Part& part
) {
  logging::PartLogContext part_context(part.number);
  RemoteResult outcome;
  try {
    std::vector<char> buffer;
    std::string error_msg;
    if (!readPartImpl(local_path, part, *stream_factory_, buffer, error_msg)) {
      MPUPLOAD_LOG_WARN("Cannot read part: " << error_msg);
      return PartResult::Failure(part.number, error_msg, "FileReadFailed");
    }
    outcome = store_.uploadPart(session, part.number, buffer.data(), part.length);
  } catch (const std::exception& e) {
    // Runs on a worker thread: an escaping exception would terminate the process.
    MPUPLOAD_LOG_WARN("Part upload threw: " << e.what());
    return PartResult::Failure(part.number, e.what(), "UploadPartException");
  }

  if (!outcome.success) {
    MPUPLOAD_LOG_WARN(
      "Object store rejected part: " << outcome.error_message << kv("code", outcome.error_code)
    );
    return PartResult::Failure(
      part.number, outcome.error_message, outcome.error_code, outcome.is_retryable
    );
  }

  MPUPLOAD_LOG_DEBUG(
    "Part uploaded" << kv("part", part.number) << kv("bytes", part.length)
                    << kv("etag", outcome.value)
  );
  return PartResult::Success(part.number, outcome.value, part.length);
}

MultipartUploadResult MultipartUploader::upload(
  const std::string& local_path, const UploadTarget& target, uint64_t part_size,
  int max_concurrency, ProgressCallback progress_cb
) {
  logging::UploadLogContext log_context(target.bucket, target.key);

  const auto started = std::chrono::steady_clock::now();
  UploadStats stats;
  auto finish = [&stats, started](MultipartUploadResult result) {
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started
    );
    result.stats = stats;
    return result;
  };

  // Initiating
  std::string error_msg;
  if (!validateSettings(part_size, max_concurrency, error_msg)) {
    MPUPLOAD_LOG_ERROR("Rejected upload configuration: " << error_msg);
    return finish(MultipartUploadResult::Failure(
      UploadErrorKind::InvalidConfiguration, UploadPhase::Initiating, error_msg,
      "InvalidConfiguration"
    ));
  }

  const auto file_size = getFileSizeImpl(local_path, *stream_factory_);
  if (!file_size) {
    MPUPLOAD_LOG_ERROR("Cannot open local file" << kv("path", local_path));
    return finish(MultipartUploadResult::Failure(
      UploadErrorKind::FileReadFailed, UploadPhase::Initiating,
      "Cannot open local file: " + local_path, "FileNotFound"
    ));
  }
  if (*file_size == 0) {
    MPUPLOAD_LOG_ERROR("Refusing multipart upload of empty file" << kv("path", local_path));
    return finish(MultipartUploadResult::Failure(
      UploadErrorKind::EmptyFileNotSupported, UploadPhase::Initiating,
      "Multipart upload requires at least one part; file is empty: " + local_path,
      "EmptyFileNotSupported"
    ));
  }
  stats.total_bytes = *file_size;

  // Checked before initiating so an oversized request never opens a session.
  const uint64_t part_count = partCount(*file_size, part_size);
  if (part_count > static_cast<uint64_t>(kMaxParts)) {
    error_msg = "File of " + std::to_string(*file_size) + " bytes needs " +
                std::to_string(part_count) + " parts of " + std::to_string(part_size) +
                " bytes; at most " + std::to_string(kMaxParts) + " parts are allowed";
    MPUPLOAD_LOG_ERROR("Rejected upload configuration: " << error_msg);
    return finish(MultipartUploadResult::Failure(
      UploadErrorKind::InvalidConfiguration, UploadPhase::Initiating, error_msg, "TooManyParts"
    ));
  }

  const RemoteResult initiated = store_.initiateUpload(target);
  if (!initiated.success) {
    MPUPLOAD_LOG_ERROR(
      "Failed to initiate multipart upload: " << initiated.error_message
                                              << kv("code", initiated.error_code)
    );
    return finish(MultipartUploadResult::Failure(
      UploadErrorKind::RemoteCallFailed, UploadPhase::Initiating,
      "Failed to initiate multipart upload: " + initiated.error_message, initiated.error_code,
      initiated.is_retryable
    ));
  }
  const UploadSession session{initiated.value, target};
  log_context.set_upload_id(session.upload_id);

  // Chunking
  const std::vector<Part> parts = splitIntoParts(*file_size, part_size);
  stats.part_count = static_cast<int>(parts.size());

  MPUPLOAD_LOG_INFO(
    "Starting multipart upload" << kv("upload_id", session.upload_id)
                                << kv("size", *file_size) << kv("parts", parts.size())
                                << kv("part_size", part_size)
                                << kv("max_concurrency", max_concurrency)
  );

  // Dispatching
  const size_t worker_count = std::min(static_cast<size_t>(max_concurrency), parts.size());
  PartResultCollector collector(worker_count);
  std::atomic<size_t> next_part{0};
  std::atomic<int> in_flight{0};
  std::atomic<int> peak_in_flight{0};

  auto worker_loop = [&]() {
    logging::UploadLogContext worker_context(target.bucket, target.key, session.upload_id);
    while (!collector.cancelled()) {
      const size_t idx = next_part.fetch_add(1);
      if (idx >= parts.size()) {
        break;
      }
      recordPeak(peak_in_flight, in_flight.fetch_add(1) + 1);
      PartResult result = uploadOnePart(local_path, session, parts[idx]);
      in_flight.fetch_sub(1);
      if (!result.success) {
        // Stop sibling workers before the coordinator has even seen the failure.
        collector.cancel();
      }
      collector.push(std::move(result));
    }
    collector.producerDone();
  };

  WorkerJoinGuard workers(collector);
  workers.spawn(worker_count, worker_loop);

  // Aggregating
  CompletionManifest manifest;
  manifest.reserve(parts.size());
  std::optional<PartResult> first_failure;

  while (auto result = collector.next()) {
    if (first_failure) {
      MPUPLOAD_LOG_DEBUG(
        "Discarding part result after failure" << kv("part", result->part_number)
                                               << kv("success", result->success)
      );
      continue;
    }
    if (!result->success) {
      MPUPLOAD_LOG_WARN(
        "Part upload failed, dispatching stopped" << kv("part", result->part_number)
                                                  << kv("error", result->error_message)
                                                  << kv("code", result->error_code)
      );
      first_failure = std::move(*result);
      collector.cancel();
      continue;
    }

    manifest.push_back({result->part_number, result->etag});
    stats.bytes_uploaded += result->bytes;
    if (progress_cb) {
      progress_cb(stats.bytes_uploaded, stats.total_bytes);
    }
    MPUPLOAD_LOG_INFO_THROTTLE(
      2.0, "Upload progress" << kv("parts_done", manifest.size()) << kv("parts", parts.size())
                             << kv("bytes", stats.bytes_uploaded)
    );
  }

  workers.join();
  stats.peak_in_flight = peak_in_flight.load();

  if (first_failure) {
    MPUPLOAD_LOG_ERROR(
      "Multipart upload failed, session left open on the object store"
      << kv("upload_id", session.upload_id) << kv("part", first_failure->part_number)
    );
    auto failure = MultipartUploadResult::Failure(
      UploadErrorKind::PartUploadFailed, UploadPhase::Aggregating,
      "Failed to upload part " + std::to_string(first_failure->part_number) + ": " +
        first_failure->error_message,
      first_failure->error_code, first_failure->is_retryable
    );
    failure.failed_part = first_failure->part_number;
    failure.upload_id = session.upload_id;
    return finish(std::move(failure));
  }

  // Completing
  std::sort(manifest.begin(), manifest.end(), [](const CompletedPart& a, const CompletedPart& b) {
    return a.part_number < b.part_number;
  });

  const RemoteResult completed = store_.completeUpload(session, manifest);
  if (!completed.success) {
    MPUPLOAD_LOG_ERROR(
      "Failed to complete multipart upload: " << completed.error_message
                                              << kv("upload_id", session.upload_id)
                                              << kv("code", completed.error_code)
    );
    auto failure = MultipartUploadResult::Failure(
      UploadErrorKind::RemoteCallFailed, UploadPhase::Completing,
      "Failed to complete multipart upload: " + completed.error_message, completed.error_code,
      completed.is_retryable
    );
    failure.upload_id = session.upload_id;
    return finish(std::move(failure));
  }

  MPUPLOAD_LOG_INFO(
    "Multipart upload completed" << kv("etag", completed.value) << kv("parts", manifest.size())
                                 << kv("peak_in_flight", stats.peak_in_flight)
  );
  return finish(
    MultipartUploadResult::Success(completed.value, session.upload_id, std::move(manifest))
  );
}

}  // namespace uploader
}  // namespace mpupload
