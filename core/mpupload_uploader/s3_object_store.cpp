// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/Array.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <aws/transfer/TransferHandle.h>
#include <aws/transfer/TransferManager.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>

#define MPUPLOAD_LOG_COMPONENT "s3_object_store"
#include <mpupload_log_macros.hpp>

namespace mpupload {
namespace uploader {

using logging::kv;

namespace {

const char* kAllocationTag = "mpupload";

// InitAPI/ShutdownAPI must run exactly once per process; reference-counted
// across all S3ObjectStore instances.
class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0 && initialized_) {
      Aws::ShutdownAPI(options_);
      initialized_ = false;
    }
  }

private:
  AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

template <typename ErrorT>
RemoteResult failureFrom(const ErrorT& error, const std::string& fallback_code) {
  std::string code = error.GetExceptionName();
  if (code.empty()) {
    code = fallback_code;
  }
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = "HTTP " + std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  const bool retryable = S3ObjectStore::isRetryableError(code) || error.ShouldRetry();
  return RemoteResult::Failure(message, code, retryable);
}

}  // namespace

std::string stripEtagQuotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string encodeCredentials(const std::string& username, const std::string& password) {
  const std::string plain = username + ":" + password;
  Aws::Utils::ByteBuffer bytes(
    reinterpret_cast<const unsigned char*>(plain.data()), plain.size()
  );
  return std::string(Aws::Utils::HashingUtils::Base64Encode(bytes).c_str());
}

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // The client must go before the SDK reference: release() may call ShutdownAPI().
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;

    // No SDK-level retries; failed parts fail the upload.
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (Objectslite, MinIO) need path-style addressing.
    const bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
  impl_->initClient();
}

S3ObjectStore::~S3ObjectStore() = default;

RemoteResult S3ObjectStore::initiateUpload(const UploadTarget& target) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);
  request.SetContentType("application/octet-stream");

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), "CreateMultipartUploadFailed");
  }

  const std::string upload_id = outcome.GetResult().GetUploadId();
  MPUPLOAD_LOG_DEBUG("CreateMultipartUpload succeeded" << kv("upload_id", upload_id));
  return RemoteResult::Success(upload_id);
}

RemoteResult S3ObjectStore::uploadPart(
  const UploadSession& session, int part_number, const char* data, uint64_t size
) {
  // The SDK only reads the body, the const_cast never leads to a write.
  Aws::Utils::Stream::PreallocatedStreamBuf stream_buf(
    reinterpret_cast<unsigned char*>(const_cast<char*>(data)), static_cast<size_t>(size)
  );
  auto body = Aws::MakeShared<Aws::IOStream>(kAllocationTag, &stream_buf);

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(session.target.bucket);
  request.SetKey(session.target.key);
  request.SetUploadId(session.upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(size));
  request.SetBody(body);

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), "UploadPartFailed");
  }
  return RemoteResult::Success(stripEtagQuotes(outcome.GetResult().GetETag()));
}

RemoteResult S3ObjectStore::completeUpload(
  const UploadSession& session, const CompletionManifest& manifest
) {
  Aws::S3::Model::CompletedMultipartUpload completed_upload;
  for (const auto& entry : manifest) {
    Aws::S3::Model::CompletedPart part;
    part.SetPartNumber(entry.part_number);
    part.SetETag(entry.etag);
    completed_upload.AddParts(std::move(part));
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(session.target.bucket);
  request.SetKey(session.target.key);
  request.SetUploadId(session.upload_id);
  request.SetMultipartUpload(completed_upload);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom(outcome.GetError(), "CompleteMultipartUploadFailed");
  }
  return RemoteResult::Success(stripEtagQuotes(outcome.GetResult().GetETag()));
}

RemoteResult S3ObjectStore::putObject(const std::string& local_path, const UploadTarget& target) {
  auto body = Aws::MakeShared<Aws::FStream>(
    kAllocationTag, local_path.c_str(), std::ios_base::in | std::ios_base::binary
  );
  if (!body->good()) {
    return RemoteResult::Failure("Cannot open local file: " + local_path, "FileNotFound", false);
  }

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);
  request.SetContentType("application/octet-stream");
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    auto failure = failureFrom(outcome.GetError(), "PutObjectFailed");
    MPUPLOAD_LOG_ERROR(
      "PutObject failed: " << failure.error_message << kv("key", target.key)
                           << kv("code", failure.error_code)
    );
    return failure;
  }
  return RemoteResult::Success(stripEtagQuotes(outcome.GetResult().GetETag()));
}

uint64_t S3ObjectStore::transferPartSize(uint64_t requested) {
  constexpr uint64_t kMinPartSize = 5ULL * 1024 * 1024;
  constexpr uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;
  return std::min(std::max(requested, kMinPartSize), kMaxPartSize);
}

RemoteResult S3ObjectStore::uploadFile(
  const std::string& local_path, const UploadTarget& target, uint64_t part_size,
  int max_concurrency, ProgressCallback progress_cb
) {
  std::ifstream file(local_path, std::ios::binary | std::ios::ate);
  if (!file) {
    return RemoteResult::Failure("Cannot open local file: " + local_path, "FileNotFound", false);
  }
  const uint64_t file_size = static_cast<uint64_t>(file.tellg());
  file.close();

  const uint64_t buffer_size = transferPartSize(part_size);
  if (buffer_size != part_size) {
    MPUPLOAD_LOG_WARN(
      "Part size outside S3 limits for the transfer manager" << kv("requested", part_size)
                                                             << kv("using", buffer_size)
    );
  }

  // Declared before the manager so the pool outlives every task it runs.
  auto executor = Aws::MakeShared<Aws::Utils::Threading::PooledThreadExecutor>(
    kAllocationTag, static_cast<size_t>(max_concurrency)
  );
  Aws::Transfer::TransferManagerConfiguration transfer_config(executor.get());
  transfer_config.s3Client = impl_->client;
  transfer_config.bufferSize = buffer_size;
  // The default heap limit would hold fewer part buffers than there are threads.
  transfer_config.transferBufferMaxHeapSize = buffer_size * static_cast<uint64_t>(max_concurrency);
  auto transfer_manager = Aws::Transfer::TransferManager::Create(transfer_config);

  auto handle = transfer_manager->UploadFile(
    local_path.c_str(), target.bucket.c_str(), target.key.c_str(), "application/octet-stream",
    Aws::Map<Aws::String, Aws::String>()
  );

  if (progress_cb) {
    constexpr auto poll_interval = std::chrono::milliseconds(100);
    while (handle->GetStatus() == Aws::Transfer::TransferStatus::IN_PROGRESS ||
           handle->GetStatus() == Aws::Transfer::TransferStatus::NOT_STARTED) {
      progress_cb(handle->GetBytesTransferred(), file_size);
      std::this_thread::sleep_for(poll_interval);
    }
    progress_cb(handle->GetBytesTransferred(), file_size);
  } else {
    handle->WaitUntilFinished();
  }

  const auto status = handle->GetStatus();
  if (status != Aws::Transfer::TransferStatus::COMPLETED) {
    const auto& error = handle->GetLastError();
    std::string code = error.GetExceptionName();
    if (code.empty()) {
      code = status == Aws::Transfer::TransferStatus::CANCELED  ? "TransferCanceled"
             : status == Aws::Transfer::TransferStatus::ABORTED ? "TransferAborted"
                                                                : "TransferFailed";
    }
    std::string message = error.GetMessage();
    if (message.empty()) {
      message = "Transfer ended with status " + std::to_string(static_cast<int>(status));
    }
    MPUPLOAD_LOG_ERROR(
      "Transfer manager upload failed: " << message << kv("key", target.key) << kv("code", code)
    );
    return RemoteResult::Failure(message, code, isRetryableError(code) || error.ShouldRetry());
  }

  // The handle does not carry the final ETag; read it back from the object.
  Aws::S3::Model::HeadObjectRequest head;
  head.SetBucket(target.bucket);
  head.SetKey(target.key);
  auto outcome = impl_->client->HeadObject(head);
  std::string etag;
  if (outcome.IsSuccess()) {
    etag = stripEtagQuotes(outcome.GetResult().GetETag());
  } else {
    MPUPLOAD_LOG_WARN(
      "Uploaded object but could not read its ETag" << kv("key", target.key)
                                                     << kv("code", outcome.GetError().GetExceptionName())
    );
  }
  MPUPLOAD_LOG_DEBUG(
    "Transfer manager upload completed" << kv("bytes", file_size)
                                        << kv("parts", handle->GetCompletedParts().size())
  );
  return RemoteResult::Success(etag);
}

bool S3ObjectStore::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> retryable = {
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "SlowDown",
    "RequestTimeTooSkewed",
    "ConnectionReset",
    "ConnectionTimeout",
    "NetworkingError",
    "Throttling",
    "ThrottlingException",
  };
  return retryable.count(error_code) > 0;
}

const std::string& S3ObjectStore::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace uploader
}  // namespace mpupload
