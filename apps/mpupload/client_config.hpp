// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_CLIENT_CONFIG_HPP
#define MPUPLOAD_CLIENT_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "s3_object_store.hpp"

namespace mpupload {
namespace cli {

/**
 * Upload strategy
 */
enum class UploadMode {
  Put,         // Single PutObject request
  Multipart,   // Multipart upload, one part at a time
  Concurrent,  // Multipart upload with up to max_concurrency parts in flight
  Uploader,    // SDK TransferManager: part size and concurrency handed to the SDK
};

std::optional<UploadMode> parse_upload_mode(const std::string& mode);
const char* to_string(UploadMode mode);

constexpr uint64_t kDefaultPartSize = 8ULL * 1024 * 1024;  // 8 MiB
constexpr int kDefaultConcurrency = 5;

struct UploadSettings {
  UploadMode mode = UploadMode::Concurrent;
  uint64_t part_size = kDefaultPartSize;
  int max_concurrency = kDefaultConcurrency;
  std::string key;
  std::string file;
};

struct LoggingSettings {
  std::string level = "info";
  bool console_enabled = true;
  bool console_colors = true;
  bool file_enabled = false;
  std::string directory = "/tmp/mpupload";
  std::string format = "text";  // "text" or "json"
};

struct ClientConfig {
  uploader::S3Config s3;
  UploadSettings upload;
  LoggingSettings logging;
};

}  // namespace cli
}  // namespace mpupload

#endif  // MPUPLOAD_CLIENT_CONFIG_HPP
