// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

#include "multipart_uploader.hpp"

#include <mpupload_log_init.hpp>

namespace mpupload {
namespace cli {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

}  // namespace

std::optional<UploadMode> parse_upload_mode(const std::string& mode) {
  const std::string lower = to_lower(mode);
  if (lower == "put") {
    return UploadMode::Put;
  } else if (lower == "multipart") {
    return UploadMode::Multipart;
  } else if (lower == "concurrent") {
    return UploadMode::Concurrent;
  } else if (lower == "uploader") {
    return UploadMode::Uploader;
  }
  return std::nullopt;
}

const char* to_string(UploadMode mode) {
  switch (mode) {
    case UploadMode::Put:
      return "put";
    case UploadMode::Multipart:
      return "multipart";
    case UploadMode::Concurrent:
      return "concurrent";
    case UploadMode::Uploader:
      return "uploader";
  }
  return "unknown";
}

std::optional<uint64_t> parse_byte_size(const std::string& text) {
  size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
    ++digits;
  }
  if (digits == 0 || digits > 19) {
    return std::nullopt;
  }

  const uint64_t value = std::stoull(text.substr(0, digits));
  const std::string suffix = to_lower(text.substr(digits));

  uint64_t multiplier = 1;
  if (suffix.empty() || suffix == "b") {
    multiplier = 1;
  } else if (suffix == "k" || suffix == "kb" || suffix == "kib") {
    multiplier = 1024ULL;
  } else if (suffix == "m" || suffix == "mb" || suffix == "mib") {
    multiplier = 1024ULL * 1024;
  } else if (suffix == "g" || suffix == "gb" || suffix == "gib") {
    multiplier = 1024ULL * 1024 * 1024;
  } else {
    return std::nullopt;
  }

  if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
    return std::nullopt;
  }
  return value * multiplier;
}

void convert_logging_config(
  const LoggingSettings& settings, ::mpupload::logging::LoggingConfig& log_config
) {
  if (auto level = logging::parse_severity_level(settings.level)) {
    log_config.console_level = *level;
    log_config.file_level = *level;
  }
  log_config.console_enabled = settings.console_enabled;
  log_config.console_colors = settings.console_colors;
  log_config.file_enabled = settings.file_enabled;
  log_config.file_config.directory = settings.directory;
  log_config.file_config.format_json = (to_lower(settings.format) == "json");
}

bool ConfigParser::load_from_file(const std::string& path, ClientConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, ClientConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (!node || node.IsNull()) {
      return true;  // Empty document, keep defaults
    }
    if (!node.IsMap()) {
      last_error_ = "Configuration root must be a mapping";
      return false;
    }

    if (node["s3"] && !parse_s3(node["s3"], config.s3)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "YAML parse error: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, uploader::S3Config& s3) {
  if (node["endpoint"]) {
    s3.endpoint_url = node["endpoint"].as<std::string>();
  }
  if (node["bucket"]) {
    s3.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, UploadSettings& upload) {
  if (node["mode"]) {
    const std::string mode_str = node["mode"].as<std::string>();
    auto mode = parse_upload_mode(mode_str);
    if (!mode) {
      last_error_ = "Invalid upload mode '" + mode_str + "' (expected put, multipart, concurrent or uploader)";
      return false;
    }
    upload.mode = *mode;
  }
  if (node["part_size"]) {
    const std::string size_str = node["part_size"].as<std::string>();
    auto size = parse_byte_size(size_str);
    if (!size) {
      last_error_ = "Invalid part_size '" + size_str + "'";
      return false;
    }
    upload.part_size = *size;
  }
  if (node["max_concurrency"]) {
    upload.max_concurrency = node["max_concurrency"].as<int>();
  }
  if (node["key"]) {
    upload.key = node["key"].as<std::string>();
  }
  if (node["file"]) {
    upload.file = node["file"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["level"]) {
    logging.level = node["level"].as<std::string>();
    if (!::mpupload::logging::parse_severity_level(logging.level)) {
      last_error_ = "Invalid logging level '" + logging.level + "'";
      return false;
    }
  }
  if (node["console_enabled"]) {
    logging.console_enabled = node["console_enabled"].as<bool>();
  }
  if (node["console_colors"]) {
    logging.console_colors = node["console_colors"].as<bool>();
  }
  if (node["file_enabled"]) {
    logging.file_enabled = node["file_enabled"].as<bool>();
  }
  if (node["directory"]) {
    logging.directory = node["directory"].as<std::string>();
  }
  if (node["format"]) {
    logging.format = node["format"].as<std::string>();
  }
  return true;
}

bool ConfigParser::validate(const ClientConfig& config, std::string& error_msg) {
  if (config.s3.endpoint_url.empty()) {
    error_msg = "endpoint is required";
    return false;
  }
  if (config.s3.bucket.empty()) {
    error_msg = "bucket is required";
    return false;
  }
  if (config.upload.key.empty()) {
    error_msg = "key is required";
    return false;
  }
  if (config.upload.file.empty()) {
    error_msg = "file is required";
    return false;
  }
  if (config.upload.mode != UploadMode::Put) {
    const int concurrency =
      config.upload.mode == UploadMode::Multipart ? 1 : config.upload.max_concurrency;
    if (!uploader::MultipartUploader::validateSettings(
          config.upload.part_size, concurrency, error_msg
        )) {
      return false;
    }
  }
  return true;
}

}  // namespace cli
}  // namespace mpupload
