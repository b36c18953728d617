// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_CONFIG_PARSER_HPP
#define MPUPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

#include "client_config.hpp"

namespace mpupload {
namespace logging {
struct LoggingConfig;
}
}  // namespace mpupload

namespace mpupload {
namespace cli {

/**
 * Parse a byte count: plain digits, or digits followed by one of
 * B, K/KB/KiB, M/MB/MiB, G/GB/GiB (binary multiples, case-insensitive).
 *
 * @return The size, or std::nullopt if malformed or out of range
 */
std::optional<uint64_t> parse_byte_size(const std::string& text);

/**
 * Convert LoggingSettings to the logging library configuration.
 */
void convert_logging_config(
  const LoggingSettings& settings, ::mpupload::logging::LoggingConfig& log_config
);

/**
 * YAML configuration loader.
 *
 * Example:
 *   s3:
 *     endpoint: https://10.0.0.5:9440/api/prism/v4.0/objects/
 *     bucket: backups
 *     region: us-east-1
 *     verify_ssl: false
 *   upload:
 *     mode: concurrent
 *     part_size: 8MiB
 *     max_concurrency: 5
 *   logging:
 *     level: info
 *
 * Keys missing from the document keep the values already in the config.
 */
class ConfigParser {
public:
  ConfigParser() = default;

  bool load_from_file(const std::string& path, ClientConfig& config);

  bool load_from_string(const std::string& yaml_content, ClientConfig& config);

  /**
   * Check that everything needed for an upload is present and in range.
   */
  static bool validate(const ClientConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, uploader::S3Config& s3);
  bool parse_upload(const YAML::Node& node, UploadSettings& upload);
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);

  std::string last_error_;
};

}  // namespace cli
}  // namespace mpupload

#endif  // MPUPLOAD_CONFIG_PARSER_HPP
