// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_CLI_OPTIONS_HPP
#define MPUPLOAD_CLI_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "client_config.hpp"

namespace mpupload {
namespace cli {

/**
 * Command-line arguments. Unset options leave the configuration untouched.
 */
struct CliOptions {
  bool show_help = false;
  std::string config_file;

  std::optional<std::string> endpoint;
  std::optional<std::string> bucket;
  std::optional<std::string> key;
  std::optional<std::string> file;
  std::optional<std::string> region;
  std::optional<std::string> access_key;
  std::optional<std::string> secret_key;
  std::optional<uint64_t> part_size;
  std::optional<int> max_concurrency;
  std::optional<UploadMode> mode;
  std::optional<bool> verify_ssl;
  std::optional<std::string> log_level;
};

/**
 * Parse argv.
 *
 * @param error_msg Set when an option is unknown, lacks its value or has a bad value
 * @return true on success
 */
bool parse_cli_options(int argc, const char* const argv[], CliOptions& options, std::string& error_msg);

/**
 * Overlay the options that were given on the command line onto config.
 */
void apply_cli_overrides(const CliOptions& options, ClientConfig& config);

void print_usage(std::ostream& os, const char* program_name);

}  // namespace cli
}  // namespace mpupload

#endif  // MPUPLOAD_CLI_OPTIONS_HPP
