// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <cstring>
#include <limits>

#include "config_parser.hpp"

namespace mpupload {
namespace cli {

namespace {

bool parse_int(const std::string& text, int& out) {
  if (text.empty()) {
    return false;
  }
  size_t pos = 0;
  long value = 0;
  try {
    value = std::stol(text, &pos);
  } catch (const std::exception&) {
    return false;
  }
  if (pos != text.size() || value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

}  // namespace

bool parse_cli_options(
  int argc, const char* const argv[], CliOptions& options, std::string& error_msg
) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      options.show_help = true;
      continue;
    }
    if (std::strcmp(arg, "--verify-ssl") == 0) {
      options.verify_ssl = true;
      continue;
    }
    if (std::strcmp(arg, "--no-verify-ssl") == 0) {
      options.verify_ssl = false;
      continue;
    }

    if (std::strncmp(arg, "--", 2) != 0) {
      error_msg = std::string("Unexpected argument: ") + arg;
      return false;
    }

    // Every remaining option takes a value.
    if (i + 1 >= argc) {
      error_msg = std::string(arg) + " requires an argument";
      return false;
    }
    const std::string value = argv[i + 1];

    if (std::strcmp(arg, "--config") == 0) {
      options.config_file = value;
    } else if (std::strcmp(arg, "--endpoint") == 0) {
      options.endpoint = value;
    } else if (std::strcmp(arg, "--bucket") == 0) {
      options.bucket = value;
    } else if (std::strcmp(arg, "--key") == 0) {
      options.key = value;
    } else if (std::strcmp(arg, "--file") == 0) {
      options.file = value;
    } else if (std::strcmp(arg, "--region") == 0) {
      options.region = value;
    } else if (std::strcmp(arg, "--access-key") == 0) {
      options.access_key = value;
    } else if (std::strcmp(arg, "--secret-key") == 0) {
      options.secret_key = value;
    } else if (std::strcmp(arg, "--log-level") == 0) {
      options.log_level = value;
    } else if (std::strcmp(arg, "--part-size") == 0) {
      auto size = parse_byte_size(value);
      if (!size) {
        error_msg = "Invalid --part-size value: " + value;
        return false;
      }
      options.part_size = *size;
    } else if (std::strcmp(arg, "--max-concurrency") == 0) {
      int concurrency = 0;
      if (!parse_int(value, concurrency)) {
        error_msg = "Invalid --max-concurrency value: " + value;
        return false;
      }
      options.max_concurrency = concurrency;
    } else if (std::strcmp(arg, "--mode") == 0) {
      auto mode = parse_upload_mode(value);
      if (!mode) {
        error_msg = "Invalid --mode value: " + value + " (expected put, multipart, concurrent or uploader)";
        return false;
      }
      options.mode = *mode;
    } else {
      error_msg = std::string("Unknown option: ") + arg;
      return false;
    }
    ++i;
  }
  return true;
}

void apply_cli_overrides(const CliOptions& options, ClientConfig& config) {
  if (options.endpoint) config.s3.endpoint_url = *options.endpoint;
  if (options.bucket) config.s3.bucket = *options.bucket;
  if (options.region) config.s3.region = *options.region;
  if (options.access_key) config.s3.access_key = *options.access_key;
  if (options.secret_key) config.s3.secret_key = *options.secret_key;
  if (options.verify_ssl) config.s3.verify_ssl = *options.verify_ssl;
  if (options.key) config.upload.key = *options.key;
  if (options.file) config.upload.file = *options.file;
  if (options.part_size) config.upload.part_size = *options.part_size;
  if (options.max_concurrency) config.upload.max_concurrency = *options.max_concurrency;
  if (options.mode) config.upload.mode = *options.mode;
  if (options.log_level) config.logging.level = *options.log_level;
}

void print_usage(std::ostream& os, const char* program_name) {
  os << "Usage: " << program_name << " --endpoint URL --bucket NAME --key KEY --file PATH [OPTIONS]\n"
     << "\n"
     << "Upload a file to an S3-compatible object store (Objectslite).\n"
     << "\n"
     << "Options:\n"
     << "  --endpoint URL          Object store endpoint\n"
     << "  --bucket NAME           Bucket name\n"
     << "  --key KEY               Object key\n"
     << "  --file PATH             File to upload\n"
     << "  --mode MODE             put, multipart, concurrent or uploader (default: concurrent)\n"
     << "  --part-size SIZE        Part size, e.g. 8388608 or 8MiB (default: 8MiB)\n"
     << "  --max-concurrency N     Parts in flight, 1-8 (default: 5)\n"
     << "  --region REGION         Signing region (default: us-east-1)\n"
     << "  --access-key KEY        Access key (default: AWS_ACCESS_KEY_ID or prompt)\n"
     << "  --secret-key KEY        Secret key (default: AWS_SECRET_ACCESS_KEY or prompt)\n"
     << "  --verify-ssl            Verify the server certificate\n"
     << "  --no-verify-ssl         Skip certificate verification (default)\n"
     << "  --config PATH           YAML configuration file, CLI options override it\n"
     << "  --log-level LEVEL       debug, info, warn, error or fatal (default: info)\n"
     << "  --help                  Show this help message\n"
     << "\n"
     << "Without keys, the tool prompts for a username and password and uses\n"
     << "base64(username:password) as both access key and secret key.\n"
     << "\n"
     << "uploader mode hands the file to the SDK transfer manager, which keeps\n"
     << "parts of at least 5MiB and up to --max-concurrency of them in flight.\n"
     << "\n"
     << "A failed multipart upload is not aborted. Its upload id is printed so\n"
     << "the incomplete upload can be cleaned up on the object store.\n"
     << "\n"
     << "Example:\n"
     << "  " << program_name
     << " --endpoint https://<pc-ip>:9440/api/prism/v4.0/objects/ \\\n"
     << "    --bucket mybucket --key mykey --file myfile.bin --part-size 5242880 --max-concurrency 8\n";
}

}  // namespace cli
}  // namespace mpupload
