// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "credential_prompt.hpp"
#include "multipart_uploader.hpp"
#include "s3_object_store.hpp"

#include <mpupload_log_init.hpp>

#define MPUPLOAD_LOG_COMPONENT "mpupload"
#include <mpupload_log_macros.hpp>

namespace mpupload {
namespace cli {

namespace {

// Options, then the environment, then an interactive login.
bool resolve_credentials(uploader::S3Config& s3) {
  if (fill_keys_from_env(s3.access_key, s3.secret_key)) {
    return true;
  }

  LoginCredentials login;
  if (!prompt_credentials(std::cin, std::cout, login)) {
    return false;
  }
  const std::string encoded = uploader::encodeCredentials(login.username, login.password);
  s3.access_key = encoded;
  s3.secret_key = encoded;
  return true;
}

void print_progress(uint64_t bytes_uploaded, uint64_t total_bytes) {
  const double percent =
    total_bytes == 0 ? 100.0 : 100.0 * static_cast<double>(bytes_uploaded) / total_bytes;
  std::cout << "\rUploaded " << bytes_uploaded << " / " << total_bytes << " bytes ("
            << std::fixed << std::setprecision(1) << percent << "%)" << std::flush;
}

int run_put(uploader::S3ObjectStore& store, const ClientConfig& config) {
  const uploader::UploadTarget target{config.s3.bucket, config.upload.key};
  const uploader::RemoteResult result = store.putObject(config.upload.file, target);
  if (!result.success) {
    std::cerr << "Error: upload failed: " << result.error_message;
    if (!result.error_code.empty()) {
      std::cerr << " (" << result.error_code << ")";
    }
    std::cerr << std::endl;
    return 1;
  }
  std::cout << "File uploaded successfully\n"
            << "ETag: " << result.value << std::endl;
  return 0;
}

int run_uploader(uploader::S3ObjectStore& store, const ClientConfig& config) {
  const uploader::UploadTarget target{config.s3.bucket, config.upload.key};
  const uploader::RemoteResult result = store.uploadFile(
    config.upload.file, target, config.upload.part_size, config.upload.max_concurrency,
    print_progress
  );
  std::cout << std::endl;
  if (!result.success) {
    std::cerr << "Error: upload failed: " << result.error_message;
    if (!result.error_code.empty()) {
      std::cerr << " (" << result.error_code << ")";
    }
    std::cerr << std::endl;
    return 1;
  }
  std::cout << "File uploaded successfully\n"
            << "ETag: " << result.value << std::endl;
  return 0;
}

int run_multipart(uploader::S3ObjectStore& store, const ClientConfig& config) {
  const int concurrency =
    config.upload.mode == UploadMode::Multipart ? 1 : config.upload.max_concurrency;

  uploader::MultipartUploader engine(store);
  const uploader::MultipartUploadResult result = engine.upload(
    config.upload.file, {config.s3.bucket, config.upload.key}, config.upload.part_size,
    concurrency, print_progress
  );
  if (result.stats.bytes_uploaded > 0) {
    std::cout << std::endl;
  }

  if (!result.success) {
    std::cerr << "Error: upload failed during " << uploader::toString(result.failed_phase)
              << ": " << result.error_message << std::endl;
    if (!result.upload_id.empty()) {
      std::cerr << "Incomplete multipart upload left on the server, upload id: "
                << result.upload_id << std::endl;
    }
    return 1;
  }

  std::cout << "File uploaded successfully\n"
            << "ETag: " << result.etag << "\n"
            << "Parts: " << result.manifest.size() << ", " << result.stats.total_bytes
            << " bytes in " << result.stats.elapsed.count() << " ms" << std::endl;
  return 0;
}

}  // namespace

int run(int argc, char* argv[]) {
  CliOptions options;
  std::string error_msg;
  if (!parse_cli_options(argc, argv, options, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (options.show_help) {
    print_usage(std::cout, argv[0]);
    return 0;
  }

  ClientConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  apply_cli_overrides(options, config);

  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(std::cerr, argv[0]);
    return 1;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);

  if (!resolve_credentials(config.s3)) {
    std::cerr << "Error: no credentials available" << std::endl;
    logging::shutdown_logging();
    return 1;
  }

  MPUPLOAD_LOG_INFO(
    "Uploading " << config.upload.file << logging::kv("endpoint", config.s3.endpoint_url)
                 << logging::kv("bucket", config.s3.bucket)
                 << logging::kv("key", config.upload.key)
                 << logging::kv("mode", to_string(config.upload.mode))
  );

  int exit_code = 0;
  {
    uploader::S3ObjectStore store(config.s3);
    switch (config.upload.mode) {
      case UploadMode::Put:
        exit_code = run_put(store, config);
        break;
      case UploadMode::Uploader:
        exit_code = run_uploader(store, config);
        break;
      case UploadMode::Multipart:
      case UploadMode::Concurrent:
        exit_code = run_multipart(store, config);
        break;
    }
  }

  logging::shutdown_logging();
  return exit_code;
}

}  // namespace cli
}  // namespace mpupload

int main(int argc, char* argv[]) {
  try {
    return mpupload::cli::run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    mpupload::logging::shutdown_logging();
    return 1;
  }
}
