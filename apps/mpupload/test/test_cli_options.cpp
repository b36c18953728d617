// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for command-line parsing and config overrides
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "config_parser.hpp"
#include "credential_prompt.hpp"

using namespace mpupload::cli;

namespace {

bool parse(const std::vector<const char*>& args, CliOptions& options, std::string& error) {
  std::vector<const char*> argv = {"mpupload"};
  argv.insert(argv.end(), args.begin(), args.end());
  return parse_cli_options(static_cast<int>(argv.size()), argv.data(), options, error);
}

}  // namespace

TEST(CliOptionsTest, NoArguments) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({}, options, error));
  EXPECT_FALSE(options.show_help);
  EXPECT_TRUE(options.config_file.empty());
  EXPECT_FALSE(options.endpoint.has_value());
}

TEST(CliOptionsTest, AllOptions) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse(
    {"--endpoint", "https://10.0.0.5:9440/api/prism/v4.0/objects/", "--bucket", "mybucket",
     "--key", "mykey", "--file", "myfile.bin", "--part-size", "5242880", "--max-concurrency", "8",
     "--mode", "concurrent", "--region", "us-west-2", "--access-key", "AK", "--secret-key", "SK",
     "--verify-ssl", "--config", "conf.yaml", "--log-level", "debug"},
    options, error
  )) << error;

  EXPECT_EQ(options.endpoint, "https://10.0.0.5:9440/api/prism/v4.0/objects/");
  EXPECT_EQ(options.bucket, "mybucket");
  EXPECT_EQ(options.key, "mykey");
  EXPECT_EQ(options.file, "myfile.bin");
  EXPECT_EQ(options.part_size, 5242880u);
  EXPECT_EQ(options.max_concurrency, 8);
  EXPECT_EQ(options.mode, UploadMode::Concurrent);
  EXPECT_EQ(options.region, "us-west-2");
  EXPECT_EQ(options.access_key, "AK");
  EXPECT_EQ(options.secret_key, "SK");
  EXPECT_EQ(options.verify_ssl, true);
  EXPECT_EQ(options.config_file, "conf.yaml");
  EXPECT_EQ(options.log_level, "debug");
}

TEST(CliOptionsTest, HelpFlag) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--help"}, options, error));
  EXPECT_TRUE(options.show_help);

  CliOptions short_options;
  ASSERT_TRUE(parse({"-h"}, short_options, error));
  EXPECT_TRUE(short_options.show_help);
}

TEST(CliOptionsTest, PartSizeWithSuffix) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--part-size", "16MiB"}, options, error)) << error;
  EXPECT_EQ(options.part_size, 16u * 1024 * 1024);
}

TEST(CliOptionsTest, MissingValue) {
  CliOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--bucket"}, options, error));
  EXPECT_NE(error.find("--bucket"), std::string::npos);
}

TEST(CliOptionsTest, UnknownOption) {
  CliOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--threads", "4"}, options, error));
  EXPECT_NE(error.find("--threads"), std::string::npos);
}

TEST(CliOptionsTest, InvalidValues) {
  CliOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--max-concurrency", "four"}, options, error));
  EXPECT_FALSE(parse({"--max-concurrency", "4x"}, options, error));
  EXPECT_FALSE(parse({"--part-size", "big"}, options, error));
  EXPECT_FALSE(parse({"--mode", "fast"}, options, error));
}

TEST(CliOptionsTest, UploaderMode) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--mode", "uploader", "--max-concurrency", "6"}, options, error)) << error;
  EXPECT_EQ(options.mode, UploadMode::Uploader);

  ClientConfig config;
  apply_cli_overrides(options, config);
  EXPECT_EQ(config.upload.mode, UploadMode::Uploader);
  EXPECT_EQ(config.upload.max_concurrency, 6);
}

TEST(CliOptionsTest, InvalidModeListsEveryStrategy) {
  CliOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--mode", "fast"}, options, error));
  EXPECT_NE(error.find("put, multipart, concurrent or uploader"), std::string::npos) << error;
}

TEST(CliOptionsTest, OutOfRangeConcurrencyIsLeftToValidation) {
  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--max-concurrency", "9"}, options, error));

  ClientConfig config;
  config.s3.endpoint_url = "https://objects.local/";
  config.s3.bucket = "b";
  config.upload.key = "k";
  config.upload.file = "f";
  apply_cli_overrides(options, config);

  EXPECT_EQ(config.upload.max_concurrency, 9);
  EXPECT_FALSE(ConfigParser::validate(config, error));
}

TEST(CliOptionsTest, OverridesReplaceOnlyGivenValues) {
  ClientConfig config;
  config.s3.bucket = "from-file";
  config.s3.region = "eu-central-1";
  config.upload.part_size = 1024;
  config.upload.max_concurrency = 2;

  CliOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--bucket", "from-cli", "--mode", "put", "--no-verify-ssl"}, options, error));
  apply_cli_overrides(options, config);

  EXPECT_EQ(config.s3.bucket, "from-cli");
  EXPECT_EQ(config.s3.region, "eu-central-1");
  EXPECT_EQ(config.upload.part_size, 1024u);
  EXPECT_EQ(config.upload.max_concurrency, 2);
  EXPECT_EQ(config.upload.mode, UploadMode::Put);
  EXPECT_FALSE(config.s3.verify_ssl);
}

TEST(CliOptionsTest, UsageMentionsEveryOption) {
  std::ostringstream out;
  print_usage(out, "mpupload");
  const std::string usage = out.str();

  for (const char* option :
       {"--endpoint", "--bucket", "--key", "--file", "--part-size", "--max-concurrency", "--mode",
        "--region", "--access-key", "--secret-key", "--verify-ssl", "--config", "--log-level",
        "--help"}) {
    EXPECT_NE(usage.find(option), std::string::npos) << option;
  }
}

// =============================================================================
// Credential prompt
// =============================================================================

TEST(CredentialPromptTest, ReadsUsernameAndPassword) {
  std::istringstream in("admin\nsecret/pw\n");
  std::ostringstream out;
  LoginCredentials credentials;

  ASSERT_TRUE(prompt_credentials(in, out, credentials));
  EXPECT_EQ(credentials.username, "admin");
  EXPECT_EQ(credentials.password, "secret/pw");
  EXPECT_NE(out.str().find("Username"), std::string::npos);
  EXPECT_NE(out.str().find("Password"), std::string::npos);
}

TEST(CredentialPromptTest, EmptyUsernameRejected) {
  std::istringstream in("\npassword\n");
  std::ostringstream out;
  LoginCredentials credentials;

  EXPECT_FALSE(prompt_credentials(in, out, credentials));
}

TEST(CredentialPromptTest, MissingPasswordRejected) {
  std::istringstream in("admin");
  std::ostringstream out;
  LoginCredentials credentials;

  EXPECT_FALSE(prompt_credentials(in, out, credentials));
}

// =============================================================================
// Credentials from the environment
// =============================================================================

class EnvCredentialsTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
  }

  void TearDown() override {
    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
  }
};

TEST_F(EnvCredentialsTest, FillsEmptyKeys) {
  setenv("AWS_ACCESS_KEY_ID", "env-access", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "env-secret", 1);

  std::string access_key;
  std::string secret_key;
  EXPECT_TRUE(fill_keys_from_env(access_key, secret_key));
  EXPECT_EQ(access_key, "env-access");
  EXPECT_EQ(secret_key, "env-secret");
}

TEST_F(EnvCredentialsTest, GivenKeysWin) {
  setenv("AWS_ACCESS_KEY_ID", "env-access", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "env-secret", 1);

  std::string access_key = "cli-access";
  std::string secret_key;
  EXPECT_TRUE(fill_keys_from_env(access_key, secret_key));
  EXPECT_EQ(access_key, "cli-access");
  EXPECT_EQ(secret_key, "env-secret");
}

TEST_F(EnvCredentialsTest, MissingSecretMeansPrompt) {
  setenv("AWS_ACCESS_KEY_ID", "env-access", 1);

  std::string access_key;
  std::string secret_key;
  EXPECT_FALSE(fill_keys_from_env(access_key, secret_key));
  EXPECT_EQ(access_key, "env-access");
  EXPECT_TRUE(secret_key.empty());
}
