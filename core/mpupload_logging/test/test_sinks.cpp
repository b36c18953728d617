// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_sinks.cpp
 * @brief Unit tests for console and file sink creation and formatting helpers
 */

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include "mpupload_console_sink.hpp"
#include "mpupload_file_sink.hpp"
#include "mpupload_log_init.hpp"
#include "mpupload_log_macros.hpp"

namespace fs = std::filesystem;

using namespace mpupload::logging;

// ============================================================================
// Console Sink Tests
// ============================================================================

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    shutdown_logging();
  }

  void TearDown() override {
    shutdown_logging();
  }
};

TEST_F(ConsoleSinkTest, CreateWithEveryLevel) {
  for (auto level : {severity_level::debug, severity_level::info, severity_level::warn,
                     severity_level::error, severity_level::fatal}) {
    auto sink = create_console_sink(level, true);
    ASSERT_NE(sink, nullptr);
  }
}

TEST_F(ConsoleSinkTest, LogWithUploadContext) {
  auto sink = create_console_sink(severity_level::debug, false);
  ASSERT_NE(sink, nullptr);

  boost::log::core::get()->add_sink(sink);
  boost::log::add_common_attributes();

  {
    UploadLogContext upload("mybucket", "path/to/object", "uid-1");
    MPUPLOAD_LOG_INFO("Message with upload context");
    PartLogContext part(2);
    MPUPLOAD_LOG_WARN("Warning with part context");
  }
  MPUPLOAD_LOG_ERROR("Message without context");

  sink->flush();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  boost::log::core::get()->remove_sink(sink);
}

TEST_F(ConsoleSinkTest, SeverityColors) {
  EXPECT_STREQ(severity_color(severity_level::debug), "\033[36m");
  EXPECT_STREQ(severity_color(severity_level::info), "\033[32m");
  EXPECT_STREQ(severity_color(severity_level::warn), "\033[33m");
  EXPECT_STREQ(severity_color(severity_level::error), "\033[31m");
  EXPECT_STRNE(severity_color(severity_level::fatal), "");
}

// ============================================================================
// File Sink Tests
// ============================================================================

TEST(FileSinkConfigTest, DefaultValues) {
  FileSinkConfig config;

  EXPECT_EQ(config.directory, "/tmp/mpupload");
  EXPECT_EQ(config.file_pattern, "mpupload_%Y%m%d_%H%M%S.log");
  EXPECT_EQ(config.rotation_size_mb, 50u);
  EXPECT_EQ(config.max_files, 5);
  EXPECT_FALSE(config.format_json);
}

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = "/tmp/mpupload_file_sink_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  std::string test_dir_;
};

TEST_F(FileSinkTest, CreatesDirectory) {
  FileSinkConfig config;
  config.directory = test_dir_ + "/nested/logs";

  auto sink = create_file_sink(config);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::is_directory(config.directory));
}

TEST_F(FileSinkTest, JsonFormatWritesRecords) {
  FileSinkConfig config;
  config.directory = test_dir_;
  config.format_json = true;

  auto sink = create_file_sink(config, severity_level::debug);
  ASSERT_NE(sink, nullptr);
  boost::log::core::get()->add_sink(sink);
  boost::log::add_common_attributes();

  MPUPLOAD_LOG_INFO("json \"quoted\" message");

  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();

  bool non_empty = false;
  for (const auto& entry : fs::directory_iterator(test_dir_)) {
    non_empty = non_empty || entry.file_size() > 0;
  }
  EXPECT_TRUE(non_empty);
}

// ============================================================================
// JSON Escaping Tests
// ============================================================================

TEST(EscapeJsonTest, PlainTextUnchanged) {
  EXPECT_EQ(escape_json("upload complete"), "upload complete");
}

TEST(EscapeJsonTest, EscapesSpecialCharacters) {
  EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
  EXPECT_EQ(escape_json("a\\b"), "a\\\\b");
  EXPECT_EQ(escape_json("line1\nline2"), "line1\\nline2");
  EXPECT_EQ(escape_json("tab\there"), "tab\\there");
  EXPECT_EQ(escape_json("cr\r"), "cr\\r");
}

TEST(EscapeJsonTest, EscapesControlCharacters) {
  EXPECT_EQ(escape_json(std::string(1, '\x01')), "\\u0001");
  EXPECT_EQ(escape_json(std::string(1, '\x1f')), "\\u001f");
}
