// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_sinks.cpp
 * @brief Unit tests for console and file sink creation and formatting
 */

#include <gtest/gtest.h>

#include <boost/log/core.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "parcel_log_init.hpp"
#include "parcel_log_sinks.hpp"

#define PARCEL_LOG_COMPONENT "sink_test"
#include "parcel_log_macros.hpp"

namespace fs = std::filesystem;

using namespace parcel::logging;

// ============================================================================
// File Sink Config Tests
// ============================================================================

TEST(FileSinkConfigTest, DefaultValues) {
  FileSinkConfig config;

  EXPECT_EQ(config.directory, "/var/log/parcel");
  EXPECT_EQ(config.file_pattern, "parcel_%Y%m%d_%H%M%S.log");
  EXPECT_EQ(config.rotation_size_mb, 100u);
  EXPECT_TRUE(config.rotate_at_midnight);
  EXPECT_EQ(config.max_files, 10);
  EXPECT_TRUE(config.format_json);
}

// ============================================================================
// Sink Tests
// ============================================================================

class SinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    test_dir_ = fs::temp_directory_path() /
                ("parcel_sink_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  template <typename Sink>
  void attach(const boost::shared_ptr<Sink>& sink) {
    boost::log::core::get()->add_sink(sink);
  }

  // Drain the async queue, then detach
  template <typename Sink>
  void detach(const boost::shared_ptr<Sink>& sink) {
    sink->flush();
    boost::log::core::get()->remove_sink(sink);
    sink->stop();
    sink->flush();
  }

  std::string read_all_files() const {
    std::string content;
    for (const auto& entry : fs::directory_iterator(test_dir_)) {
      std::ifstream in(entry.path());
      std::stringstream ss;
      ss << in.rdbuf();
      content += ss.str();
    }
    return content;
  }

  fs::path test_dir_;
};

TEST_F(SinkTest, FileSinkCreatesDirectoryAndFilters) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested").string();
  config.file_pattern = "sink_%N.log";
  config.format_json = false;
  config.rotate_at_midnight = false;

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_TRUE(sink);
  EXPECT_TRUE(fs::exists(config.directory));

  attach(sink);
  {
    PARCEL_LOG_SCOPED_TRANSFER("bucket/object");
    PARCEL_LOG_DEBUG("hidden detail");
    PARCEL_LOG_WARN("disk slow");
  }
  detach(sink);

  test_dir_ /= "nested";
  std::string content = read_all_files();
  test_dir_ = test_dir_.parent_path();

  EXPECT_NE(content.find("[WARN] [sink_test] disk slow | transfer=bucket/object"), std::string::npos)
    << content;
  EXPECT_EQ(content.find("hidden detail"), std::string::npos);
}

TEST_F(SinkTest, ConsoleSinkWritesToClog) {
  std::stringstream captured;
  std::streambuf* original = std::clog.rdbuf(captured.rdbuf());

  auto sink = create_console_sink(severity_level::info, false);
  attach(sink);
  PARCEL_LOG_INFO("ready" << kv("workers", 4));
  PARCEL_LOG_DEBUG("not shown");
  detach(sink);

  std::clog.rdbuf(original);

  std::string output = captured.str();
  EXPECT_NE(output.find("[INFO] [sink_test] ready workers=4"), std::string::npos) << output;
  EXPECT_EQ(output.find("not shown"), std::string::npos);
  EXPECT_EQ(output.find("\033["), std::string::npos);
}

TEST_F(SinkTest, ConsoleSinkColorsSeverity) {
  std::stringstream captured;
  std::streambuf* original = std::clog.rdbuf(captured.rdbuf());

  auto sink = create_console_sink(severity_level::debug, true);
  attach(sink);
  PARCEL_LOG_ERROR("part failed");
  detach(sink);

  std::clog.rdbuf(original);

  EXPECT_NE(captured.str().find("\033[31m[ERROR]\033[0m"), std::string::npos);
}
