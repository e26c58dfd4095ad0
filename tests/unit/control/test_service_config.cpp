/**
 * @file test_service_config.cpp
 * @brief Unit tests for daemon service configuration
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "ServiceConfig.hpp"

using namespace PROBEFLOW;
using namespace PROBEFLOW::Control;
using namespace std::chrono_literals;

class ServiceConfigTest : public ::testing::Test {
 protected:
  void TearDown() override { std::remove(temp_file_.c_str()); }

  void WriteFile(const std::string& content) {
    std::ofstream file(temp_file_);
    file << content;
  }

  std::string temp_file_ = "/tmp/probeflow_service_config_test.json";
};

TEST_F(ServiceConfigTest, EmptyObjectGivesDefaults) {
  auto result = ServiceConfigFromJSON(nlohmann::json::object());
  ASSERT_TRUE(isOk(result));
  const auto& config = getValue(result);
  EXPECT_EQ(config.control_address, "tcp://*:5570");
  EXPECT_EQ(config.event_address, "tcp://*:5571");
  EXPECT_TRUE(config.log_directory.empty());
  EXPECT_EQ(config.log_level, LogLevel::INFO);
  EXPECT_EQ(config.retention_window_s, 600u);
  EXPECT_EQ(config.event_channel_capacity, 256u);
  EXPECT_EQ(config.subscriber_queue_capacity, 1024u);
}

TEST_F(ServiceConfigTest, ParsesAllFields) {
  auto result = ServiceConfigFromJSON({{"control_address", "tcp://127.0.0.1:6000"},
                                       {"event_address", "ipc:///tmp/probeflow_events"},
                                       {"log_directory", "/var/log/probeflow"},
                                       {"log_level", "Debug"},
                                       {"retention_window_s", 30},
                                       {"event_channel_capacity", 8},
                                       {"subscriber_queue_capacity", 16}});
  ASSERT_TRUE(isOk(result)) << getError(result).message;
  const auto& config = getValue(result);
  EXPECT_EQ(config.control_address, "tcp://127.0.0.1:6000");
  EXPECT_EQ(config.event_address, "ipc:///tmp/probeflow_events");
  EXPECT_EQ(config.log_directory, "/var/log/probeflow");
  EXPECT_EQ(config.log_level, LogLevel::DEBUG);

  auto options = ToManagerOptions(config);
  EXPECT_EQ(options.retention_window, 30s);
  EXPECT_EQ(options.event_channel_capacity, 8u);
  EXPECT_EQ(options.subscriber_queue_capacity, 16u);
}

TEST_F(ServiceConfigTest, RejectsInvalidInput) {
  EXPECT_EQ(getError(ServiceConfigFromJSON(nlohmann::json::array())).code,
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(getError(ServiceConfigFromJSON({{"log_level", "verbose"}})).code,
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(getError(ServiceConfigFromJSON({{"retention_window_s", "long"}})).code,
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(getError(ServiceConfigFromJSON({{"control_address", ""}})).code,
            ErrorCode::ConfigurationValidationFailed);
  EXPECT_EQ(getError(ServiceConfigFromJSON({{"subscriber_queue_capacity", 0}})).code,
            ErrorCode::ConfigurationValidationFailed);
}

TEST_F(ServiceConfigTest, NegativeCountsAreInvalidConfiguration) {
  auto negative = ServiceConfigFromJSON({{"retention_window_s", -1}});
  ASSERT_FALSE(isOk(negative));
  EXPECT_EQ(getError(negative).code, ErrorCode::InvalidConfiguration);
  EXPECT_EQ(getError(negative).message, "retention_window_s is out of range: -1");

  EXPECT_EQ(getError(ServiceConfigFromJSON({{"event_channel_capacity", 5000000000LL}})).code,
            ErrorCode::InvalidConfiguration);
}

TEST_F(ServiceConfigTest, LoadsFromFile) {
  WriteFile(R"({"event_address": "tcp://*:7001", "log_level": "warn"})");
  auto result = ServiceConfigFromFile(temp_file_);
  ASSERT_TRUE(isOk(result));
  EXPECT_EQ(getValue(result).event_address, "tcp://*:7001");
  EXPECT_EQ(getValue(result).log_level, LogLevel::WARNING);
}

TEST_F(ServiceConfigTest, FileErrors) {
  EXPECT_EQ(getError(ServiceConfigFromFile("/nonexistent/probeflow.json")).code,
            ErrorCode::ConfigurationNotFound);

  WriteFile("{ not json");
  EXPECT_EQ(getError(ServiceConfigFromFile(temp_file_)).code,
            ErrorCode::InvalidConfiguration);
}
