// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <spinalg/data/spin_operator.hpp>
#include <spinalg/utils/logger.hpp>
#include <sstream>

#include "ut_common.hpp"

using namespace spinalg::data;
using spinalg::utils::Logger;

// Fixture that captures the spinalg logger output
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::get_level();
    sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
    sink_->set_pattern("%l %v");
    Logger::get().sinks().push_back(sink_);
  }

  void TearDown() override {
    auto& sinks = Logger::get().sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    Logger::set_level(previous_level_);
  }

  std::ostringstream output_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
  spdlog::level::level_enum previous_level_;
};

TEST_F(LoggerTest, RegisteredUnderLibraryName) {
  EXPECT_EQ(Logger::name(), "spinalg");
  EXPECT_EQ(Logger::get().name(), "spinalg");
  EXPECT_EQ(spdlog::get("spinalg").get(), &Logger::get());
  EXPECT_EQ(&SPINALG_LOGGER(), &Logger::get());
}

TEST_F(LoggerTest, ResolvedOnlyOnce) {
  auto registered = spdlog::get(Logger::name());
  ASSERT_NE(registered, nullptr);

  spdlog::drop(Logger::name());
  EXPECT_EQ(&Logger::get(), registered.get());
  EXPECT_EQ(spdlog::get(Logger::name()), nullptr);

  spdlog::register_logger(registered);
  EXPECT_EQ(spdlog::get(Logger::name()), registered);
}

TEST_F(LoggerTest, SetLevel) {
  Logger::set_level(spdlog::level::debug);
  EXPECT_EQ(Logger::get_level(), spdlog::level::debug);
  Logger::set_level(spdlog::level::off);
  EXPECT_EQ(Logger::get_level(), spdlog::level::off);
}

TEST_F(LoggerTest, LargeMatrixWarning) {
  Logger::set_level(spdlog::level::warn);
  auto settings = std::make_shared<SpinOperatorSettings>();
  settings->set("matrix_warning_dimension", 4);

  SpinOperator small({{"X_0 X_1", 1.0}}, 2, 0.5, settings);
  small.to_matrix();
  EXPECT_TRUE(output_.str().empty());

  SpinOperator large({{"X_0 X_2", 1.0}}, 3, 0.5, settings);
  large.to_matrix();
  EXPECT_NE(output_.str().find("warning"), std::string::npos);
  EXPECT_NE(output_.str().find("8x8"), std::string::npos);
}

TEST_F(LoggerTest, TraceAndDebugOutput) {
  Logger::set_level(spdlog::level::trace);
  SpinOperator({{"X_0 X_0", 1.0}, {"X_0^2", 1.0}}).simplify();
  const std::string log = output_.str();
  EXPECT_NE(log.find("Entering simplify"), std::string::npos);
  EXPECT_NE(log.find("2 terms in, 1 terms out"), std::string::npos);
}

TEST_F(LoggerTest, QuietAtDefaultLevel) {
  Logger::set_level(Logger::kDefaultLevel);
  SpinOperator op({{"X_0", 1.0}});
  op.simplify().to_matrix();
  EXPECT_TRUE(output_.str().empty());
}
