// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "spinalg/data/settings.hpp"
#include "spinalg/data/spin_operator.hpp"
#include "ut_common.hpp"

using namespace spinalg::data;

// Derived class for testing purposes
class TestSettings : public Settings {
 public:
  TestSettings() {
    set_default("max_iterations", 100, "Iteration cap",
                BoundConstraint<int64_t>{1, 1000});
    set_default("tolerance", 1e-6, "Convergence threshold",
                BoundConstraint<double>{0.0, 1.0});
    set_default("method", "default");
    set_default("enable_logging", true);
  }
};

// Test fixture for Settings tests
class SettingsTest : public ::testing::Test {
 protected:
  TestSettings settings;
};

TEST_F(SettingsTest, BasicConstruction) {
  Settings empty_settings;
  EXPECT_TRUE(empty_settings.empty());
  EXPECT_EQ(empty_settings.size(), 0);
  EXPECT_TRUE(empty_settings.keys().empty());

  EXPECT_EQ(settings.size(), 4);
  EXPECT_EQ(settings.keys(),
            (std::vector<std::string>{"enable_logging", "max_iterations",
                                      "method", "tolerance"}));
}

TEST_F(SettingsTest, SetAndGetVariantTypes) {
  settings.set("enable_logging", SettingValue(false));
  settings.set("max_iterations", SettingValue(int64_t{42}));
  settings.set("method", SettingValue(std::string("lanczos")));

  EXPECT_FALSE(std::get<bool>(settings.get("enable_logging")));
  EXPECT_EQ(std::get<int64_t>(settings.get("max_iterations")), 42);
  EXPECT_EQ(std::get<std::string>(settings.get("method")), "lanczos");
}

TEST_F(SettingsTest, SetAndGetBasicTypes) {
  settings.set("max_iterations", 250);
  settings.set("tolerance", 1e-8);
  settings.set("method", "cg");

  EXPECT_EQ(settings.get<int>("max_iterations"), 250);
  EXPECT_EQ(settings.get<size_t>("max_iterations"), 250);
  EXPECT_EQ(settings.get<int64_t>("max_iterations"), 250);
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 1e-8);
  EXPECT_EQ(settings.get<std::string>("method"), "cg");
  EXPECT_TRUE(settings.get<bool>("enable_logging"));
}

TEST_F(SettingsTest, HasFunction) {
  EXPECT_TRUE(settings.has("tolerance"));
  EXPECT_FALSE(settings.has("nonexistent_key"));
}

TEST_F(SettingsTest, GetAsString) {
  EXPECT_EQ(settings.get_as_string("enable_logging"), "true");
  EXPECT_EQ(settings.get_as_string("max_iterations"), "100");
  EXPECT_EQ(settings.get_as_string("method"), "default");
  EXPECT_NE(settings.get_as_string("tolerance").find("e-06"),
            std::string::npos);
}

TEST_F(SettingsTest, LimitsApplyOnlyToDeclaredKeys) {
  EXPECT_NO_THROW(settings.set("method", "anything"));
  EXPECT_THROW(settings.set("max_iterations", 0), std::invalid_argument);
}

// Exception tests
TEST_F(SettingsTest, SettingNotFoundExceptions) {
  EXPECT_THROW(settings.get<int>("nonexistent"), SettingNotFound);
  EXPECT_THROW(settings.get_as_string("nonexistent"), SettingNotFound);
  EXPECT_THROW(settings.get("nonexistent"), SettingNotFound);
  EXPECT_THROW(settings.set("nonexistent", 1), SettingNotFound);
}

TEST_F(SettingsTest, SettingTypeMismatchExceptions) {
  EXPECT_THROW(settings.get<std::string>("max_iterations"),
               SettingTypeMismatch);
  EXPECT_THROW(settings.get<double>("max_iterations"), SettingTypeMismatch);
  EXPECT_THROW(settings.set("max_iterations", 1.5), SettingTypeMismatch);
  EXPECT_THROW(settings.set("method", true), SettingTypeMismatch);
}

TEST_F(SettingsTest, IntegerRangeChecks) {
  settings.set("max_iterations", 300);
  EXPECT_EQ(settings.get<std::uint16_t>("max_iterations"), 300);
  EXPECT_THROW(settings.get<std::uint8_t>("max_iterations"),
               SettingTypeMismatch);
}

TEST_F(SettingsTest, BoundsAreEnforced) {
  EXPECT_THROW(settings.set("max_iterations", 0), std::invalid_argument);
  EXPECT_THROW(settings.set("max_iterations", 1001), std::invalid_argument);
  EXPECT_THROW(settings.set("tolerance", -1e-3), std::invalid_argument);
  EXPECT_NO_THROW(settings.set("tolerance", 1.0));
  EXPECT_THROW(settings.set("max_iterations",
                            std::numeric_limits<std::uint64_t>::max()),
               std::out_of_range);
}

TEST_F(SettingsTest, LockPreventsModification) {
  settings.lock();
  EXPECT_TRUE(settings.is_locked());
  EXPECT_THROW(settings.set("tolerance", 0.5), SettingsAreLocked);
  EXPECT_THROW(settings.update({{"tolerance", 0.5}}), SettingsAreLocked);
  EXPECT_THROW(settings.update_from_json({{"tolerance", 0.5}}),
               SettingsAreLocked);

  // Copies start out unlocked
  TestSettings copy(settings);
  EXPECT_FALSE(copy.is_locked());
  EXPECT_NO_THROW(copy.set("tolerance", 0.5));
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 1e-6);
}

TEST_F(SettingsTest, UpdateIsAtomic) {
  EXPECT_THROW(settings.update({{"tolerance", 0.5},
                                {"max_iterations", int64_t{0}}}),
               std::invalid_argument);
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 1e-6);

  settings.update({{"tolerance", 0.5}, {"max_iterations", int64_t{10}}});
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 0.5);
  EXPECT_EQ(settings.get<int>("max_iterations"), 10);
}

// JSON tests
TEST_F(SettingsTest, JSONSerialization) {
  settings.set("max_iterations", 42);
  settings.set("tolerance", 3.14159e-3);

  auto json_obj = settings.to_json();
  EXPECT_EQ(json_obj["max_iterations"], 42);
  EXPECT_NEAR(json_obj["tolerance"].get<double>(), 3.14159e-3,
              testing::numerical_zero_tolerance);
  EXPECT_EQ(json_obj["method"], "default");
  EXPECT_EQ(json_obj["enable_logging"], true);

  TestSettings loaded;
  loaded.update_from_json(json_obj);
  EXPECT_EQ(loaded.get<int>("max_iterations"), 42);
  EXPECT_NEAR(loaded.get<double>("tolerance"), 3.14159e-3,
              testing::numerical_zero_tolerance);
}

TEST_F(SettingsTest, JSONIntegersAcceptedForDoubles) {
  nlohmann::json j;
  j["tolerance"] = 1;
  settings.update_from_json(j);
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 1.0);
}

TEST_F(SettingsTest, JSONValidationErrors) {
  nlohmann::json non_object_json = "this is a string, not an object";
  EXPECT_THROW(settings.update_from_json(non_object_json), std::runtime_error);

  nlohmann::json array_json = nlohmann::json::array({1, 2, 3});
  EXPECT_THROW(settings.update_from_json(array_json), std::runtime_error);

  nlohmann::json unknown;
  unknown["unknown_key"] = 123;
  EXPECT_THROW(settings.update_from_json(unknown), SettingNotFound);

  nlohmann::json unsupported;
  unsupported["method"] = nlohmann::json::array({1});
  EXPECT_THROW(settings.update_from_json(unsupported), std::runtime_error);

  // Nothing is applied when one entry fails
  nlohmann::json partial;
  partial["tolerance"] = 0.5;
  partial["max_iterations"] = 5000;
  EXPECT_THROW(settings.update_from_json(partial), std::invalid_argument);
  EXPECT_DOUBLE_EQ(settings.get<double>("tolerance"), 1e-6);
}

TEST_F(SettingsTest, Summary) {
  const auto summary = settings.get_summary();
  EXPECT_NE(summary.find("max_iterations = 100  (Iteration cap)"),
            std::string::npos);
  EXPECT_NE(summary.find("method = default\n"), std::string::npos);

  Settings empty_settings;
  EXPECT_NE(empty_settings.get_summary().find("No settings configured"),
            std::string::npos);
}

TEST(SpinOperatorSettingsTest, JSONConfiguresOperators) {
  auto settings = std::make_shared<SpinOperatorSettings>();
  settings->update_from_json(
      nlohmann::json::parse(R"({"simplify_tolerance": 1e-3})"));
  EXPECT_DOUBLE_EQ(settings->to_json()["simplify_tolerance"].get<double>(),
                   1e-3);

  SpinOperator op({{"X_0", 1.0}, {"Y_0", 1e-4}}, 1, 0.5, settings);
  EXPECT_EQ(op.simplify().size(), 1);
}

TEST(SpinOperatorSettingsTest, Defaults) {
  SpinOperatorSettings settings;
  EXPECT_DOUBLE_EQ(settings.get<double>("simplify_tolerance"), 1e-12);
  EXPECT_DOUBLE_EQ(settings.get<double>("equality_atol"), 1e-8);
  EXPECT_DOUBLE_EQ(settings.get<double>("equality_rtol"), 1e-5);
  EXPECT_EQ(settings.get<int64_t>("matrix_warning_dimension"), 4096);
  EXPECT_THROW(settings.set("simplify_tolerance", -1.0),
               std::invalid_argument);
  EXPECT_THROW(settings.set("matrix_warning_dimension", 0),
               std::invalid_argument);
}
