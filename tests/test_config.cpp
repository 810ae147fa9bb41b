#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "config.h"
#include "errors.h"

using namespace fsched;
using json = nlohmann::json;

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override { std::remove(path_.c_str()); }
  std::string path_ = ::testing::TempDir() + "fieldsched_config_test.json";
};

TEST_F(ConfigTest, EmptyObjectGivesDefaults) {
  const EngineConfig c = parse_engine_config(json::object());
  EXPECT_EQ(c.time_budget_seconds, 30);
  EXPECT_EQ(c.travel_timeout_ms, 5000);
  EXPECT_EQ(c.weather_timeout_ms, 2000);
  EXPECT_DOUBLE_EQ(c.average_speed_kmh, 30.0);
  EXPECT_EQ(c.location_staleness_minutes, 5);
  EXPECT_EQ(c.run_retention_days, 90);
  EXPECT_EQ(c.forecast_window_days, 14);
  EXPECT_DOUBLE_EQ(c.smoothing_alpha, 0.3);
  EXPECT_EQ(c.construction, "greedy");
  EXPECT_FALSE(c.verbose);
}

TEST_F(ConfigTest, KeysOverrideDefaults) {
  const json j = {{"TIME_BUDGET_SECONDS", 5},
                  {"AVERAGE_SPEED_KMH", 45.5},
                  {"PREEMPTION_WAIT_MS", 250},
                  {"CONSTRUCTION", "routing_model"},
                  {"VERBOSE", true},
                  {"UNRELATED", "ignored"}};
  const EngineConfig c = parse_engine_config(j);
  EXPECT_EQ(c.time_budget_seconds, 5);
  EXPECT_DOUBLE_EQ(c.average_speed_kmh, 45.5);
  EXPECT_EQ(c.preemption_wait_ms, 250);
  EXPECT_EQ(c.construction, "routing_model");
  EXPECT_TRUE(c.verbose);
  EXPECT_EQ(c.max_iterations, 1000);
}

TEST_F(ConfigTest, EveryViolationIsReported) {
  const json j = {{"TIME_BUDGET_SECONDS", 0}, {"SMOOTHING_ALPHA", 1.5}, {"CONSTRUCTION", "tabu"}};
  try {
    parse_engine_config(j);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.violations().size(), 3U);
  }
}

TEST_F(ConfigTest, WrongTypesAndAdaptLimitsAreReportedTogether) {
  const json j = {{"MAX_ITERATIONS", "x"},
                  {"VERBOSE", 3},
                  {"PREEMPTION_WAIT_MS", -1},
                  {"ADAPT_ITERATIONS", -5},
                  {"ADAPT_TIME_BUDGET_MS", 0},
                  {"WEATHER_TIMEOUT_MS", 0}};
  try {
    parse_engine_config(j);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    const std::vector<std::string> expected = {"MAX_ITERATIONS has the wrong type (string)",
                                               "VERBOSE has the wrong type (number)",
                                               "WEATHER_TIMEOUT_MS must be > 0",
                                               "PREEMPTION_WAIT_MS must be >= 0",
                                               "ADAPT_ITERATIONS must be >= 0",
                                               "ADAPT_TIME_BUDGET_MS must be > 0"};
    EXPECT_EQ(e.violations(), expected);
  }
}

TEST_F(ConfigTest, NonObjectIsRejected) {
  EXPECT_THROW(parse_engine_config(json::array()), ValidationError);
}

TEST_F(ConfigTest, LoadsFromFile) {
  {
    std::ofstream out(path_);
    out << R"({"RUN_RETENTION_DAYS": 30, "FORECAST_HORIZON_DAYS": 3})";
  }
  const EngineConfig c = load_engine_config(path_);
  EXPECT_EQ(c.run_retention_days, 30);
  EXPECT_EQ(c.forecast_horizon_days, 3);
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(load_engine_config(::testing::TempDir() + "fieldsched_missing_config.json"), std::runtime_error);
}
