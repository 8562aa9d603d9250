/**
 * @file test_config.cpp
 * @brief Tests for the JSON config Loader and the LocalLog sink.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "netsel/config/config_loader.hpp"
#include "netsel/obs/observability.hpp"

using namespace std::chrono_literals;
using netsel::config::ConfigError;
using netsel::config::Loader;
using netsel::obs::EvaluationEvent;
using netsel::obs::LocalLog;
using netsel::obs::LogLevel;
using netsel::obs::Outcome;

// ---------- Loader ----------

TEST(ConfigLoader, Defaults) {
  const auto cfg = Loader::defaults();
  EXPECT_EQ(cfg.name, "RecNetEvaluator");
  EXPECT_EQ(cfg.system_uid, 1010);
  EXPECT_EQ(cfg.candidate_score, 0);
  EXPECT_EQ(cfg.oracle_timeout, 1000ms);
  EXPECT_EQ(cfg.local_log_lines, 256u);
  EXPECT_TRUE(cfg.log_to_stderr);
}

TEST(ConfigLoader, FullDocument) {
  auto cfg = Loader::load_from_string(R"({
    "evaluator": { "name": "Lab", "system_uid": 2000, "candidate_score": 5, "oracle_timeout_ms": 250 },
    "log": { "max_lines": 32, "stderr": false }
  })");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->name, "Lab");
  EXPECT_EQ(cfg->system_uid, 2000);
  EXPECT_EQ(cfg->candidate_score, 5);
  EXPECT_EQ(cfg->oracle_timeout, 250ms);
  EXPECT_EQ(cfg->local_log_lines, 32u);
  EXPECT_FALSE(cfg->log_to_stderr);
}

TEST(ConfigLoader, MissingKeysKeepDefaults) {
  auto cfg = Loader::load_from_string(R"({ "evaluator": { "oracle_timeout_ms": 0 } })");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->oracle_timeout, 0ms);
  EXPECT_EQ(cfg->system_uid, 1010);
  EXPECT_EQ(cfg->name, "RecNetEvaluator");

  auto empty = Loader::load_from_string("{}");
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->local_log_lines, 256u);
}

TEST(ConfigLoader, ParseError) {
  auto cfg = Loader::load_from_string("{ \"evaluator\": ");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), ConfigError::ParseError);
}

TEST(ConfigLoader, InvalidValues) {
  for (const char* doc : {
         R"([1, 2])",
         R"({ "evaluator": 3 })",
         R"({ "evaluator": { "system_uid": "wifi" } })",
         R"({ "evaluator": { "system_uid": -1 } })",
         R"({ "evaluator": { "oracle_timeout_ms": -5 } })",
         R"({ "evaluator": { "name": "" } })",
         R"({ "log": { "max_lines": 0 } })",
         R"({ "log": { "stderr": "yes" } })"}) {
    auto cfg = Loader::load_from_string(doc);
    ASSERT_FALSE(cfg.has_value()) << doc;
    EXPECT_EQ(cfg.error(), ConfigError::InvalidValue) << doc;
  }
}

TEST(ConfigLoader, FileRoundTrip) {
  const std::string path = ::testing::TempDir() + "netsel_config_test.json";
  {
    std::ofstream out(path);
    out << R"({ "evaluator": { "system_uid": 3000 } })";
  }
  auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->system_uid, 3000);
}

TEST(ConfigLoader, FileNotFound) {
  auto cfg = Loader::load_from_file(::testing::TempDir() + "does_not_exist_netsel.json");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error(), ConfigError::NotFound);
}

// ---------- LocalLog ----------

TEST(LocalLog, RingDropsOldestLine) {
  LocalLog log(3);
  for (int i = 0; i < 5; ++i) log.log(LogLevel::Info, "T", "line " + std::to_string(i));

  const auto lines = log.lines();
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines.front(), "I T: line 2");
  EXPECT_EQ(lines.back(), "I T: line 4");
}

TEST(LocalLog, RecordCountsOutcomes) {
  LocalLog log(16);
  EvaluationEvent ok{.evaluator = "E", .outcome = Outcome::Candidate, .eligible = 2,
                     .network_id = 4, .scan_id = "Home:aa:bb:cc:00:00:01", .promoted = true};
  EvaluationEvent miss{.evaluator = "E", .outcome = Outcome::Mismatch, .eligible = 1};
  log.record(ok);
  log.record(miss);
  log.count_score_request(3, 1);
  log.count_score_request(0, 2);

  const auto c = log.snapshot();
  EXPECT_EQ(c.evaluations, 2u);
  EXPECT_EQ(c.candidates, 1u);
  EXPECT_EQ(c.mismatches, 1u);
  EXPECT_EQ(c.promotions, 1u);
  EXPECT_EQ(c.score_requests, 1u);
  EXPECT_EQ(c.skipped_keys, 3u);

  const auto lines = log.lines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find(R"("outcome":"candidate")"), std::string::npos);
  EXPECT_NE(lines[0].find(R"("network_id":4)"), std::string::npos);
  EXPECT_NE(lines[1].find(R"("outcome":"mismatch")"), std::string::npos);
}
