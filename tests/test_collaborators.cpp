/**
 * @file test_collaborators.cpp
 * @brief Tests for the reference score cache and the simulated oracle.
 */
#include <gtest/gtest.h>
#include <vector>

#include "netsel/selection/in_memory_score_cache.hpp"
#include "netsel/selection/simulated_recommendation_oracle.hpp"

using netsel::selection::InMemoryScoreCache;
using netsel::selection::RecommendationRequest;
using netsel::selection::ScoredNetwork;
using netsel::selection::SimulatedRecommendationOracle;
using netsel::wifi::NetworkKey;
using netsel::wifi::ScanResult;
using netsel::wifi::kInvalidNetworkId;

namespace {
NetworkKey key(const char* quoted_ssid, const char* bssid) {
  return *NetworkKey::make(quoted_ssid, bssid);
}
}

// ---------- InMemoryScoreCache ----------

TEST(InMemoryScoreCache, RequestsQueueUntilDrained) {
  InMemoryScoreCache cache;
  cache.request_scores({key("\"A\"", "aa:bb:cc:00:00:01")});
  cache.request_scores({key("\"B\"", "aa:bb:cc:00:00:02"), key("\"C\"", "aa:bb:cc:00:00:03")});
  cache.request_scores({}); // empty batches are ignored

  auto batches = cache.take_pending_requests();
  ASSERT_EQ(batches.size(), 2u);
  EXPECT_EQ(batches[0].size(), 1u);
  EXPECT_EQ(batches[1].size(), 2u);
  EXPECT_TRUE(cache.take_pending_requests().empty());
}

TEST(InMemoryScoreCache, FullQueueDropsNewestBatch) {
  InMemoryScoreCache cache(/*max_pending=*/1);
  cache.request_scores({key("\"A\"", "aa:bb:cc:00:00:01")});
  cache.request_scores({key("\"B\"", "aa:bb:cc:00:00:02")});

  EXPECT_EQ(cache.dropped_requests(), 1u);
  auto batches = cache.take_pending_requests();
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(batches[0][0].ssid, "\"A\"");
}

TEST(InMemoryScoreCache, ScoresBecomeVisibleAfterUpdate) {
  InMemoryScoreCache cache;
  ScanResult r{.ssid="A", .bssid="AA:BB:CC:00:00:01"};
  EXPECT_FALSE(cache.is_scored_network(r));

  cache.update_scores({ScoredNetwork{key("\"A\"", "aa:bb:cc:00:00:01"), 42}});
  EXPECT_TRUE(cache.is_scored_network(r)); // BSSID case does not matter
  EXPECT_EQ(cache.score_for_scan(r), 42);

  ScanResult bad{.ssid="A", .bssid="broken"};
  EXPECT_FALSE(cache.is_scored_network(bad));
}

// ---------- SimulatedRecommendationOracle ----------

TEST(SimulatedRecommendationOracle, PicksBestRating) {
  SimulatedRecommendationOracle oracle;
  oracle.load_ratings({{"aa:bb:cc:00:00:01", 10}, {"aa:bb:cc:00:00:02", 30}});

  RecommendationRequest req;
  req.scan_results = {ScanResult{.ssid="A", .bssid="aa:bb:cc:00:00:01", .level=-40},
                      ScanResult{.ssid="B", .bssid="aa:bb:cc:00:00:02", .level=-80}};
  auto r = oracle.request_recommendation(req);
  ASSERT_TRUE(r && r->wifi_configuration);
  EXPECT_EQ(r->wifi_configuration->ssid, "\"B\"");
  EXPECT_EQ(r->wifi_configuration->bssid, "aa:bb:cc:00:00:02");
  EXPECT_EQ(r->wifi_configuration->network_id, kInvalidNetworkId);
  EXPECT_EQ(oracle.requests(), 1u);
}

TEST(SimulatedRecommendationOracle, TieBreaksOnLevelThenBssid) {
  SimulatedRecommendationOracle oracle;
  oracle.load_ratings({{"aa:bb:cc:00:00:01", 10}, {"aa:bb:cc:00:00:02", 10}, {"aa:bb:cc:00:00:03", 10}});

  RecommendationRequest req;
  req.scan_results = {ScanResult{.ssid="C", .bssid="aa:bb:cc:00:00:03", .level=-50},
                      ScanResult{.ssid="B", .bssid="aa:bb:cc:00:00:02", .level=-50},
                      ScanResult{.ssid="A", .bssid="aa:bb:cc:00:00:01", .level=-60}};
  auto r = oracle.request_recommendation(req);
  ASSERT_TRUE(r && r->wifi_configuration);
  EXPECT_EQ(r->wifi_configuration->bssid, "aa:bb:cc:00:00:02");
}

TEST(SimulatedRecommendationOracle, UnratedOrBelowMinimumMeansNoAnswer) {
  SimulatedRecommendationOracle oracle(/*min_rating=*/20);
  oracle.load_ratings({{"aa:bb:cc:00:00:01", 10}});

  RecommendationRequest req;
  req.scan_results = {ScanResult{.ssid="A", .bssid="aa:bb:cc:00:00:01"},
                      ScanResult{.ssid="B", .bssid="aa:bb:cc:00:00:02"}};
  EXPECT_FALSE(oracle.request_recommendation(req).has_value());
  EXPECT_FALSE(oracle.request_recommendation(RecommendationRequest{}).has_value());
}

TEST(SimulatedRecommendationOracle, ReturnsKnownNetworkId) {
  SimulatedRecommendationOracle oracle;
  oracle.load_ratings({{"aa:bb:cc:00:00:01", 10}});
  oracle.load_known_networks({{"\"A\"", 7}});

  RecommendationRequest req;
  req.scan_results = {ScanResult{.ssid="A", .bssid="aa:bb:cc:00:00:01"}};
  auto r = oracle.request_recommendation(req);
  ASSERT_TRUE(r && r->wifi_configuration);
  EXPECT_EQ(r->wifi_configuration->network_id, 7);
}
