/**
 * @file main.cpp
 * @brief Demo wiring for the recommended-network evaluator.
 *
 * **Bootstrap**
 * Load config (optional JSON path as argv[1]); construct the in-memory config
 * store, score cache, simulated oracle and the evaluator.
 *
 * **Cycles**
 * - update(): unscored scan results become one score request.
 * - A stand-in scoring service drains the requests and rates by signal level.
 * - evaluate_networks(): filter → oracle → reconcile → commit.
 *
 * The last cycle removes the ephemeral network the way a user would, so the
 * evaluator stops recommending it.
 */

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "netsel/config/config_loader.hpp"
#include "netsel/obs/observability.hpp"
#include "netsel/selection/in_memory_config_store.hpp"
#include "netsel/selection/in_memory_score_cache.hpp"
#include "netsel/selection/recommended_network_evaluator.hpp"
#include "netsel/selection/simulated_recommendation_oracle.hpp"
#include "netsel/version.hpp"
#include "netsel/wifi/scan_result_util.hpp"

using namespace netsel;

namespace {

wifi::ScanResultList demo_scan() {
    return {
        wifi::ScanResult{.ssid = "Home",      .bssid = "aa:bb:cc:00:00:01", .capabilities = "[WPA2-PSK-CCMP][ESS]", .level = -48, .frequency = 5180},
        wifi::ScanResult{.ssid = "CoffeeBar", .bssid = "aa:bb:cc:00:00:02", .capabilities = "[ESS]",                .level = -61, .frequency = 2437},
        wifi::ScanResult{.ssid = "Office",    .bssid = "aa:bb:cc:00:00:03", .capabilities = "[WPA2-EAP-CCMP][ESS]", .level = -70, .frequency = 5500},
        wifi::ScanResult{.ssid = "Broken",    .bssid = "not-a-bssid",       .capabilities = "[ESS]",                .level = -80, .frequency = 2412},
    };
}

// Stand-in scoring service: score = 100 + level, published to the cache and the oracle.
void serve_score_requests(selection::InMemoryScoreCache& cache,
                          selection::SimulatedRecommendationOracle& oracle,
                          const wifi::ScanResultList& scan,
                          selection::RatingMap& ratings) {
    for (const auto& batch : cache.take_pending_requests()) {
        std::vector<selection::ScoredNetwork> scored;
        for (const auto& key : batch) {
            for (const auto& r : scan) {
                auto k = wifi::NetworkKey::from_scan_result(r);
                if (!k || !(*k == key)) continue;
                scored.push_back({key, 100 + r.level});
                ratings[key.bssid] = 100 + r.level;
            }
        }
        cache.update_scores(scored);
    }
    oracle.load_ratings(ratings);
}

} // namespace

int main(int argc, char** argv) {
    config::EvaluatorConfig cfg = config::Loader::defaults();
    if (argc > 1) {
        auto loaded = config::Loader::load_from_file(argv[1]);
        if (!loaded) {
            std::fprintf(stderr, "netsel: cannot load %s: %s\n", argv[1], config::to_string(loaded.error()));
            return 1;
        }
        cfg = *loaded;
    }

    auto log    = std::make_shared<obs::LocalLog>(cfg.local_log_lines, cfg.log_to_stderr);
    auto store  = std::make_shared<selection::InMemoryConfigStore>();
    auto cache  = std::make_shared<selection::InMemoryScoreCache>();
    auto oracle = std::make_shared<selection::SimulatedRecommendationOracle>();

    selection::RecommendedNetworkEvaluator evaluator(cache, oracle, store, log, cfg);
    std::printf("netsel %s: evaluator '%s'\n", version_string, std::string(evaluator.name()).c_str());

    selection::RatingMap ratings;
    constexpr int kCycles = 4;
    for (int cycle = 0; cycle < kCycles; ++cycle) {
        auto scan = demo_scan();
        if (cycle == kCycles - 1) {
            store->disable_ephemeral_network(wifi::quoted_ssid("Home"));
        }

        evaluator.update(scan);
        serve_score_requests(*cache, *oracle, scan, ratings);

        const bool untrusted_allowed = cycle > 0; // first cycle: saved networks only
        auto chosen = evaluator.evaluate_networks(scan, nullptr, {}, false, untrusted_allowed);
        if (chosen) {
            std::printf("cycle %d: networkId=%d ssid=%s ephemeral=%s\n", cycle, chosen->network_id,
                        chosen->ssid.c_str(), chosen->ephemeral ? "yes" : "no");
        } else {
            std::printf("cycle %d: no candidate\n", cycle);
        }
    }

    const auto c = log->snapshot();
    std::printf("evaluations=%llu candidates=%llu promotions=%llu score_requests=%llu skipped_keys=%llu\n",
                static_cast<unsigned long long>(c.evaluations), static_cast<unsigned long long>(c.candidates),
                static_cast<unsigned long long>(c.promotions), static_cast<unsigned long long>(c.score_requests),
                static_cast<unsigned long long>(c.skipped_keys));
    return 0;
}
