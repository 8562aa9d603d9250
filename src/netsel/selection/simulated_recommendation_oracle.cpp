/**
* @file simulated_recommendation_oracle.cpp
 * @brief Implementation of the rating-table oracle.
 */
#include "netsel/selection/simulated_recommendation_oracle.hpp"
#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result_util.hpp"

namespace netsel::selection {

    void SimulatedRecommendationOracle::load_ratings(RatingMap ratings) {
        std::lock_guard<std::mutex> lk(mu_);
        ratings_ = std::move(ratings);
    }

    void SimulatedRecommendationOracle::load_known_networks(KnownNetworkMap known) {
        std::lock_guard<std::mutex> lk(mu_);
        known_ = std::move(known);
    }

    uint64_t SimulatedRecommendationOracle::requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }

    std::optional<RecommendationResult>
    SimulatedRecommendationOracle::request_recommendation(const RecommendationRequest& request) {
        std::lock_guard<std::mutex> lk(mu_);
        ++requests_;

        const wifi::ScanResult* best = nullptr;
        int32_t best_rating = 0;
        for (const auto& r : request.scan_results) {
            auto key = wifi::NetworkKey::from_scan_result(r);
            if (!key) continue;
            const auto it = ratings_.find(key->bssid);
            if (it == ratings_.end() || it->second < min_rating_) continue;

            const int32_t rating = it->second;
            if (!best) { best = &r; best_rating = rating; continue; }
            if (rating > best_rating) { best = &r; best_rating = rating; continue; }
            if (rating < best_rating) { continue; }
            if (r.level > best->level) { best = &r; best_rating = rating; continue; }
            if (r.level < best->level) { continue; }
            if (r.bssid < best->bssid) { best = &r; best_rating = rating; }
        }
        if (!best) return std::nullopt;

        wifi::WifiConfiguration cfg;
        cfg.ssid = wifi::quoted_ssid(best->ssid);
        cfg.bssid = best->bssid;
        if (const auto k = known_.find(cfg.ssid); k != known_.end()) cfg.network_id = k->second;
        return RecommendationResult{std::move(cfg)};
    }

} // namespace netsel::selection
