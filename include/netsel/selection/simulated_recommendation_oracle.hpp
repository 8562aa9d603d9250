#pragma once
/**
 * @file simulated_recommendation_oracle.hpp
 * @brief Rating-table oracle with a deterministic tie-breaker order.
 * @details Stands in for the external recommendation service in the demo app
 *          and integration tests.
 */

#include "netsel/config/constants.hpp"
#include "netsel/selection/recommendation_oracle.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace netsel::selection {

    /// Per lower-case BSSID: rating (higher wins)
    using RatingMap = std::unordered_map<std::string, int32_t>;

    /// Per quoted SSID: id of a profile the service already knows about
    using KnownNetworkMap = std::unordered_map<std::string, wifi::NetworkId>;

    /**
     * @class SimulatedRecommendationOracle
     * @brief Recommends the best-rated scan result.
     * @details Tie-breaker: rating DESC, level DESC, then lexicographic BSSID.
     *          Unrated results and ratings below min_rating are ignored.
     */
    class SimulatedRecommendationOracle final : public RecommendationOracle {
    public:
        explicit SimulatedRecommendationOracle(int32_t min_rating = config::constants::SIM_ORACLE_MIN_RATING)
            : min_rating_(min_rating) {}

        /// Replace the rating table
        void load_ratings(RatingMap ratings);
        /// Replace the known-network table
        void load_known_networks(KnownNetworkMap known);

        std::optional<RecommendationResult>
        request_recommendation(const RecommendationRequest& request) override;

        /// Number of requests served so far.
        uint64_t requests() const;

    private:
        mutable std::mutex mu_;
        int32_t min_rating_;
        RatingMap ratings_;
        KnownNetworkMap known_;
        uint64_t requests_{0};
    };

} // namespace netsel::selection
