#pragma once
/**
 * @file recommendation_oracle.hpp
 * @brief Pluggable oracle answering: which network should we join right now?
 * @details Backed by an external scoring/recommendation service; simulator in
 *          simulated_recommendation_oracle.hpp.
 */

#include <chrono>
#include <optional>
#include <vector>

#include "netsel/wifi/scan_result.hpp"
#include "netsel/wifi/wifi_configuration.hpp"

namespace netsel::selection {

    /** @struct RecommendationRequest
     *  @brief Filtered, ordered scan results plus the caller's deadline.
     */
    struct RecommendationRequest {
        std::vector<wifi::ScanResult> scan_results; ///< Order matters to some oracles
        std::chrono::milliseconds     timeout{0};   ///< 0 = no deadline
    };

    /** @struct RecommendationResult
     *  @brief Oracle answer. An empty configuration means "no recommendation".
     */
    struct RecommendationResult {
        std::optional<wifi::WifiConfiguration> wifi_configuration;
    };

    class RecommendationOracle {
    public:
        virtual ~RecommendationOracle() = default;

        /**
         * @brief Synchronously ask for the best network among the request's scan results.
         * @details Implementations should give up once request.timeout has elapsed.
         *          The caller does not enforce the deadline; whatever is returned is reconciled.
         */
        virtual std::optional<RecommendationResult>
        request_recommendation(const RecommendationRequest& request) = 0;
    };

} // namespace netsel::selection
