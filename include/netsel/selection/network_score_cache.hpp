#pragma once
/**
 * @file network_score_cache.hpp
 * @brief Local cache of network quality scores.
 */

#include <vector>

#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result.hpp"

namespace netsel::selection {

    class NetworkScoreCache {
    public:
        virtual ~NetworkScoreCache() = default;

        /// True when a score is cached for the scan result's identity.
        virtual bool is_scored_network(const wifi::ScanResult& scan) const = 0;

        /**
         * @brief Ask the scoring service to score @p keys.
         * @details Fire-and-forget: must return without waiting for the scores.
         *          Results only become visible through later is_scored_network() calls.
         */
        virtual void request_scores(std::vector<wifi::NetworkKey> keys) = 0;
    };

} // namespace netsel::selection
