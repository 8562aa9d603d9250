#pragma once
/**
 * @file in_memory_score_cache.hpp
 * @brief Mutex-guarded score table with a bounded queue of pending requests.
 * @details request_scores() only enqueues; a scorer drains the queue with
 *          take_pending_requests() and publishes results via update_scores().
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "netsel/config/constants.hpp"
#include "netsel/selection/network_score_cache.hpp"

namespace netsel::selection {

    /// Score published by the scoring service.
    struct ScoredNetwork {
        wifi::NetworkKey key;
        int32_t          score{0};
    };

    class InMemoryScoreCache final : public NetworkScoreCache {
    public:
        explicit InMemoryScoreCache(std::size_t max_pending = config::constants::SCORE_CACHE_MAX_PENDING)
            : max_pending_(max_pending) {}

        bool is_scored_network(const wifi::ScanResult& scan) const override;

        /// Enqueue one batch. Drops the batch when max_pending batches are already queued.
        void request_scores(std::vector<wifi::NetworkKey> keys) override;

        /// Insert or replace scores.
        void update_scores(const std::vector<ScoredNetwork>& scores);

        std::optional<int32_t> score_for(const wifi::NetworkKey& key) const;
        std::optional<int32_t> score_for_scan(const wifi::ScanResult& scan) const;

        /// Pop every queued batch, oldest first.
        std::vector<std::vector<wifi::NetworkKey>> take_pending_requests();

        uint64_t dropped_requests() const;

    private:
        mutable std::mutex mu_;
        std::size_t max_pending_;
        std::unordered_map<wifi::NetworkKey, int32_t, wifi::NetworkKeyHash> scores_;
        std::deque<std::vector<wifi::NetworkKey>> pending_;
        uint64_t dropped_{0};
    };

} // namespace netsel::selection
