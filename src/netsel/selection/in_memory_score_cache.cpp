#include "netsel/selection/in_memory_score_cache.hpp"

namespace netsel::selection {

    bool InMemoryScoreCache::is_scored_network(const wifi::ScanResult& scan) const {
        return score_for_scan(scan).has_value();
    }

    std::optional<int32_t> InMemoryScoreCache::score_for_scan(const wifi::ScanResult& scan) const {
        auto key = wifi::NetworkKey::from_scan_result(scan);
        if (!key) return std::nullopt; // unkeyable results are never scored
        return score_for(*key);
    }

    void InMemoryScoreCache::request_scores(std::vector<wifi::NetworkKey> keys) {
        if (keys.empty()) return;
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_.size() >= max_pending_) {
            ++dropped_;
            return;
        }
        pending_.push_back(std::move(keys));
    }

    void InMemoryScoreCache::update_scores(const std::vector<ScoredNetwork>& scores) {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& s : scores) scores_[s.key] = s.score;
    }

    std::optional<int32_t> InMemoryScoreCache::score_for(const wifi::NetworkKey& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = scores_.find(key);
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::vector<wifi::NetworkKey>> InMemoryScoreCache::take_pending_requests() {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::vector<wifi::NetworkKey>> out(std::make_move_iterator(pending_.begin()),
                                                      std::make_move_iterator(pending_.end()));
        pending_.clear();
        return out;
    }

    uint64_t InMemoryScoreCache::dropped_requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

} // namespace netsel::selection
