// InMemoryConfigStore: RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock writer_mu_, copy current state, mutate, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "netsel/selection/in_memory_config_store.hpp"
#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result_util.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace netsel::selection {

using wifi::NetworkId;
using wifi::WifiConfiguration;

InMemoryConfigStore::InMemoryConfigStore(std::size_t max_networks)
    : max_networks_(max_networks) {}

//------------------------------- Validation -----------------------------------

bool InMemoryConfigStore::validate(const WifiConfiguration& config) noexcept {
    if (config.allowed_key_management.none()) return false;
    // A pinned BSSID must be well formed; the SSID must be quoted or hex.
    const std::string_view placeholder_bssid = config.bssid.empty() ? std::string_view{"00:00:00:00:00:00"}
                                                              : std::string_view{config.bssid};
    return wifi::NetworkKey::make(config.ssid, placeholder_bssid).has_value();
}

//------------------------------- Snapshots ------------------------------------

std::shared_ptr<const InMemoryConfigStore::State>
InMemoryConfigStore::snapshot() const noexcept {
    return std::atomic_load_explicit(&state_, std::memory_order_acquire);
}

void InMemoryConfigStore::publish(std::shared_ptr<State> next) {
    std::shared_ptr<const State> cnext = std::move(next);
    std::atomic_store_explicit(&state_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

//------------------------------- Reads ----------------------------------------

bool InMemoryConfigStore::was_ephemeral_network_deleted(std::string_view quoted_ssid) const {
    auto snap = snapshot();
    return snap->deleted_ephemeral_ssids.find(quoted_ssid) != snap->deleted_ephemeral_ssids.end();
}

std::optional<NetworkId> InMemoryConfigStore::saved_network_for(const wifi::ScanResult& scan) const {
    auto snap = snapshot();
    const std::string key = wifi::quoted_ssid(scan.ssid) + wifi::security_label_of(scan);
    for (const auto& [id, cfg] : snap->networks) {
        if (cfg.config_key() == key) return id;
    }
    return std::nullopt;
}

std::optional<WifiConfiguration> InMemoryConfigStore::configured_network(NetworkId id) const {
    auto snap = snapshot();
    const auto it = snap->networks.find(id);
    if (it == snap->networks.end()) return std::nullopt;
    return it->second; // copy
}

std::vector<WifiConfiguration> InMemoryConfigStore::configured_networks() const {
    auto snap = snapshot();
    std::vector<WifiConfiguration> out;
    out.reserve(snap->networks.size());
    for (const auto& kv : snap->networks) out.push_back(kv.second);
    return out;
}

std::size_t InMemoryConfigStore::size() const noexcept {
    return snapshot()->networks.size();
}

InMemoryConfigStore::Stats InMemoryConfigStore::stats() const noexcept {
    return Stats{adds_.load(std::memory_order_relaxed), updates_.load(std::memory_order_relaxed),
                 removes_.load(std::memory_order_relaxed), candidates_.load(std::memory_order_relaxed),
                 failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutations ------------------------------------

netsel_detail::expected<NetworkId, StoreErr>
InMemoryConfigStore::add_or_update_network(const WifiConfiguration& config, std::int32_t uid) {
    if (!validate(config)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return netsel_detail::unexpected<StoreErr>(StoreErr::Invalid);
    }

    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<State>(*snapshot()); // copy-on-write

    // Resolve the target: explicit id first, then config key.
    auto it = next->networks.end();
    if (config.network_id != wifi::kInvalidNetworkId) {
        it = next->networks.find(config.network_id);
        if (it == next->networks.end()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return netsel_detail::unexpected<StoreErr>(StoreErr::NotFound);
        }
    } else {
        const std::string key = config.config_key();
        for (auto cur = next->networks.begin(); cur != next->networks.end(); ++cur) {
            if (cur->second.config_key() == key) { it = cur; break; }
        }
    }

    if (it != next->networks.end()) {
        WifiConfiguration& existing = it->second;
        const NetworkId id = existing.network_id;
        const auto creator = existing.creator_uid;
        const bool ephemeral = existing.ephemeral;
        auto candidate = std::move(existing.candidate);
        const auto candidate_score = existing.candidate_score;
        existing = config;
        existing.network_id = id;
        existing.creator_uid = creator;
        existing.ephemeral = ephemeral && config.ephemeral; // saved profiles never turn ephemeral
        existing.candidate = std::move(candidate);
        existing.candidate_score = candidate_score;
        publish(std::move(next));
        updates_.fetch_add(1, std::memory_order_relaxed);
        return id;
    }

    if (next->networks.size() >= max_networks_) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return netsel_detail::unexpected<StoreErr>(StoreErr::Capacity);
    }

    const NetworkId id = next->next_id++;
    WifiConfiguration added = config;
    added.network_id = id;
    added.creator_uid = uid;
    added.candidate.reset();
    added.candidate_score = 0;
    next->networks.emplace(id, std::move(added));
    publish(std::move(next));
    adds_.fetch_add(1, std::memory_order_relaxed);
    return id;
}

bool InMemoryConfigStore::set_network_candidate_scan_result(NetworkId id,
                                                            const wifi::ScanResult& scan,
                                                            std::int32_t score) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<State>(*snapshot());
    auto it = next->networks.find(id);
    if (it == next->networks.end()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    it->second.candidate = scan;
    it->second.candidate_score = score;
    publish(std::move(next));
    candidates_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool InMemoryConfigStore::remove_network(NetworkId id) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    if (snap->networks.find(id) == snap->networks.end()) return false;

    auto next = std::make_shared<State>(*snap);
    next->networks.erase(id);
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool InMemoryConfigStore::disable_ephemeral_network(std::string_view quoted_ssid) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<State>(*snapshot());
    next->deleted_ephemeral_ssids.emplace(quoted_ssid);

    bool removed = false;
    for (auto it = next->networks.begin(); it != next->networks.end();) {
        if (it->second.ephemeral && it->second.ssid == quoted_ssid) {
            it = next->networks.erase(it);
            removed = true;
        } else {
            ++it;
        }
    }
    publish(std::move(next));
    if (removed) removes_.fetch_add(1, std::memory_order_relaxed);
    return removed;
}

void InMemoryConfigStore::clear_deleted_ephemeral_networks() {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<State>(*snapshot());
    next->deleted_ephemeral_ssids.clear();
    publish(std::move(next));
}

} // namespace netsel::selection
