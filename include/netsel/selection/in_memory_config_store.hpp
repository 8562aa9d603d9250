#pragma once
// netsel: InMemoryConfigStore
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers (evaluators) take a snapshot with ACQUIRE semantics and never block.
//   • Writers copy the whole state, mutate, and publish with RELEASE semantics.
//   • Writers are serialized by a mutex so concurrent add_or_update calls cannot
//     lose each other's ids.
// Errors are StoreErr codes; no exceptions.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "netsel/config/constants.hpp"
#include "netsel/selection/wifi_config_store.hpp"

namespace netsel::selection {

class InMemoryConfigStore final : public WifiConfigStore {
public:
    /// Immutable published state.
    struct State {
        std::map<wifi::NetworkId, wifi::WifiConfiguration> networks;
        std::set<std::string, std::less<>>                 deleted_ephemeral_ssids; ///< Quoted SSIDs
        wifi::NetworkId                                    next_id{0};
    };

    explicit InMemoryConfigStore(std::size_t max_networks = config::constants::CONFIG_STORE_MAX_NETWORKS);

    // --------------------------- WifiConfigStore ------------------------------
    bool was_ephemeral_network_deleted(std::string_view quoted_ssid) const override;
    std::optional<wifi::NetworkId> saved_network_for(const wifi::ScanResult& scan) const override;
    netsel_detail::expected<wifi::NetworkId, StoreErr>
    add_or_update_network(const wifi::WifiConfiguration& config, std::int32_t uid) override;
    bool set_network_candidate_scan_result(wifi::NetworkId id,
                                           const wifi::ScanResult& scan,
                                           std::int32_t score) override;
    std::optional<wifi::WifiConfiguration> configured_network(wifi::NetworkId id) const override;

    // --------------------------- Maintenance ---------------------------------
    /// Remove a profile. Returns true if it existed.
    bool remove_network(wifi::NetworkId id);

    /**
     * @brief User removed an ephemeral network: drop its profile and remember the SSID
     *        so evaluators stop recommending it.
     * @return true if an ephemeral profile with this SSID was removed.
     */
    bool disable_ephemeral_network(std::string_view quoted_ssid);

    /// Forget all deleted-ephemeral marks (e.g. on user reset).
    void clear_deleted_ephemeral_networks();

    // --------------------------- Read utilities ------------------------------
    std::shared_ptr<const State> snapshot() const noexcept;
    [[nodiscard]] std::vector<wifi::WifiConfiguration> configured_networks() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    struct Stats {
        uint64_t adds{0}, updates{0}, removes{0}, candidates{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    static bool validate(const wifi::WifiConfiguration& config) noexcept;
    void publish(std::shared_ptr<State> next);

    std::size_t max_networks_;
    std::shared_ptr<const State> state_{std::make_shared<State>()};
    std::mutex writer_mu_;
    std::atomic<uint64_t> version_{0};
    std::atomic<uint64_t> adds_{0}, updates_{0}, removes_{0}, candidates_{0}, failures_{0};
};

} // namespace netsel::selection
