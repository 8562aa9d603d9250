#pragma once
/**
 * @file wifi_config_store.hpp
 * @brief Persistent network configuration store as seen by evaluators.
 */

#include <cstdint>
#include <optional>
#include <string_view>

#include "netsel/compat/expected.hpp"
#include "netsel/wifi/scan_result.hpp"
#include "netsel/wifi/wifi_configuration.hpp"

namespace netsel::selection {

/// Result codes for store mutations.
enum class StoreErr : std::uint8_t {
    Invalid = 1, ///< Input validation failed (SSID, BSSID, key management)
    NotFound,    ///< Referenced network id does not exist
    Capacity,    ///< Store is full
    Rejected     ///< Backend refused the write
};

class WifiConfigStore {
public:
    virtual ~WifiConfigStore() = default;

    /// True if the user removed an ephemeral network with this quoted SSID.
    virtual bool was_ephemeral_network_deleted(std::string_view quoted_ssid) const = 0;

    /// Id of the saved (or ephemeral) profile matching the scan result, if any.
    virtual std::optional<wifi::NetworkId> saved_network_for(const wifi::ScanResult& scan) const = 0;

    /**
     * @brief Add a profile, or update the one with the same config key / id.
     * @param config Profile to write. network_id may be kInvalidNetworkId.
     * @param uid Principal performing the write.
     * @details An update keeps the stored id and creator, and never marks a saved
     *          profile ephemeral.
     * @return Assigned (or existing) network id.
     */
    virtual netsel_detail::expected<wifi::NetworkId, StoreErr>
    add_or_update_network(const wifi::WifiConfiguration& config, std::int32_t uid) = 0;

    /// Record @p scan as the current best candidate for @p id. False if @p id is unknown.
    virtual bool set_network_candidate_scan_result(wifi::NetworkId id,
                                                   const wifi::ScanResult& scan,
                                                   std::int32_t score) = 0;

    /// Copy of the persisted profile, if it exists.
    virtual std::optional<wifi::WifiConfiguration> configured_network(wifi::NetworkId id) const = 0;
};

const char* to_string(StoreErr e) noexcept;

} // namespace netsel::selection
