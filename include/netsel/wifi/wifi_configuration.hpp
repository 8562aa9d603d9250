#pragma once
/**
 * @file wifi_configuration.hpp
 * @brief Persisted network profile as seen by evaluators and the config store.
 */

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "netsel/wifi/scan_result.hpp"

namespace netsel::wifi {

/// Store-assigned profile identifier.
using NetworkId = std::int32_t;

/// Sentinel for "not persisted yet".
inline constexpr NetworkId kInvalidNetworkId = -1;

/**
 * @enum KeyMgmt
 * @brief Key management schemes a profile allows (bit positions).
 */
enum class KeyMgmt : std::uint8_t {
    None = 0,  ///< Open or WEP
    WpaPsk,    ///< WPA/WPA2 pre-shared key
    WpaEap,    ///< WPA/WPA2 enterprise
    Ieee8021x, ///< Dynamic WEP / 802.1X
    Count
};

/**
 * @enum AuthAlgorithm
 * @brief 802.11 authentication algorithms (bit positions), relevant for WEP.
 */
enum class AuthAlgorithm : std::uint8_t {
    Open = 0,
    Shared,
    Count
};

using KeyMgmtSet       = std::bitset<static_cast<std::size_t>(KeyMgmt::Count)>;
using AuthAlgorithmSet = std::bitset<static_cast<std::size_t>(AuthAlgorithm::Count)>;

/** @struct WifiConfiguration
 *  @brief Network profile; also used as the oracle's abstract answer.
 */
struct WifiConfiguration {
    NetworkId        network_id{kInvalidNetworkId}; ///< Sentinel until persisted
    std::string      ssid;                          ///< Quoted SSID, e.g. "\"Home\""
    std::string      bssid;                         ///< Pinned BSSID (may be empty)
    KeyMgmtSet       allowed_key_management;        ///< Empty means "derive from scan"
    AuthAlgorithmSet allowed_auth_algorithms;       ///< Set for WEP profiles
    bool             ephemeral{false};              ///< Auto-created, system managed
    std::int32_t     creator_uid{-1};               ///< Principal that created the profile

    std::optional<ScanResult> candidate;            ///< Best scan result this cycle
    std::int32_t              candidate_score{0};   ///< Score attached with the candidate

    void set_key_mgmt(KeyMgmt k) { allowed_key_management.set(static_cast<std::size_t>(k)); }
    bool has_key_mgmt(KeyMgmt k) const { return allowed_key_management.test(static_cast<std::size_t>(k)); }
    void set_auth_algorithm(AuthAlgorithm a) { allowed_auth_algorithms.set(static_cast<std::size_t>(a)); }
    bool has_auth_algorithm(AuthAlgorithm a) const { return allowed_auth_algorithms.test(static_cast<std::size_t>(a)); }

    /// Security label: "WPA_PSK", "WPA_EAP", "WEP" or "NONE".
    std::string security_label() const;

    /// Identity independent of network_id: quoted SSID + security label.
    std::string config_key() const;
};

} // namespace netsel::wifi
