#pragma once
/**
 * @file network_key.hpp
 * @brief Validated (SSID, BSSID) identity used to talk to the score cache.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "netsel/compat/expected.hpp"
#include "netsel/wifi/scan_result.hpp"

namespace netsel::wifi {

/// Reasons a NetworkKey cannot be built.
enum class KeyError : std::uint8_t {
    InvalidSsid = 1, ///< Neither a quoted string of 1..32 octets nor a 0x hex literal
    InvalidBssid     ///< Not six colon separated hex octets
};

/** @struct NetworkKey
 *  @brief Normalized identity: quoted SSID + lower-case BSSID.
 *  @details Only the factories produce instances, so a NetworkKey in hand is
 *           always valid.
 */
struct NetworkKey final {
    std::string ssid;  ///< Quoted SSID ("\"Home\"") or hex literal ("0x486f6d65")
    std::string bssid; ///< Lower-case "xx:xx:xx:xx:xx:xx"

    /**
     * @brief Validate and build a key.
     * @param ssid Quoted SSID or 0x hex literal.
     * @param bssid Colon separated MAC address (any case).
     */
    static netsel_detail::expected<NetworkKey, KeyError>
    make(std::string_view ssid, std::string_view bssid);

    /// Build the key for a scan result (quotes the raw SSID first).
    static netsel_detail::expected<NetworkKey, KeyError>
    from_scan_result(const ScanResult& scan);

    bool operator==(const NetworkKey&) const = default;

private:
    static bool valid_ssid(std::string_view ssid) noexcept;
    static bool valid_bssid(std::string_view bssid) noexcept;
};

/// Hash functor for unordered containers keyed by NetworkKey.
struct NetworkKeyHash {
    std::size_t operator()(const NetworkKey& k) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(k.ssid);
        const std::size_t h2 = std::hash<std::string>{}(k.bssid);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

/// Human readable name for log lines.
const char* to_string(KeyError e) noexcept;

} // namespace netsel::wifi
