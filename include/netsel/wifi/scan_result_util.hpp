#pragma once
/**
 * @file scan_result_util.hpp
 * @brief SSID quoting and security helpers shared by evaluators and stores.
 */

#include <string>
#include <string_view>

#include "netsel/wifi/scan_result.hpp"
#include "netsel/wifi/wifi_configuration.hpp"

namespace netsel::wifi {

/// "Home" -> "\"Home\"". The raw broadcast SSID is always wrapped, even if it holds quotes.
std::string quoted_ssid(std::string_view raw_ssid);

/// "\"Home\"" -> "Home". Strings without a surrounding pair are returned unchanged.
std::string remove_double_quotes(std::string_view ssid);

/// Log identifier for a scan result: "<ssid>:<bssid>".
std::string to_scan_id(const ScanResult& scan);

bool is_psk_network(const ScanResult& scan) noexcept;
bool is_eap_network(const ScanResult& scan) noexcept;
bool is_wep_network(const ScanResult& scan) noexcept;
bool is_open_network(const ScanResult& scan) noexcept;

/**
 * @brief Fill key management (and WEP auth algorithms) from the scan's capabilities.
 * @details PSK wins over EAP, EAP over WEP; anything else is treated as open.
 */
void set_allowed_key_management_from_scan_result(const ScanResult& scan,
                                                 WifiConfiguration& config);

/// Security label the scan result would map to (matches WifiConfiguration::security_label()).
std::string security_label_of(const ScanResult& scan);

} // namespace netsel::wifi
