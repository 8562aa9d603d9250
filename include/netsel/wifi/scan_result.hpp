/**
 * @file scan_result.hpp
 * @brief Access point observation produced by the scanning subsystem.
 *
 * One ScanResult per BSS seen in the latest scan. Results live for a single
 * evaluation cycle; evaluators may only touch the `untrusted` flag.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace netsel::wifi {

/**
 * @brief Single BSS observation.
 *
 * @note `ssid` is the raw (unquoted) network name as broadcast. Quoting is
 *       applied when a result is turned into a NetworkKey or matched against a
 *       WifiConfiguration.
 */
struct ScanResult final {
  /// Raw SSID, e.g. "Home".
  std::string ssid;

  /// BSSID as "xx:xx:xx:xx:xx:xx".
  std::string bssid;

  /// Security/capability flags as reported by the driver, e.g. "[WPA2-PSK-CCMP][ESS]".
  std::string capabilities;

  /// Received signal level in dBm.
  std::int32_t level{-127};

  /// Primary channel frequency in MHz.
  std::int32_t frequency{0};

  /// Set by evaluators: true when no saved profile matches this result.
  bool untrusted{false};

  /// Structural equality (compares all fields).
  bool operator==(const ScanResult&) const = default;
};

/**
 * @brief Convenience alias for a scan batch.
 */
using ScanResultList = std::vector<ScanResult>;

} // namespace netsel::wifi
