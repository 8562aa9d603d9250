#pragma once
/**
 * @file network_evaluator.hpp
 * @brief Contract between the network selection pipeline and one evaluator.
 */

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "netsel/wifi/scan_result.hpp"
#include "netsel/wifi/wifi_configuration.hpp"

namespace netsel::selection {

class NetworkEvaluator {
public:
    virtual ~NetworkEvaluator() = default;

    /// Called on every scan, whether or not selection runs afterwards.
    virtual void update(std::span<const wifi::ScanResult> scan_results) = 0;

    /**
     * @brief Pick a network among the scan results, or decline.
     * @param scan_results Current scan; evaluators may set ScanResult::untrusted.
     * @param current_network Connected profile, nullptr when disconnected.
     * @param current_bssid BSSID of the current association (may be empty).
     * @param connected Whether the device is associated.
     * @param untrusted_network_allowed Allow networks without a saved profile.
     * @return Profile to connect to, or std::nullopt. Never throws.
     */
    virtual std::optional<wifi::WifiConfiguration>
    evaluate_networks(std::span<wifi::ScanResult> scan_results,
                      const wifi::WifiConfiguration* current_network,
                      const std::string& current_bssid,
                      bool connected,
                      bool untrusted_network_allowed) = 0;

    /// Short identifying tag for logs.
    virtual std::string_view name() const noexcept = 0;
};

} // namespace netsel::selection
