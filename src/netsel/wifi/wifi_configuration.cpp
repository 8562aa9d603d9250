/**
 * @file wifi_configuration.cpp
 * @brief Security labels and config keys for WifiConfiguration.
 */
#include "netsel/wifi/wifi_configuration.hpp"

namespace netsel::wifi {

std::string WifiConfiguration::security_label() const {
    if (has_key_mgmt(KeyMgmt::WpaPsk)) return "WPA_PSK";
    if (has_key_mgmt(KeyMgmt::WpaEap) || has_key_mgmt(KeyMgmt::Ieee8021x)) return "WPA_EAP";
    // WEP profiles keep KeyMgmt::None but carry shared-key auth.
    if (has_auth_algorithm(AuthAlgorithm::Shared)) return "WEP";
    return "NONE";
}

std::string WifiConfiguration::config_key() const {
    return ssid + security_label();
}

} // namespace netsel::wifi
