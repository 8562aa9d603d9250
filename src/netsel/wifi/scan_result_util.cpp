/**
 * @file scan_result_util.cpp
 * @brief SSID quoting and capability parsing.
 */
#include "netsel/wifi/scan_result_util.hpp"

namespace netsel::wifi {

std::string quoted_ssid(std::string_view raw_ssid) {
    std::string out;
    out.reserve(raw_ssid.size() + 2);
    out.push_back('"');
    out.append(raw_ssid);
    out.push_back('"');
    return out;
}

std::string remove_double_quotes(std::string_view ssid) {
    if (ssid.size() >= 2 && ssid.front() == '"' && ssid.back() == '"') {
        return std::string(ssid.substr(1, ssid.size() - 2));
    }
    return std::string(ssid);
}

std::string to_scan_id(const ScanResult& scan) {
    return scan.ssid + ":" + scan.bssid;
}

bool is_psk_network(const ScanResult& scan) noexcept {
    return scan.capabilities.find("PSK") != std::string::npos;
}

bool is_eap_network(const ScanResult& scan) noexcept {
    return scan.capabilities.find("EAP") != std::string::npos;
}

bool is_wep_network(const ScanResult& scan) noexcept {
    return scan.capabilities.find("WEP") != std::string::npos;
}

bool is_open_network(const ScanResult& scan) noexcept {
    return !is_psk_network(scan) && !is_eap_network(scan) && !is_wep_network(scan);
}

void set_allowed_key_management_from_scan_result(const ScanResult& scan,
                                                 WifiConfiguration& config) {
    if (is_psk_network(scan)) {
        config.set_key_mgmt(KeyMgmt::WpaPsk);
    } else if (is_eap_network(scan)) {
        config.set_key_mgmt(KeyMgmt::WpaEap);
        config.set_key_mgmt(KeyMgmt::Ieee8021x);
    } else if (is_wep_network(scan)) {
        config.set_key_mgmt(KeyMgmt::None);
        config.set_auth_algorithm(AuthAlgorithm::Open);
        config.set_auth_algorithm(AuthAlgorithm::Shared);
    } else {
        config.set_key_mgmt(KeyMgmt::None);
    }
}

std::string security_label_of(const ScanResult& scan) {
    WifiConfiguration derived;
    set_allowed_key_management_from_scan_result(scan, derived);
    return derived.security_label();
}

} // namespace netsel::wifi
