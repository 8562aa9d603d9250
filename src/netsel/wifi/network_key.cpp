/**
 * @file network_key.cpp
 * @brief NetworkKey validation.
 */
#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result_util.hpp"
#include "netsel/config/constants.hpp"

#include <algorithm>
#include <cctype>

namespace netsel::wifi {

namespace {
bool is_hex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}
}

bool NetworkKey::valid_ssid(std::string_view ssid) noexcept {
    using config::constants::SSID_MAX_OCTETS;
    // Quoted form: "<1..32 octets>"
    if (ssid.size() >= 2 && ssid.front() == '"' && ssid.back() == '"') {
        const auto payload = ssid.size() - 2;
        return payload >= 1 && payload <= SSID_MAX_OCTETS;
    }
    // Hex form: 0x followed by an even number of hex digits, at most 32 octets
    if (ssid.size() > 2 && ssid[0] == '0' && (ssid[1] == 'x' || ssid[1] == 'X')) {
        const auto digits = ssid.substr(2);
        if (digits.size() % 2 != 0 || digits.size() > 2 * SSID_MAX_OCTETS) return false;
        return std::all_of(digits.begin(), digits.end(), is_hex);
    }
    return false;
}

bool NetworkKey::valid_bssid(std::string_view bssid) noexcept {
    if (bssid.size() != config::constants::BSSID_TEXT_LEN) return false;
    for (std::size_t i = 0; i < bssid.size(); ++i) {
        if (i % 3 == 2) {
            if (bssid[i] != ':') return false;
        } else if (!is_hex(bssid[i])) {
            return false;
        }
    }
    return true;
}

netsel_detail::expected<NetworkKey, KeyError>
NetworkKey::make(std::string_view ssid, std::string_view bssid) {
    if (!valid_ssid(ssid))   return netsel_detail::unexpected<KeyError>(KeyError::InvalidSsid);
    if (!valid_bssid(bssid)) return netsel_detail::unexpected<KeyError>(KeyError::InvalidBssid);

    NetworkKey k;
    k.ssid = std::string(ssid);
    k.bssid.reserve(bssid.size());
    for (char c : bssid) k.bssid.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return k;
}

netsel_detail::expected<NetworkKey, KeyError>
NetworkKey::from_scan_result(const ScanResult& scan) {
    return make(quoted_ssid(scan.ssid), scan.bssid);
}

const char* to_string(KeyError e) noexcept {
    switch (e) {
        case KeyError::InvalidSsid:  return "invalid_ssid";
        case KeyError::InvalidBssid: return "invalid_bssid";
    }
    return "unknown";
}

} // namespace netsel::wifi
