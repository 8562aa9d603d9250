/**
 * @file test_wifi.cpp
 * @brief Tests for NetworkKey validation and scan result helpers.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result_util.hpp"

using netsel::wifi::AuthAlgorithm;
using netsel::wifi::KeyError;
using netsel::wifi::KeyMgmt;
using netsel::wifi::NetworkKey;
using netsel::wifi::ScanResult;
using netsel::wifi::WifiConfiguration;

// ---------- NetworkKey ----------

TEST(NetworkKey, Make_AcceptsQuotedAndHexSsids) {
  EXPECT_TRUE(NetworkKey::make("\"Home\"", "aa:bb:cc:00:00:01").has_value());
  EXPECT_TRUE(NetworkKey::make("0x486f6d65", "aa:bb:cc:00:00:01").has_value());
  EXPECT_TRUE(NetworkKey::make("\"" + std::string(32, 'a') + "\"", "aa:bb:cc:00:00:01").has_value());
}

TEST(NetworkKey, Make_RejectsMalformedSsids) {
  const std::vector<std::string> bad{"Home", "\"\"", "\"", "0x", "0x486", "0xzz",
                                     "\"" + std::string(33, 'a') + "\""};
  for (const auto& ssid : bad) {
    auto k = NetworkKey::make(ssid, "aa:bb:cc:00:00:01");
    ASSERT_FALSE(k.has_value()) << ssid;
    EXPECT_EQ(k.error(), KeyError::InvalidSsid) << ssid;
  }
}

TEST(NetworkKey, Make_RejectsMalformedBssids) {
  for (const char* bssid : {"", "aa:bb:cc:00:00", "aa:bb:cc:00:00:01:02", "aa-bb-cc-00-00-01",
                            "gg:bb:cc:00:00:01", "aabbcc000001"}) {
    auto k = NetworkKey::make("\"Home\"", bssid);
    ASSERT_FALSE(k.has_value()) << bssid;
    EXPECT_EQ(k.error(), KeyError::InvalidBssid) << bssid;
  }
}

TEST(NetworkKey, Make_NormalizesBssidCase) {
  auto k = NetworkKey::make("\"Home\"", "AA:BB:CC:0D:0E:0F");
  ASSERT_TRUE(k.has_value());
  EXPECT_EQ(k->bssid, "aa:bb:cc:0d:0e:0f");
  EXPECT_EQ(k->ssid, "\"Home\"");
}

TEST(NetworkKey, FromScanResult_QuotesRawSsid) {
  ScanResult r{.ssid="Cafe", .bssid="aa:bb:cc:00:00:02"};
  auto k = NetworkKey::from_scan_result(r);
  ASSERT_TRUE(k.has_value());
  EXPECT_EQ(k->ssid, "\"Cafe\"");

  r.ssid = "\"Cafe\"";
  k = NetworkKey::from_scan_result(r);
  ASSERT_TRUE(k.has_value());
  EXPECT_EQ(k->ssid, "\"\"Cafe\"\"");

  r.ssid = "";
  EXPECT_FALSE(NetworkKey::from_scan_result(r).has_value());
}

// ---------- SSID helpers ----------

TEST(ScanResultUtil, QuoteAndUnquote) {
  EXPECT_EQ(netsel::wifi::quoted_ssid("Home"), "\"Home\"");
  EXPECT_EQ(netsel::wifi::quoted_ssid("\"Home\""), "\"\"Home\"\"");
  EXPECT_EQ(netsel::wifi::remove_double_quotes("\"Home\""), "Home");
  EXPECT_EQ(netsel::wifi::remove_double_quotes("Home"), "Home");
  EXPECT_EQ(netsel::wifi::remove_double_quotes("\""), "\"");
}

TEST(ScanResultUtil, ScanId) {
  ScanResult r{.ssid="Home", .bssid="aa:bb:cc:00:00:01"};
  EXPECT_EQ(netsel::wifi::to_scan_id(r), "Home:aa:bb:cc:00:00:01");
}

// ---------- Key management ----------

TEST(ScanResultUtil, KeyMgmt_Psk) {
  WifiConfiguration c;
  netsel::wifi::set_allowed_key_management_from_scan_result(
      ScanResult{.capabilities="[WPA2-PSK-CCMP][ESS]"}, c);
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::WpaPsk));
  EXPECT_EQ(c.allowed_key_management.count(), 1u);
  EXPECT_EQ(c.security_label(), "WPA_PSK");
}

TEST(ScanResultUtil, KeyMgmt_Eap) {
  WifiConfiguration c;
  netsel::wifi::set_allowed_key_management_from_scan_result(
      ScanResult{.capabilities="[WPA2-EAP-CCMP][ESS]"}, c);
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::WpaEap));
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::Ieee8021x));
  EXPECT_EQ(c.security_label(), "WPA_EAP");
}

TEST(ScanResultUtil, KeyMgmt_Wep) {
  WifiConfiguration c;
  netsel::wifi::set_allowed_key_management_from_scan_result(ScanResult{.capabilities="[WEP][ESS]"}, c);
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::None));
  EXPECT_TRUE(c.has_auth_algorithm(AuthAlgorithm::Open));
  EXPECT_TRUE(c.has_auth_algorithm(AuthAlgorithm::Shared));
  EXPECT_EQ(c.security_label(), "WEP");
}

TEST(ScanResultUtil, KeyMgmt_Open) {
  WifiConfiguration c;
  netsel::wifi::set_allowed_key_management_from_scan_result(ScanResult{.capabilities="[ESS]"}, c);
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::None));
  EXPECT_TRUE(c.allowed_auth_algorithms.none());
  EXPECT_EQ(c.security_label(), "NONE");
}

TEST(ScanResultUtil, KeyMgmt_PskWinsOverEapInMixedMode) {
  WifiConfiguration c;
  netsel::wifi::set_allowed_key_management_from_scan_result(
      ScanResult{.capabilities="[WPA2-EAP-CCMP][WPA2-PSK-CCMP][ESS]"}, c);
  EXPECT_TRUE(c.has_key_mgmt(KeyMgmt::WpaPsk));
  EXPECT_FALSE(c.has_key_mgmt(KeyMgmt::WpaEap));
}

TEST(WifiConfiguration, ConfigKey) {
  WifiConfiguration c;
  c.ssid = "\"Home\"";
  c.set_key_mgmt(KeyMgmt::WpaPsk);
  EXPECT_EQ(c.config_key(), "\"Home\"WPA_PSK");
  EXPECT_EQ(netsel::wifi::security_label_of(ScanResult{.capabilities="[WPA-PSK-TKIP]"}), "WPA_PSK");
}
