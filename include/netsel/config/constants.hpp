#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the evaluator and its collaborators.
 * @details Override through the config Loader (JSON) in deployments.
 */

#include <cstddef>
#include <cstdint>

namespace netsel::config::constants {

// =====================
// Evaluator identity
// =====================
/// Tag reported by RecommendedNetworkEvaluator::name() and used in log lines.
inline constexpr const char* EVALUATOR_NAME_DEFAULT = "RecNetEvaluator";

/// System principal owning ephemeral networks (Android AID_WIFI).
inline constexpr int32_t SYSTEM_UID_DEFAULT = 1010;

/// Score attached to the candidate scan result when committing a recommendation.
inline constexpr int32_t CANDIDATE_SCORE_DEFAULT = 0;

/// Upper bound for one oracle round trip. 0 disables the local deadline.
inline constexpr uint32_t ORACLE_TIMEOUT_MS_DEFAULT = 1000;

// =====================
// Local log
// =====================
inline constexpr std::size_t LOCAL_LOG_LINES_DEFAULT = 256;   ///< Ring capacity
inline constexpr std::size_t LOCAL_LOG_LINES_MAX     = 65536; ///< Config ceiling
inline constexpr bool        LOG_TO_STDERR_DEFAULT   = true;

// =====================
// 802.11 identity limits
// =====================
inline constexpr std::size_t SSID_MAX_OCTETS = 32; ///< IEEE 802.11 SSID length
inline constexpr std::size_t BSSID_TEXT_LEN  = 17; ///< "xx:xx:xx:xx:xx:xx"

// =====================
// Reference collaborators
// =====================
inline constexpr std::size_t CONFIG_STORE_MAX_NETWORKS   = 512; ///< Saved + ephemeral
inline constexpr std::size_t SCORE_CACHE_MAX_PENDING     = 64;  ///< Pending request batches
inline constexpr int32_t     SIM_ORACLE_MIN_RATING       = 0;   ///< Ratings below are ignored

} // namespace netsel::config::constants
