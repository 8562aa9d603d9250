/**
 * @file recommended_network_evaluator.cpp
 * @brief Score refresh, candidate filtering and oracle reconciliation.
 */
#include "netsel/selection/recommended_network_evaluator.hpp"
#include "netsel/wifi/network_key.hpp"
#include "netsel/wifi/scan_result_util.hpp"

#include <exception>
#include <utility>

namespace netsel::selection {

using wifi::kInvalidNetworkId;
using wifi::NetworkId;
using wifi::ScanResult;
using wifi::WifiConfiguration;
using obs::LogLevel;
using obs::Outcome;

RecommendedNetworkEvaluator::RecommendedNetworkEvaluator(std::shared_ptr<NetworkScoreCache> score_cache,
                                                         std::shared_ptr<RecommendationOracle> oracle,
                                                         std::shared_ptr<WifiConfigStore> config_store,
                                                         std::shared_ptr<obs::Observer> observer,
                                                         config::EvaluatorConfig cfg)
    : score_cache_(std::move(score_cache)),
      oracle_(std::move(oracle)),
      config_store_(std::move(config_store)),
      observer_(observer ? std::move(observer) : obs::make_simple_observer()),
      cfg_(std::move(cfg)) {}

void RecommendedNetworkEvaluator::log(LogLevel level, std::string_view msg) const {
    observer_->log(level, cfg_.name, msg);
}

// ---------------- Score refresh ----------------

void RecommendedNetworkEvaluator::update(std::span<const ScanResult> scan_results) {
    try {
        update_network_score_cache(scan_results);
    } catch (const std::exception& e) {
        log(LogLevel::Error, std::string("Score refresh failed: ") + e.what());
    } catch (...) {
        log(LogLevel::Error, "Score refresh failed: unknown error");
    }
}

void RecommendedNetworkEvaluator::update_network_score_cache(std::span<const ScanResult> scan_results) {
    std::vector<wifi::NetworkKey> unscored;
    std::size_t skipped = 0;

    for (const auto& scan : scan_results) {
        if (score_cache_->is_scored_network(scan)) continue;

        auto key = wifi::NetworkKey::from_scan_result(scan);
        if (!key) {
            log(LogLevel::Warn, "Invalid SSID=" + scan.ssid + " BSSID=" + scan.bssid +
                                " for network score (" + wifi::to_string(key.error()) + "). Skip.");
            ++skipped;
            continue;
        }
        unscored.push_back(std::move(*key));
    }

    const auto n = unscored.size();
    if (n > 0) score_cache_->request_scores(std::move(unscored));
    observer_->count_score_request(n, skipped);
}

// ---------------- Candidate filter ----------------

std::vector<ScanResult>
RecommendedNetworkEvaluator::filter_candidates(std::span<ScanResult> scan_results,
                                               bool untrusted_network_allowed) {
    std::vector<ScanResult> out;
    out.reserve(scan_results.size());
    for (auto& scan : scan_results) {
        if (config_store_->was_ephemeral_network_deleted(wifi::quoted_ssid(scan.ssid))) continue;

        scan.untrusted = !config_store_->saved_network_for(scan).has_value();
        if (!untrusted_network_allowed && scan.untrusted) continue;

        out.push_back(scan);
    }
    return out;
}

// ---------------- Evaluation ----------------

std::optional<WifiConfiguration>
RecommendedNetworkEvaluator::evaluate_networks(std::span<ScanResult> scan_results,
                                               const WifiConfiguration* /*current_network*/,
                                               const std::string& /*current_bssid*/,
                                               bool /*connected*/,
                                               bool untrusted_network_allowed) {
    obs::EvaluationEvent ev;
    ev.evaluator = cfg_.name;

    std::optional<WifiConfiguration> chosen;
    try {
        chosen = evaluate_cycle(scan_results, untrusted_network_allowed, ev);
    } catch (const std::exception& e) {
        log(LogLevel::Error, std::string("Evaluation aborted: ") + e.what());
        ev.outcome = Outcome::CollaboratorFault;
        chosen.reset();
    } catch (...) {
        log(LogLevel::Error, "Evaluation aborted: unknown error");
        ev.outcome = Outcome::CollaboratorFault;
        chosen.reset();
    }

    ev.network_id = chosen ? chosen->network_id : kInvalidNetworkId;
    observer_->record(ev);
    return chosen;
}

std::optional<WifiConfiguration>
RecommendedNetworkEvaluator::evaluate_cycle(std::span<ScanResult> scan_results,
                                            bool untrusted_network_allowed,
                                            obs::EvaluationEvent& ev) {
    RecommendationRequest request;
    request.scan_results = filter_candidates(scan_results, untrusted_network_allowed);
    request.timeout = cfg_.oracle_timeout;
    ev.eligible = request.scan_results.size();

    if (request.scan_results.empty()) {
        ev.outcome = Outcome::NoEligible;
        return std::nullopt;
    }

    // TODO: pass the currently recommended network once the oracle request carries it.
    auto result = oracle_->request_recommendation(request);

    if (!result || !result->wifi_configuration) {
        ev.outcome = Outcome::NoRecommendation;
        return std::nullopt;
    }

    WifiConfiguration& recommended = *result->wifi_configuration;
    const ScanResult* scan = find_matching_scan_result(request.scan_results, recommended);
    if (!scan) {
        log(LogLevel::Error, "Could not match recommended network " + recommended.ssid + ":" +
                             recommended.bssid + " to a scan result.");
        ev.outcome = Outcome::Mismatch;
        return std::nullopt;
    }
    ev.scan_id = wifi::to_scan_id(*scan);

    NetworkId network_id = recommended.network_id;
    if (network_id == kInvalidNetworkId) {
        network_id = add_ephemeral_network(recommended, *scan);
        if (network_id == kInvalidNetworkId) {
            ev.outcome = Outcome::PromotionFailed;
            return std::nullopt;
        }
        ev.promoted = true;
    }

    if (!config_store_->set_network_candidate_scan_result(network_id, *scan, cfg_.candidate_score)) {
        log(LogLevel::Error, "Failed to set candidate for networkId " + std::to_string(network_id));
        ev.outcome = Outcome::CommitFailed;
        return std::nullopt;
    }
    auto configured = config_store_->configured_network(network_id);
    if (!configured) {
        log(LogLevel::Error, "networkId " + std::to_string(network_id) + " vanished after commit");
        ev.outcome = Outcome::CommitFailed;
        return std::nullopt;
    }

    ev.outcome = Outcome::Candidate;
    return configured;
}

// ---------------- Reconciliation ----------------

const ScanResult*
RecommendedNetworkEvaluator::find_matching_scan_result(std::span<const ScanResult> scan_results,
                                                       const WifiConfiguration& config) {
    const std::string ssid = wifi::remove_double_quotes(config.ssid);
    for (const auto& scan : scan_results) {
        if (scan.ssid == ssid && scan.bssid == config.bssid) return &scan;
    }
    return nullptr;
}

NetworkId RecommendedNetworkEvaluator::add_ephemeral_network(WifiConfiguration& config,
                                                             const ScanResult& scan) {
    if (config.allowed_key_management.none()) {
        wifi::set_allowed_key_management_from_scan_result(scan, config);
    }
    config.ephemeral = true;

    auto added = config_store_->add_or_update_network(config, cfg_.system_uid);
    if (added) return *added;

    log(LogLevel::Warn, "Failed to add ephemeral network for networkId: " + wifi::to_scan_id(scan) +
                        " (" + to_string(added.error()) + ")");
    return kInvalidNetworkId;
}

} // namespace netsel::selection
