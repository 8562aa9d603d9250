#pragma once
/**
 * @file recommended_network_evaluator.hpp
 * @brief Evaluator deferring the choice to an external recommendation oracle.
 * @details Per cycle: request missing scores (update), filter by deletion and
 *          trust state, ask the oracle, match its answer to a scan result,
 *          promote unknown networks to ephemeral profiles, commit the candidate.
 *          Every failure ends the cycle with std::nullopt.
 */

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "netsel/config/config_loader.hpp"
#include "netsel/obs/observability.hpp"
#include "netsel/selection/network_evaluator.hpp"
#include "netsel/selection/network_score_cache.hpp"
#include "netsel/selection/recommendation_oracle.hpp"
#include "netsel/selection/wifi_config_store.hpp"

namespace netsel::selection {

class RecommendedNetworkEvaluator final : public NetworkEvaluator {
public:
    /**
     * @param score_cache Score cache; receives batched score requests.
     * @param oracle Recommendation oracle, called once per evaluation.
     * @param config_store Profile store; only read, created or annotated.
     * @param observer Log and event sink.
     * @param cfg Name, system uid, candidate score and oracle timeout.
     */
    RecommendedNetworkEvaluator(std::shared_ptr<NetworkScoreCache> score_cache,
                                std::shared_ptr<RecommendationOracle> oracle,
                                std::shared_ptr<WifiConfigStore> config_store,
                                std::shared_ptr<obs::Observer> observer,
                                config::EvaluatorConfig cfg = config::Loader::defaults());

    void update(std::span<const wifi::ScanResult> scan_results) override;

    std::optional<wifi::WifiConfiguration>
    evaluate_networks(std::span<wifi::ScanResult> scan_results,
                      const wifi::WifiConfiguration* current_network,
                      const std::string& current_bssid,
                      bool connected,
                      bool untrusted_network_allowed) override;

    std::string_view name() const noexcept override { return cfg_.name; }

    const config::EvaluatorConfig& config() const noexcept { return cfg_; }

private:
    /// Issue one score request for every unscored, well-formed scan result.
    void update_network_score_cache(std::span<const wifi::ScanResult> scan_results);

    /// Drop deleted ephemeral networks, tag trust, drop untrusted unless allowed.
    std::vector<wifi::ScanResult> filter_candidates(std::span<wifi::ScanResult> scan_results,
                                                    bool untrusted_network_allowed);

    std::optional<wifi::WifiConfiguration> evaluate_cycle(std::span<wifi::ScanResult> scan_results,
                                                          bool untrusted_network_allowed,
                                                          obs::EvaluationEvent& ev);

    static const wifi::ScanResult* find_matching_scan_result(std::span<const wifi::ScanResult> scan_results,
                                                             const wifi::WifiConfiguration& config);

    /// Persist @p config as an ephemeral profile. kInvalidNetworkId on failure.
    wifi::NetworkId add_ephemeral_network(wifi::WifiConfiguration& config,
                                          const wifi::ScanResult& scan);

    void log(obs::LogLevel level, std::string_view msg) const;

private:
    std::shared_ptr<NetworkScoreCache>    score_cache_;
    std::shared_ptr<RecommendationOracle> oracle_;
    std::shared_ptr<WifiConfigStore>      config_store_;
    std::shared_ptr<obs::Observer>        observer_;
    config::EvaluatorConfig               cfg_;
};

} // namespace netsel::selection
