#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON document.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "netsel/compat/expected.hpp"
#include "netsel/config/constants.hpp"

namespace netsel::config {

    /** @struct EvaluatorConfig
     *  @brief Settings injected into RecommendedNetworkEvaluator and its log.
     */
    struct EvaluatorConfig {
        std::string name{constants::EVALUATOR_NAME_DEFAULT};          ///< Diagnostic tag
        int32_t     system_uid{constants::SYSTEM_UID_DEFAULT};        ///< Owner of ephemeral profiles
        int32_t     candidate_score{constants::CANDIDATE_SCORE_DEFAULT}; ///< Score passed on commit
        std::chrono::milliseconds oracle_timeout{constants::ORACLE_TIMEOUT_MS_DEFAULT}; ///< Passed to the oracle; 0 = no deadline
        std::size_t local_log_lines{constants::LOCAL_LOG_LINES_DEFAULT}; ///< LocalLog capacity
        bool        log_to_stderr{constants::LOG_TO_STDERR_DEFAULT};  ///< Echo log lines
    };

    /// Reasons a configuration document is rejected.
    enum class ConfigError : uint8_t {
        NotFound = 1, ///< File missing or unreadable
        ParseError,   ///< Not valid JSON
        InvalidValue  ///< Wrong type or out-of-range value
    };

    /** @class Loader
     *  @brief Source of evaluator configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Named defaults only.
        static EvaluatorConfig defaults();

        /**
         * @brief Parse a JSON document. Missing keys keep their defaults.
         * @param json Document text.
         */
        static netsel_detail::expected<EvaluatorConfig, ConfigError>
        load_from_string(std::string_view json);

        /**
         * @brief Read and parse a JSON file.
         * @param path File path.
         */
        static netsel_detail::expected<EvaluatorConfig, ConfigError>
        load_from_file(const std::string& path);
    };

    const char* to_string(ConfigError e) noexcept;

} // namespace netsel::config
