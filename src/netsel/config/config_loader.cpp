/**
* @file config_loader.cpp
 * @brief JSON loader over the named defaults.
 */
#include "netsel/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace netsel::config {
    using json = nlohmann::json;
    using namespace netsel::config::constants;

    namespace {

    // Reads obj[key] into out when present. False on a type or range violation.
    template <class T>
    bool read_int(const json& obj, const char* key, T& out, T lo, T hi) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_number_integer()) return false;
        const auto v = it->get<int64_t>();
        if (v < static_cast<int64_t>(lo) || v > static_cast<int64_t>(hi)) return false;
        out = static_cast<T>(v);
        return true;
    }

    bool read_bool(const json& obj, const char* key, bool& out) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_boolean()) return false;
        out = it->get<bool>();
        return true;
    }

    bool read_string(const json& obj, const char* key, std::string& out) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_string()) return false;
        auto s = it->get<std::string>();
        if (s.empty()) return false;
        out = std::move(s);
        return true;
    }

    bool apply_evaluator(const json& ev, EvaluatorConfig& cfg) {
        if (!ev.is_object()) return false;
        uint32_t timeout_ms = static_cast<uint32_t>(cfg.oracle_timeout.count());
        const bool ok =
            read_string(ev, "name", cfg.name) &&
            read_int<int32_t>(ev, "system_uid", cfg.system_uid, 0, std::numeric_limits<int32_t>::max()) &&
            read_int<int32_t>(ev, "candidate_score", cfg.candidate_score,
                              std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()) &&
            read_int<uint32_t>(ev, "oracle_timeout_ms", timeout_ms, 0, std::numeric_limits<uint32_t>::max());
        cfg.oracle_timeout = std::chrono::milliseconds{timeout_ms};
        return ok;
    }

    bool apply_log(const json& lg, EvaluatorConfig& cfg) {
        if (!lg.is_object()) return false;
        return read_int<std::size_t>(lg, "max_lines", cfg.local_log_lines, 1, LOCAL_LOG_LINES_MAX) &&
               read_bool(lg, "stderr", cfg.log_to_stderr);
    }

    } // namespace

    EvaluatorConfig Loader::defaults() {
        return EvaluatorConfig{};
    }

    netsel_detail::expected<EvaluatorConfig, ConfigError>
    Loader::load_from_string(std::string_view text) {
        const json doc = json::parse(text.begin(), text.end(), /*cb=*/nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded()) return netsel_detail::unexpected<ConfigError>(ConfigError::ParseError);
        if (!doc.is_object())   return netsel_detail::unexpected<ConfigError>(ConfigError::InvalidValue);

        EvaluatorConfig cfg = defaults();
        if (const auto it = doc.find("evaluator"); it != doc.end() && !apply_evaluator(*it, cfg)) {
            return netsel_detail::unexpected<ConfigError>(ConfigError::InvalidValue);
        }
        if (const auto it = doc.find("log"); it != doc.end() && !apply_log(*it, cfg)) {
            return netsel_detail::unexpected<ConfigError>(ConfigError::InvalidValue);
        }
        return cfg;
    }

    netsel_detail::expected<EvaluatorConfig, ConfigError>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return netsel_detail::unexpected<ConfigError>(ConfigError::NotFound);
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_string(ss.str());
    }

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::NotFound:     return "not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

} // namespace netsel::config
