#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: evaluation events, log lines and counters.
 * @details LocalLog keeps a bounded ring of recent lines for dumps and can echo
 *          them to stderr.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace netsel::obs {

    /** @enum LogLevel
     *  @brief Severity of a log line.
     */
    enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

    /** @enum Outcome
     *  @brief How a single evaluation cycle ended.
     */
    enum class Outcome : uint8_t {
        Candidate,         ///< A profile was returned
        NoEligible,        ///< Filter left nothing to recommend from
        NoRecommendation,  ///< Oracle had no answer (or an empty one)
        Mismatch,          ///< Answer matched no scan result
        PromotionFailed,   ///< Ephemeral profile could not be created
        CommitFailed,      ///< Store rejected the candidate or lost the profile
        CollaboratorFault  ///< A collaborator threw
    };

    /** @struct Counters
     *  @brief Process-level counters for evaluator activity.
     */
    struct Counters {
        uint64_t evaluations{0};        ///< Total cycles recorded
        uint64_t candidates{0};         ///< Cycles that returned a profile
        uint64_t no_eligible{0};        ///< Empty filter output
        uint64_t no_recommendation{0};  ///< Oracle declined
        uint64_t mismatches{0};         ///< Unmatched oracle answers
        uint64_t promotion_failures{0}; ///< Failed ephemeral creations
        uint64_t commit_failures{0};    ///< Failed candidate commits
        uint64_t faults{0};             ///< Collaborator exceptions
        uint64_t promotions{0};         ///< Ephemeral profiles created or refreshed
        uint64_t score_requests{0};     ///< Batched score requests issued
        uint64_t skipped_keys{0};       ///< Scan results skipped for invalid identity
    };

    /** @struct EvaluationEvent
     *  @brief Payload describing one evaluation cycle.
     */
    struct EvaluationEvent {
        std::string evaluator;            ///< Evaluator name
        Outcome     outcome{Outcome::NoEligible};
        std::size_t eligible{0};          ///< Scan results handed to the oracle
        int32_t     network_id{-1};       ///< Returned profile id, -1 if none
        std::string scan_id;              ///< "<ssid>:<bssid>" of the matched result
        bool        promoted{false};      ///< Ephemeral profile written this cycle
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single evaluation event.
        virtual void record(const EvaluationEvent& e) = 0;
        /// Append a log line.
        virtual void log(LogLevel level, std::string_view tag, std::string_view msg) = 0;
        /// Count a batched score request of @p keys keys and @p skipped skipped results.
        virtual void count_score_request(std::size_t keys, std::size_t skipped) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class LocalLog
     *  @brief Bounded in-memory log plus counters. Thread-safe.
     */
    class LocalLog final : public Observer {
    public:
        /**
         * @param max_lines Ring capacity; the oldest line is dropped when full.
         * @param echo_stderr Also print each line to stderr.
         */
        explicit LocalLog(std::size_t max_lines, bool echo_stderr = false);

        void record(const EvaluationEvent& e) override;
        void log(LogLevel level, std::string_view tag, std::string_view msg) override;
        void count_score_request(std::size_t keys, std::size_t skipped) override;
        Counters snapshot() const override;

        /// Copy of the retained lines, oldest first.
        std::vector<std::string> lines() const;

        std::size_t capacity() const noexcept { return max_lines_; }

    private:
        void append_locked(std::string line);

        mutable std::mutex mu_;
        std::size_t max_lines_;
        bool echo_;
        std::deque<std::string> lines_;
        Counters ctr_;
    };

    /// Label for an outcome ("candidate", "no_eligible", ...).
    const char* to_string(Outcome o) noexcept;
    const char* to_string(LogLevel l) noexcept;

    // Process-wide default sink echoing to stderr.
    std::shared_ptr<Observer> make_simple_observer();

} // namespace netsel::obs
