/**
* @file observability.cpp
 * @brief LocalLog: bounded ring + counters, optional stderr echo.
 */
#include "netsel/obs/observability.hpp"
#include "netsel/config/constants.hpp"
#include <cstdio>

namespace netsel::obs {

    LocalLog::LocalLog(std::size_t max_lines, bool echo_stderr)
        : max_lines_(max_lines == 0 ? 1 : max_lines), echo_(echo_stderr) {}

    void LocalLog::append_locked(std::string line) {
        if (echo_) {
            std::fprintf(stderr, "%s\n", line.c_str());
            std::fflush(stderr);
        }
        if (lines_.size() == max_lines_) lines_.pop_front();
        lines_.push_back(std::move(line));
    }

    void LocalLog::record(const EvaluationEvent& e) {
        std::lock_guard<std::mutex> lk(mu_);
        ctr_.evaluations++;
        switch (e.outcome) {
            case Outcome::Candidate:         ctr_.candidates++;         break;
            case Outcome::NoEligible:        ctr_.no_eligible++;        break;
            case Outcome::NoRecommendation:  ctr_.no_recommendation++;  break;
            case Outcome::Mismatch:          ctr_.mismatches++;         break;
            case Outcome::PromotionFailed:   ctr_.promotion_failures++; break;
            case Outcome::CommitFailed:      ctr_.commit_failures++;    break;
            case Outcome::CollaboratorFault: ctr_.faults++;             break;
        }
        if (e.promoted) ctr_.promotions++;

        // JSON-ish line
        char buf[512];
        std::snprintf(buf, sizeof(buf),
            R"({"evaluator":"%s","outcome":"%s","eligible":%zu,"network_id":%d,"scan_id":"%s","promoted":%s})",
            e.evaluator.c_str(), to_string(e.outcome), e.eligible, static_cast<int>(e.network_id),
            e.scan_id.c_str(), e.promoted ? "true" : "false");
        append_locked(buf);
    }

    void LocalLog::log(LogLevel level, std::string_view tag, std::string_view msg) {
        std::string line;
        line.reserve(tag.size() + msg.size() + 8);
        line.append(to_string(level)).append(" ").append(tag).append(": ").append(msg);
        std::lock_guard<std::mutex> lk(mu_);
        append_locked(std::move(line));
    }

    void LocalLog::count_score_request(std::size_t keys, std::size_t skipped) {
        std::lock_guard<std::mutex> lk(mu_);
        if (keys > 0) ctr_.score_requests++;
        ctr_.skipped_keys += skipped;
    }

    Counters LocalLog::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    std::vector<std::string> LocalLog::lines() const {
        std::lock_guard<std::mutex> lk(mu_);
        return {lines_.begin(), lines_.end()};
    }

    const char* to_string(Outcome o) noexcept {
        switch (o) {
            case Outcome::Candidate:         return "candidate";
            case Outcome::NoEligible:        return "no_eligible";
            case Outcome::NoRecommendation:  return "no_recommendation";
            case Outcome::Mismatch:          return "mismatch";
            case Outcome::PromotionFailed:   return "promotion_failed";
            case Outcome::CommitFailed:      return "commit_failed";
            case Outcome::CollaboratorFault: return "collaborator_fault";
        }
        return "unknown";
    }

    const char* to_string(LogLevel l) noexcept {
        switch (l) {
            case LogLevel::Debug: return "D";
            case LogLevel::Info:  return "I";
            case LogLevel::Warn:  return "W";
            case LogLevel::Error: return "E";
        }
        return "?";
    }

    std::shared_ptr<Observer> make_simple_observer() {
        // process-wide singleton
        static auto obs = std::make_shared<LocalLog>(config::constants::LOCAL_LOG_LINES_DEFAULT,
                                                     /*echo_stderr=*/true);
        return obs;
    }

} // namespace netsel::obs
