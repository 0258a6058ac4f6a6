#include "retry/RetryStatistics.h"
#include "utils/Logger.h"
#include <iomanip>
#include <sstream>

double RetryStatistics::Snapshot::successRate() const {
    long long completed = successfulInvocations + failedInvocations;
    if (completed == 0) return 0.0;
    return 100.0 * static_cast<double>(successfulInvocations) / static_cast<double>(completed);
}

void RetryStatistics::recordAttempt() {
    std::lock_guard<std::mutex> lock(mtx);
    stats.totalAttempts++;
}

void RetryStatistics::recordRetry(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mtx);
    stats.patternFrequency[pattern]++;
}

void RetryStatistics::recordSuccess(bool retried) {
    std::lock_guard<std::mutex> lock(mtx);
    stats.successfulInvocations++;
    if (retried) stats.retriedInvocations++;
}

void RetryStatistics::recordFailure(bool retried) {
    std::lock_guard<std::mutex> lock(mtx);
    stats.failedInvocations++;
    if (retried) stats.retriedInvocations++;
}

RetryStatistics::Snapshot RetryStatistics::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return stats;
}

nlohmann::json RetryStatistics::summary() const {
    Snapshot s = snapshot();

    nlohmann::json patterns = nlohmann::json::object();
    for (const auto& [pattern, count] : s.patternFrequency) {
        patterns[pattern] = count;
    }

    return {
        {"total_attempts", s.totalAttempts},
        {"successful_invocations", s.successfulInvocations},
        {"failed_invocations", s.failedInvocations},
        {"retried_invocations", s.retriedInvocations},
        {"success_rate", s.successRate()},
        {"error_patterns", patterns}
    };
}

void RetryStatistics::logSummary() const {
    Snapshot s = snapshot();
    if (s.successfulInvocations + s.failedInvocations == 0) {
        Logger::getInstance().info("Retry summary: no invocations completed");
        return;
    }

    std::ostringstream out;
    out << "Retry summary\n"
        << "  attempts:   " << s.totalAttempts << "\n"
        << "  succeeded:  " << s.successfulInvocations << "\n"
        << "  failed:     " << s.failedInvocations << "\n"
        << "  retried:    " << s.retriedInvocations << "\n"
        << "  success:    " << std::fixed << std::setprecision(1) << s.successRate() << "%";
    for (const auto& [pattern, count] : s.patternFrequency) {
        out << "\n  pattern '" << pattern << "': " << count;
    }
    Logger::getInstance().info(out.str());
}
