#pragma once
#include <string>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

/**
 * @brief Accumulated retry outcomes for the lifetime of the process.
 *
 * Updated by the execution pipeline, read by reporting callers (status
 * resource, health endpoint) from other threads. Never reset implicitly.
 */
class RetryStatistics {
public:
    struct Snapshot {
        long long totalAttempts = 0;
        long long successfulInvocations = 0;
        long long failedInvocations = 0;
        long long retriedInvocations = 0;
        std::map<std::string, long long> patternFrequency;

        double successRate() const;
    };

    RetryStatistics() = default;
    RetryStatistics(const RetryStatistics&) = delete;
    RetryStatistics& operator=(const RetryStatistics&) = delete;

    void recordAttempt();
    void recordRetry(const std::string& pattern);
    void recordSuccess(bool retried);
    void recordFailure(bool retried);

    Snapshot snapshot() const;

    /**
     * @brief JSON view:
     * {
     *   "total_attempts", "successful_invocations", "failed_invocations",
     *   "retried_invocations", "success_rate", "error_patterns": {pattern: count}
     * }
     */
    nlohmann::json summary() const;

    void logSummary() const;

private:
    mutable std::mutex mtx;
    Snapshot stats;
};
