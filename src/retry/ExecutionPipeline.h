#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "retry/RetryPolicy.h"
#include "retry/ErrorClassifier.h"
#include "retry/DelayCalculator.h"
#include "retry/RetryStatistics.h"

/**
 * @brief One attempted call of a work unit.
 */
struct RetryAttempt {
    enum class Outcome { Retrying, Succeeded, Failed };

    int attemptNumber = 0;
    std::string errorMessage;
    ErrorCategory category = ErrorCategory::NonRetryable;
    std::string matchedPattern;
    double delaySeconds = 0.0;
    Outcome outcome = Outcome::Retrying;

    nlohmann::json toJson() const;
};

struct ExecutionResult {
    bool succeeded = false;
    nlohmann::json result;
    std::string error;
    int attempts = 0;
    bool retryable = false;
    // true when a retryable error survived every allowed attempt
    bool exhausted = false;
    ErrorCategory category = ErrorCategory::NonRetryable;
    std::string matchedPattern;
    std::vector<RetryAttempt> history;

    /**
     * @brief Failure payload surfaced to protocol clients.
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Drives a single invocation through attempt / backoff / retry.
 *
 * Running -> Succeeded
 * Running -> Failed        (non-retryable, or last attempt)
 * Running -> Waiting -> Running
 *
 * The wait blocks the calling thread (the session) for the computed delay.
 */
class ExecutionPipeline {
public:
    enum class State { Running, Waiting, Succeeded, Failed };

    struct Event {
        State state;
        int attemptNumber;
        std::string error;
        std::string matchedPattern;
        double delaySeconds;
    };

    // Throws, or returns an object with a string "error" member, to fail
    using WorkUnit = std::function<nlohmann::json()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using EventListener = std::function<void(const Event&)>;

    ExecutionPipeline(RetryPolicy policy, RetryStatistics& statistics);
    ExecutionPipeline(RetryPolicy policy, RetryStatistics& statistics,
                      ErrorClassifier classifier, DelayCalculator::UniformSource jitterSource);

    ExecutionResult execute(const WorkUnit& work, const std::string& label = "invocation");

    void setSleeper(Sleeper s) { sleeper = std::move(s); }
    void setEventListener(EventListener l) { listener = std::move(l); }

    const RetryPolicy& getPolicy() const { return policy; }
    const RetryStatistics& getStatistics() const { return statistics; }
    const ErrorClassifier& getClassifier() const { return classifier; }

    static std::string stateName(State state);

    /**
     * @brief Run the unit once, outside any retry loop.
     * @return false, with error set, when the unit threw or returned an error object
     */
    static bool attemptOnce(const WorkUnit& work, nlohmann::json& result, std::string& error);

private:
    RetryPolicy policy;
    RetryStatistics& statistics;
    ErrorClassifier classifier;
    DelayCalculator delays;
    Sleeper sleeper;
    EventListener listener;

    void emit(State state, int attempt, const std::string& error = "",
              const std::string& pattern = "", double delay = 0.0);
};
