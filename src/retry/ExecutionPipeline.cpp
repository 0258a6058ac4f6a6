#include "retry/ExecutionPipeline.h"
#include "utils/Logger.h"
#include <algorithm>
#include <thread>

namespace {
const char* outcomeName(RetryAttempt::Outcome outcome) {
    switch (outcome) {
        case RetryAttempt::Outcome::Retrying: return "retrying";
        case RetryAttempt::Outcome::Succeeded: return "succeeded";
        case RetryAttempt::Outcome::Failed: return "failed";
    }
    return "failed";
}

void defaultSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

// Saturating seconds -> milliseconds conversion
std::chrono::milliseconds toWait(double seconds) {
    double clamped = std::min(std::max(seconds, 0.0), RetryPolicy::kDelayLimit);
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(clamped));
}
} // namespace

nlohmann::json RetryAttempt::toJson() const {
    return {
        {"attempt", attemptNumber},
        {"error", errorMessage},
        {"category", categoryName(category)},
        {"pattern", matchedPattern},
        {"delay_seconds", delaySeconds},
        {"outcome", outcomeName(outcome)}
    };
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j = {
        {"status", succeeded ? "success" : "error"},
        {"attempts", attempts},
        {"retryable", retryable},
        {"exhausted", exhausted},
        {"category", categoryName(category)},
        {"pattern", matchedPattern}
    };
    if (!succeeded) {
        j["error"] = error;
    }
    if (!history.empty()) {
        nlohmann::json h = nlohmann::json::array();
        for (const auto& a : history) h.push_back(a.toJson());
        j["history"] = h;
    }
    return j;
}

ExecutionPipeline::ExecutionPipeline(RetryPolicy policy, RetryStatistics& statistics)
    : policy(policy), statistics(statistics), delays(policy), sleeper(defaultSleep) {
    policy.validate();
}

ExecutionPipeline::ExecutionPipeline(RetryPolicy policy, RetryStatistics& statistics,
                                     ErrorClassifier classifier,
                                     DelayCalculator::UniformSource jitterSource)
    : policy(policy), statistics(statistics), classifier(std::move(classifier)),
      delays(policy, std::move(jitterSource)), sleeper(defaultSleep) {
    policy.validate();
}

std::string ExecutionPipeline::stateName(State state) {
    switch (state) {
        case State::Running: return "running";
        case State::Waiting: return "waiting";
        case State::Succeeded: return "succeeded";
        case State::Failed: return "failed";
    }
    return "failed";
}

void ExecutionPipeline::emit(State state, int attempt, const std::string& error,
                             const std::string& pattern, double delay) {
    if (listener) {
        listener(Event{state, attempt, error, pattern, delay});
    }
}

bool ExecutionPipeline::attemptOnce(const WorkUnit& work, nlohmann::json& result, std::string& error) {
    try {
        result = work();
    } catch (const std::exception& e) {
        error = e.what();
        if (error.empty()) error = "Unknown error";
        return false;
    }

    if (result.is_object() && result.contains("error") && result["error"].is_string()) {
        error = result["error"].get<std::string>();
        if (error.empty()) error = "Unknown error";
        return false;
    }
    return true;
}

ExecutionResult ExecutionPipeline::execute(const WorkUnit& work, const std::string& label) {
    auto& log = Logger::getInstance();
    ExecutionResult outcome;

    int attempt = 1;
    while (true) {
        emit(State::Running, attempt);
        log.debug(label + ": attempt " + std::to_string(attempt) + "/" + std::to_string(policy.maxAttempts));

        statistics.recordAttempt();
        nlohmann::json result;
        std::string error;
        bool ok = attemptOnce(work, result, error);
        outcome.attempts = attempt;
        bool retried = attempt > 1;

        if (ok) {
            statistics.recordSuccess(retried);
            outcome.succeeded = true;
            outcome.result = std::move(result);
            RetryAttempt record;
            record.attemptNumber = attempt;
            record.outcome = RetryAttempt::Outcome::Succeeded;
            outcome.history.push_back(record);

            emit(State::Succeeded, attempt);
            if (retried) {
                log.success(label + " succeeded after " + std::to_string(attempt) + " attempts");
            }
            return outcome;
        }

        auto classification = classifier.classify(error);
        outcome.error = error;
        outcome.retryable = classification.retryable;
        outcome.category = classification.category;
        outcome.matchedPattern = classification.pattern;

        RetryAttempt record;
        record.attemptNumber = attempt;
        record.errorMessage = error;
        record.category = classification.category;
        record.matchedPattern = classification.pattern;

        if (!classification.retryable || attempt >= policy.maxAttempts) {
            outcome.exhausted = classification.retryable;
            record.outcome = RetryAttempt::Outcome::Failed;
            outcome.history.push_back(record);
            statistics.recordFailure(retried);

            emit(State::Failed, attempt, error, classification.pattern);
            if (classification.retryable) {
                log.error(label + " failed after " + std::to_string(attempt) + " attempts ('" +
                          classification.pattern + "'): " + error);
            } else {
                log.error(label + " failed with non-retryable error: " + error);
            }
            return outcome;
        }

        double delay = delays.computeDelay(attempt, classification.category);
        record.delaySeconds = delay;
        record.outcome = RetryAttempt::Outcome::Retrying;
        outcome.history.push_back(record);
        statistics.recordRetry(classification.pattern);

        emit(State::Waiting, attempt, error, classification.pattern, delay);
        log.warn(label + " attempt " + std::to_string(attempt) + "/" + std::to_string(policy.maxAttempts) +
                 " failed (" + categoryName(classification.category) + ", '" + classification.pattern +
                 "'): " + error + ". Retrying in " + DelayCalculator::formatDuration(delay));

        if (sleeper) {
            sleeper(toWait(delay));
        }
        attempt++;
    }
}
