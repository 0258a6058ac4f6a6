#pragma once
#include <string>
#include <functional>
#include <random>
#include "retry/RetryPolicy.h"
#include "retry/ErrorClassifier.h"

/**
 * @brief Computes bounded, jittered backoff delays.
 *
 * delay = clamp(base * exp^(attempt-1) * multiplier, maxDelay)
 *         * (1 + U(-jitter, +jitter)), clamped to [0, maxDelay]
 */
class DelayCalculator {
public:
    // Returns a uniform sample in [lo, hi]
    using UniformSource = std::function<double(double lo, double hi)>;

    explicit DelayCalculator(RetryPolicy policy, unsigned int seed = std::random_device{}());
    DelayCalculator(RetryPolicy policy, UniformSource source);

    // The default source is bound to this instance's engine
    DelayCalculator(const DelayCalculator&) = delete;
    DelayCalculator& operator=(const DelayCalculator&) = delete;

    /**
     * @brief Delay in seconds before the retry that follows a failed attempt.
     * @param attempt 1-based number of the attempt that just failed
     */
    double computeDelay(int attempt, ErrorCategory category);

    const RetryPolicy& getPolicy() const { return policy; }

    /**
     * @brief Human-readable duration: "30.0s", "1.5m", "2.0h".
     */
    static std::string formatDuration(double seconds);

private:
    RetryPolicy policy;
    std::mt19937 engine;
    UniformSource uniform;
};
