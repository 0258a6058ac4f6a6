#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief Immutable retry configuration.
 *
 * Delays are expressed in seconds.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    double baseDelay = 60.0;
    double maxDelay = 3600.0;
    double exponentialBase = 2.0;
    double jitterFraction = 0.1;

    // Upper bound for max_delay (about 31 years); keeps waits representable
    static constexpr double kDelayLimit = 1e9;

    /**
     * @brief Throws std::invalid_argument naming the first violated bound.
     */
    void validate() const {
        if (maxAttempts < 1) {
            throw std::invalid_argument("max_attempts must be >= 1, got " + std::to_string(maxAttempts));
        }
        if (!(baseDelay > 0.0)) {
            throw std::invalid_argument("base_delay must be > 0, got " + std::to_string(baseDelay));
        }
        if (!(maxDelay >= baseDelay)) {
            throw std::invalid_argument("max_delay must be >= base_delay, got " + std::to_string(maxDelay));
        }
        if (!(maxDelay <= kDelayLimit)) {
            throw std::invalid_argument("max_delay must be <= " + std::to_string(kDelayLimit) +
                                        ", got " + std::to_string(maxDelay));
        }
        if (!(exponentialBase > 1.0)) {
            throw std::invalid_argument("exponential_base must be > 1, got " + std::to_string(exponentialBase));
        }
        if (!(jitterFraction >= 0.0 && jitterFraction < 1.0)) {
            throw std::invalid_argument("jitter must be in [0, 1), got " + std::to_string(jitterFraction));
        }
    }

    nlohmann::json toJson() const {
        return {
            {"max_attempts", maxAttempts},
            {"base_delay", baseDelay},
            {"max_delay", maxDelay},
            {"exponential_base", exponentialBase},
            {"jitter", jitterFraction}
        };
    }
};
