#include "retry/DelayCalculator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

DelayCalculator::DelayCalculator(RetryPolicy policy, unsigned int seed)
    : policy(policy), engine(seed) {
    uniform = [this](double lo, double hi) {
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(engine);
    };
}

DelayCalculator::DelayCalculator(RetryPolicy policy, UniformSource source)
    : policy(policy), uniform(std::move(source)) {}

double DelayCalculator::computeDelay(int attempt, ErrorCategory category) {
    if (attempt < 1) attempt = 1;

    double delay = policy.baseDelay * std::pow(policy.exponentialBase, attempt - 1);
    delay *= categoryMultiplier(category);
    // pow saturates to inf for very large attempts
    if (!std::isfinite(delay) || delay > policy.maxDelay) {
        delay = policy.maxDelay;
    }

    if (policy.jitterFraction > 0.0 && uniform) {
        double offset = uniform(-policy.jitterFraction, policy.jitterFraction);
        delay *= 1.0 + offset;
    }

    if (!std::isfinite(delay)) delay = policy.maxDelay;
    return std::clamp(delay, 0.0, policy.maxDelay);
}

std::string DelayCalculator::formatDuration(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    if (seconds < 60.0) {
        out << seconds << "s";
    } else if (seconds < 3600.0) {
        out << seconds / 60.0 << "m";
    } else {
        out << seconds / 3600.0 << "h";
    }
    return out.str();
}
