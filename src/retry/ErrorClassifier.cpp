#include "retry/ErrorClassifier.h"
#include <algorithm>
#include <cctype>

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}
} // namespace

std::string categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::QuotaLimit: return "quota-limit";
        case ErrorCategory::OverloadQueued: return "overload-queued";
        case ErrorCategory::GenericTransient: return "generic-transient";
        case ErrorCategory::NonRetryable: return "non-retryable";
    }
    return "non-retryable";
}

double categoryMultiplier(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::QuotaLimit: return 1.5;
        case ErrorCategory::OverloadQueued: return 0.75;
        default: return 1.0;
    }
}

std::vector<ErrorClassifier::Signature> ErrorClassifier::defaultSignatures() {
    const ErrorCategory quota = ErrorCategory::QuotaLimit;
    const ErrorCategory overload = ErrorCategory::OverloadQueued;
    const ErrorCategory transient = ErrorCategory::GenericTransient;

    return {
        // Quota and rate limits
        {"usage limit", quota},
        {"quota exceeded", quota},
        {"usage quota", quota},
        {"rate limit", quota},
        {"rate_limit_error", quota},
        {"too many requests", quota},
        {"monthly limit exceeded", quota},
        {"daily limit exceeded", quota},
        {"credit limit", quota},
        {"tokens per minute", quota},
        {"requests per minute", quota},
        {"quota", quota},

        // Provider overload
        {"overloaded_error", overload},
        {"service temporarily overloaded", overload},
        {"overloaded", overload},
        {"request queued", overload},
        {"queued", overload},

        // HTTP status codes
        {"429", transient},
        {"502", transient},
        {"503", transient},
        {"504", transient},
        {"524", transient},

        // Network and timeouts
        {"timeout", transient},
        {"timed out", transient},
        {"connection error", transient},
        {"connection reset", transient},
        {"connection refused", transient},
        {"network error", transient},
        {"ssl error", transient},

        // Generic server errors
        {"internal server error", transient},
        {"bad gateway", transient},
        {"gateway timeout", transient},
        {"service unavailable", transient},
        {"service temporarily unavailable", transient},
    };
}

ErrorClassifier::ErrorClassifier() : ErrorClassifier(defaultSignatures()) {}

ErrorClassifier::ErrorClassifier(std::vector<Signature> signatures) {
    table.reserve(signatures.size());
    for (auto& sig : signatures) {
        if (sig.pattern.empty()) continue;
        sig.pattern = toLower(sig.pattern);
        table.push_back(std::move(sig));
    }
}

ErrorClassifier::Classification ErrorClassifier::classify(const std::string& message) const {
    Classification result;
    if (message.empty()) return result;

    std::string lowered = toLower(message);
    auto it = std::find_if(table.begin(), table.end(), [&](const Signature& sig) {
        return lowered.find(sig.pattern) != std::string::npos;
    });
    if (it == table.end()) return result;

    result.retryable = it->category != ErrorCategory::NonRetryable;
    result.category = it->category;
    result.pattern = it->pattern;
    return result;
}
