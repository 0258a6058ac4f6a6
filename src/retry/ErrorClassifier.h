#pragma once
#include <string>
#include <vector>

enum class ErrorCategory {
    QuotaLimit,
    OverloadQueued,
    GenericTransient,
    NonRetryable
};

/**
 * @brief Stable wire name ("quota-limit", "overload-queued", ...).
 */
std::string categoryName(ErrorCategory category);

/**
 * @brief Delay multiplier applied on top of the exponential backoff.
 */
double categoryMultiplier(ErrorCategory category);

/**
 * @brief Maps upstream error messages to retry decisions.
 *
 * The pattern table is scanned in declared order and the first
 * case-insensitive substring match wins, so a message carrying several
 * signatures always resolves the same way.
 */
class ErrorClassifier {
public:
    struct Signature {
        std::string pattern;  // lower-case
        ErrorCategory category;
    };

    struct Classification {
        bool retryable = false;
        ErrorCategory category = ErrorCategory::NonRetryable;
        std::string pattern;
    };

    ErrorClassifier();
    explicit ErrorClassifier(std::vector<Signature> signatures);

    Classification classify(const std::string& message) const;

    const std::vector<Signature>& signatures() const { return table; }

    static std::vector<Signature> defaultSignatures();

private:
    std::vector<Signature> table;
};
