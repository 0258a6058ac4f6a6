#pragma once
#include <string>
#include <stdexcept>

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

struct BackendRequest {
    std::string prompt;
    std::string workingDirectory;
};

/**
 * @brief Upstream AI coding backend.
 *
 * run() returns the backend's answer, or throws BackendError carrying the
 * upstream error text so it can be classified for retry.
 */
class ICodingBackend {
public:
    virtual ~ICodingBackend() = default;

    virtual std::string name() const = 0;
    virtual std::string run(const BackendRequest& request) = 0;
};
