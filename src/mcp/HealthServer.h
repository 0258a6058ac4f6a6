#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

/**
 * @brief HTTP liveness endpoint (GET /health) on a background thread.
 */
class HealthServer {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    HealthServer(const std::string& transportName, StatusProvider statusProvider);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    /**
     * @brief Bind 0.0.0.0:port and start serving.
     * @throws std::runtime_error if the port cannot be bound
     */
    void start(int port);
    void stop();

    bool isRunning() const { return worker.joinable(); }
    int getPort() const { return port; }

    /**
     * @brief Body served on /health.
     */
    nlohmann::json healthJson() const;

private:
    std::string transportName;
    StatusProvider statusProvider;
    std::chrono::steady_clock::time_point startedAt;
    std::unique_ptr<httplib::Server> server;
    std::thread worker;
    int port = 0;
};
