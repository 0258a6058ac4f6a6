#include "mcp/HealthServer.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <stdexcept>

HealthServer::HealthServer(const std::string& transportName, StatusProvider statusProvider)
    : transportName(transportName), statusProvider(std::move(statusProvider)),
      startedAt(std::chrono::steady_clock::now()) {}

HealthServer::~HealthServer() {
    stop();
}

nlohmann::json HealthServer::healthJson() const {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startedAt).count();

    nlohmann::json body = {
        {"status", "healthy"},
        {"service", "vibeteam-mcp"},
        {"uptime_seconds", uptime},
        {"transport", transportName}
    };
    if (statusProvider) {
        nlohmann::json extra = statusProvider();
        if (extra.is_object()) body.update(extra);
    }
    return body;
}

void HealthServer::start(int requestedPort) {
    if (server) return;

    server = std::make_unique<httplib::Server>();
    server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(healthJson().dump(), "application/json");
    });

    if (requestedPort == 0) {
        port = server->bind_to_any_port("0.0.0.0");
    } else {
        port = server->bind_to_port("0.0.0.0", requestedPort) ? requestedPort : -1;
    }
    if (port <= 0) {
        server.reset();
        throw std::runtime_error("Cannot bind health endpoint on port " + std::to_string(requestedPort));
    }

    worker = std::thread([this]() {
        if (!server->listen_after_bind()) {
            Logger::getInstance().error("Health endpoint stopped unexpectedly");
        }
    });
    // stop() is a no-op until the listen loop is up
    for (int i = 0; i < 500 && !server->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    Logger::getInstance().info("Health endpoint on http://0.0.0.0:" + std::to_string(port) + "/health");
}

void HealthServer::stop() {
    if (server) {
        server->stop();
    }
    if (worker.joinable()) {
        worker.join();
    }
    server.reset();
}
