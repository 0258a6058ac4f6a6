#include "mcp/Transport.h"
#include "mcp/Dispatcher.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace {
bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

Transport::Transport(Dispatcher& dispatcher) : dispatcher(dispatcher) {}

std::string Transport::processLine(const std::string& line) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Parse error: ") + e.what());
        return Dispatcher::makeError(nullptr, JsonRpcError::ParseError,
                                     std::string("Parse error: ") + e.what()).dump();
    }

    try {
        auto response = dispatcher.handle(request);
        return response ? response->dump() : std::string();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Unhandled dispatch error: ") + e.what());
        nlohmann::json id = (request.is_object() && request.contains("id")) ? request["id"] : nlohmann::json(nullptr);
        return Dispatcher::makeError(id, JsonRpcError::InternalError,
                                     std::string("Internal error: ") + e.what()).dump();
    }
}

Transport::SessionEnd Transport::serveSession(ILineChannel& channel) {
    std::string line;
    while (channel.readLine(line)) {
        if (isBlank(line)) continue;

        std::string response = processLine(line);
        if (response.empty()) continue;

        if (!channel.writeLine(response)) {
            Logger::getInstance().error("Failed to write response, closing session");
            return SessionEnd::WriteFailed;
        }
    }
    return SessionEnd::InputClosed;
}

int Transport::runStdio() {
    Logger::getInstance().info("Serving MCP over stdio");
    StreamChannel channel(std::cin, std::cout);
    SessionEnd end = serveSession(channel);
    if (end == SessionEnd::WriteFailed) {
        return 1;
    }
    Logger::getInstance().info("stdin closed, shutting down");
    return 0;
}

int Transport::runTcp(int requestedPort) {
    // Close-on-exec keeps backend child processes from inheriting the sockets
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket() failed: ") + std::strerror(errno));
    }

    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(requestedPort));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || listen(fd, 8) != 0) {
        int saved = errno;
        close(fd);
        throw std::runtime_error("Cannot listen on port " + std::to_string(requestedPort) +
                                 ": " + std::strerror(saved));
    }

    listenFd = fd;
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    } else {
        port = requestedPort;
    }
    Logger::getInstance().info("Serving MCP over TCP on 0.0.0.0:" + std::to_string(port.load()));

    while (!stopping) {
        sockaddr_in peer{};
        socklen_t peerLen = sizeof(peer);
        int conn = accept4(fd, reinterpret_cast<sockaddr*>(&peer), &peerLen, SOCK_CLOEXEC);
        if (conn < 0) {
            if (stopping) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            Logger::getInstance().error(std::string("accept() failed: ") + std::strerror(errno));
            break;
        }

        char host[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer.sin_addr, host, sizeof(host));
        std::string peerName = std::string(host) + ":" + std::to_string(ntohs(peer.sin_port));
        Logger::getInstance().info("Client connected: " + peerName);

        clientFd = conn;
        {
            SocketChannel channel(conn);
            SessionEnd end = serveSession(channel);
            // Cleared before the channel closes the descriptor so stop() never
            // shuts down a reused number
            clientFd = -1;
            if (end == SessionEnd::WriteFailed) {
                Logger::getInstance().warn("Connection " + peerName + " dropped on write");
            }
        }
        Logger::getInstance().info("Client disconnected: " + peerName);
    }

    listenFd = -1;
    close(fd);
    Logger::getInstance().info("TCP server stopped");
    return 0;
}

void Transport::stop() {
    stopping = true;
    int fd = listenFd.load();
    if (fd != -1) shutdown(fd, SHUT_RDWR);
    int conn = clientFd.load();
    if (conn != -1) shutdown(conn, SHUT_RDWR);
}
