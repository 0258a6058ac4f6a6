#pragma once
#include <atomic>
#include <string>
#include "mcp/LineChannel.h"

class Dispatcher;

/**
 * @brief Line-framed JSON-RPC serving over stdio or TCP.
 *
 * One message per line in, at most one line out, strictly in arrival order.
 * Requests inside a session are handled one at a time.
 */
class Transport {
public:
    enum class SessionEnd { InputClosed, WriteFailed };

    explicit Transport(Dispatcher& dispatcher);

    /**
     * @brief Serve one session until the input closes or a write fails.
     */
    SessionEnd serveSession(ILineChannel& channel);

    /**
     * @brief Serve stdin/stdout.
     * @return 0 on clean closure, 1 when stdout could not be written
     */
    int runStdio();

    /**
     * @brief Listen on 0.0.0.0:port and serve connections one at a time.
     * @return 0 after stop()
     * @throws std::runtime_error if the socket cannot be bound
     */
    int runTcp(int port);

    /**
     * @brief Ask runTcp() to return. Async-signal-safe.
     */
    void stop();

    bool isStopping() const { return stopping.load(); }

    /**
     * @brief Whether runTcp() is currently serving a connection.
     */
    bool hasClient() const { return clientFd.load() != -1; }

    /**
     * @brief Port actually bound by runTcp() (useful with port 0), -1 before.
     */
    int boundPort() const { return port.load(); }

    /**
     * @brief Turn one raw input line into the response line, empty when no
     * response is due.
     */
    std::string processLine(const std::string& line);

private:
    Dispatcher& dispatcher;
    std::atomic<bool> stopping{false};
    std::atomic<int> listenFd{-1};
    std::atomic<int> clientFd{-1};
    std::atomic<int> port{-1};
};
