#pragma once
#include <cstddef>
#include <string>
#include <istream>
#include <ostream>

/**
 * @brief Newline-delimited message channel.
 */
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    /**
     * @brief Read one line without its terminator.
     * @return false once the peer closed the stream
     */
    virtual bool readLine(std::string& line) = 0;

    /**
     * @brief Write line plus '\n' and flush.
     * @return false when the peer can no longer be written to
     */
    virtual bool writeLine(const std::string& line) = 0;
};

/**
 * @brief Channel over an istream/ostream pair (stdin/stdout).
 */
class StreamChannel : public ILineChannel {
public:
    StreamChannel(std::istream& in, std::ostream& out) : in(in), out(out) {}

    bool readLine(std::string& line) override;
    bool writeLine(const std::string& line) override;

private:
    std::istream& in;
    std::ostream& out;
};

/**
 * @brief Channel over a connected socket. Owns and closes the descriptor.
 *
 * A line longer than maxLineBytes ends the input: readLine() returns false
 * and the rest of the stream is ignored.
 */
class SocketChannel : public ILineChannel {
public:
    static constexpr size_t kMaxLineBytes = 8 * 1024 * 1024;

    explicit SocketChannel(int fd, size_t maxLineBytes = kMaxLineBytes)
        : fd(fd), maxLineBytes(maxLineBytes) {}
    ~SocketChannel() override;

    SocketChannel(const SocketChannel&) = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    bool readLine(std::string& line) override;
    bool writeLine(const std::string& line) override;

private:
    int fd;
    size_t maxLineBytes;
    std::string buffer;
    bool eof = false;
};
