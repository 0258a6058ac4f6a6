#include "mcp/LineChannel.h"
#include "utils/Logger.h"
#include <cerrno>

#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>

bool StreamChannel::readLine(std::string& line) {
    if (!std::getline(in, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool StreamChannel::writeLine(const std::string& line) {
    out << line << '\n';
    out.flush();
    return static_cast<bool>(out);
}

SocketChannel::~SocketChannel() {
    if (fd != -1) {
        close(fd);
    }
}

bool SocketChannel::readLine(std::string& line) {
    char chunk[4096];
    while (true) {
        size_t pos = buffer.find('\n');
        if ((pos == std::string::npos ? buffer.size() : pos) > maxLineBytes) {
            Logger::getInstance().warn("Incoming line exceeds " + std::to_string(maxLineBytes) +
                                       " bytes, dropping connection");
            buffer.clear();
            eof = true;
            return false;
        }
        if (pos != std::string::npos) {
            line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (eof) {
            // Trailing data without a newline still counts as a line
            if (buffer.empty()) return false;
            line.swap(buffer);
            buffer.clear();
            return true;
        }

        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            eof = true;
        }
    }
}

bool SocketChannel::writeLine(const std::string& line) {
    std::string data = line + "\n";
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}
