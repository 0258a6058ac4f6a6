#include "agent/ClaudeCliBackend.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>

namespace {
constexpr int kExecFailedStatus = 127;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void closeIfOpen(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}
} // namespace

ClaudeCliBackend::ClaudeCliBackend(const std::string& command, const std::string& model)
    : command(command), model(model) {}

std::string ClaudeCliBackend::name() const {
    return model.empty() ? command : command + " (" + model + ")";
}

std::vector<std::string> ClaudeCliBackend::buildArguments(const std::string& prompt) const {
    std::vector<std::string> args = {
        command,
        "-p", prompt,
        "--output-format", "text",
        "--permission-mode", "bypassPermissions"
    };
    if (!model.empty()) {
        args.push_back("--model");
        args.push_back(model);
    }
    return args;
}

std::string ClaudeCliBackend::run(const BackendRequest& request) {
    auto args = buildArguments(request.prompt);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe(outPipe) != 0) {
        throw BackendError(std::string("Failed to start ") + command + ": " + std::strerror(errno));
    }
    if (pipe(errPipe) != 0) {
        int saved = errno;
        closeIfOpen(outPipe[0]);
        closeIfOpen(outPipe[1]);
        throw BackendError(std::string("Failed to start ") + command + ": " + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        closeIfOpen(outPipe[0]);
        closeIfOpen(outPipe[1]);
        closeIfOpen(errPipe[0]);
        closeIfOpen(errPipe[1]);
        throw BackendError(std::string("Failed to start ") + command + ": " + std::strerror(saved));
    }

    if (pid == 0) { // Child
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull != -1) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);

        if (!request.workingDirectory.empty() && chdir(request.workingDirectory.c_str()) != 0) {
            dprintf(STDERR_FILENO, "cannot enter working directory %s: %s\n",
                    request.workingDirectory.c_str(), std::strerror(errno));
            _exit(kExecFailedStatus);
        }

        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        dprintf(STDERR_FILENO, "exec %s failed: %s\n", argv[0], std::strerror(errno));
        _exit(kExecFailedStatus);
    }

    // Parent
    closeIfOpen(outPipe[1]);
    closeIfOpen(errPipe[1]);

    std::string out;
    std::string err;
    char buffer[4096];
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int openCount = 2;
    while (openCount > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                openCount--;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw BackendError(std::string("Failed to wait for ") + command + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        Logger::getInstance().debug(command + " finished (" + std::to_string(out.size()) + " bytes)");
        return trim(out);
    }

    std::string detail = trim(err);
    if (detail.empty()) detail = trim(out);
    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailedStatus) {
        throw BackendError("Failed to start " + command + ": " + detail);
    }
    if (detail.empty()) {
        detail = WIFSIGNALED(status) ? "terminated by signal " + std::to_string(WTERMSIG(status))
                                     : "exit status " + std::to_string(WEXITSTATUS(status));
    }
    throw BackendError(command + " failed: " + detail);
}
