#include "clipboard.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>

namespace clipboard {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Kills and reaps the child on every path
struct Child {
    pid_t pid = -1;

    ~Child() {
        if (pid > 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }

    // false on failure exit status or when the deadline passes first
    bool wait_success(std::chrono::steady_clock::time_point deadline) {
        while (true) {
            int status = 0;
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret < 0 && errno == EINTR) continue;
            if (ret < 0) {
                pid = -1;
                return false;
            }
            if (ret == pid) {
                pid = -1;
                return WIFEXITED(status) && WEXITSTATUS(status) == 0;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            usleep(10000);
        }
    }
};

} // namespace

std::optional<std::string> run(const std::vector<std::string>& argv, const std::string& input, int timeout_ms,
                               size_t max_output) {
    if (argv.empty()) return std::nullopt;
    bool capture = max_output > 0;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) < 0) return std::nullopt;
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        return std::nullopt;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    Child child;
    child.pid = fork();
    if (child.pid < 0) {
        close_fd(in_pipe[0]);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::nullopt;
    }

    if (child.pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        // wl-copy leaves a server behind holding stdout, only capture when asked to
        dup2(capture ? out_pipe[1] : devnull, STDOUT_FILENO);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);

    // Inputs are small, a blocking write is fine
    size_t written = 0;
    while (written < input.size()) {
        ssize_t n = ::write(in_pipe[1], input.data() + written, input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        written += static_cast<size_t>(n);
    }
    close_fd(in_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string output;
    bool complete = !capture;
    char buf[4096];

    while (capture) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        pollfd pfd = {};
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;

        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            complete = true;
            break;
        }
        output.append(buf, static_cast<size_t>(n));
        if (output.size() > max_output) {
            std::cerr << "clipboard: " << argv[0] << " output exceeds " << max_output << " bytes" << std::endl;
            break;
        }
    }
    close_fd(out_pipe[0]);

    if (!complete) {
        return std::nullopt;  // Child destructor kills it
    }
    if (!child.wait_success(deadline)) {
        return std::nullopt;
    }
    return output;
}

SystemClipboard::SystemClipboard(size_t max_size, int timeout_ms)
    : max_size_(max_size), timeout_ms_(timeout_ms) {}

std::optional<std::string> SystemClipboard::read() {
    if (auto text = run({"wl-paste", "--no-newline"}, "", timeout_ms_, max_size_)) {
        return text;
    }
    return run({"xclip", "-selection", "clipboard", "-o"}, "", timeout_ms_, max_size_);
}

bool SystemClipboard::write(const std::string& text) {
    if (run({"wl-copy"}, text, timeout_ms_, 0)) {
        return true;
    }
    if (run({"xclip", "-selection", "clipboard"}, text, timeout_ms_, 0)) {
        return true;
    }
    std::cerr << "clipboard: no working clipboard tool (wl-copy, xclip)" << std::endl;
    return false;
}

} // namespace clipboard
