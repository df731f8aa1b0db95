#include "platform/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace platform {

namespace {

std::string sys_error(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Writes everything with SIGPIPE blocked on this thread. A child that closed
// its stdin early just gets less input.
void write_input(int fd, const std::string& input) {
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    size_t off = 0;
    while (off < input.size()) {
        ssize_t n = ::write(fd, input.data() + off, input.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        off += static_cast<size_t>(n);
    }

    // Drop the SIGPIPE a closed pipe raised before unblocking.
    timespec zero{};
    while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {}
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
}

} // namespace

std::expected<ProcessExit, std::string> run_process(const std::vector<std::string>& argv,
                                                    const std::string& input,
                                                    std::stop_token stop) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(sys_error("pipe2()"));

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = sys_error("fork()");
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return std::unexpected(err);
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
        }
        std::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    write_input(in_pipe[1], input);
    ::close(in_pipe[1]);

    ProcessExit result;
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, stop.stop_possible() ? WNOHANG : 0);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(sys_error("waitpid()"));
        }
        if (stop.stop_requested() && !result.killed) {
            ::kill(pid, SIGTERM);
            result.killed = true;
            stop = {};
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
    }
    if (!result.killed && result.code == 127) {
        return std::unexpected(argv[0] + " not found");
    }
    return result;
}

std::expected<void, std::string> run_checked(const std::vector<std::string>& argv,
                                             const std::string& input, std::stop_token stop) {
    auto res = run_process(argv, input, stop);
    if (!res) return std::unexpected(res.error());
    if (res->killed) return std::unexpected(argv[0] + " interrupted");
    if (res->code != 0) {
        return std::unexpected(argv[0] + " exited with code " + std::to_string(res->code));
    }
    return {};
}

} // namespace platform
