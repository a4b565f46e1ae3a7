#include "promptspan/worker/process.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <string_view>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace promptspan::worker {

namespace {

// A dead worker must surface as a failed write, not kill the host process.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// The parent environment with `overrides` replacing or adding entries, as KEY=VALUE strings.
std::vector<std::string> merged_environment(const WorkerProcess::Environment& overrides) {
    std::vector<std::string> out;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        std::string_view key = kv.substr(0, kv.find('='));
        bool replaced = false;
        for (const auto& [k, v] : overrides) {
            if (k == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) out.emplace_back(kv);
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

} // namespace

WorkerProcess::WorkerProcess(const std::string& executable,
                             const std::vector<std::string>& args,
                             const Environment& env) {
    if (executable.empty() || ::access(executable.c_str(), X_OK) != 0) {
        throw WorkerError("worker executable is not runnable", executable,
                          ErrorCode::WORKER_SPAWN_FAILED);
    }
    ignore_sigpipe();

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        throw WorkerError(std::string("pipe failed: ") + std::strerror(errno), executable,
                          ErrorCode::WORKER_SPAWN_FAILED);
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        throw WorkerError(std::string("pipe failed: ") + std::strerror(err), executable,
                          ErrorCode::WORKER_SPAWN_FAILED);
    }

    // Build argv and envp before forking; only async-signal-safe calls follow in the child.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = merged_environment(env);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw WorkerError(std::string("fork failed: ") + std::strerror(err), executable,
                          ErrorCode::WORKER_SPAWN_FAILED);
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        std::signal(SIGPIPE, SIG_DFL);
        ::execve(executable.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    LOG_DEBUG("Spawned worker ", executable, " (pid ", pid_, ")");
}

WorkerProcess::~WorkerProcess() {
    terminate();
    close_fd(stdout_fd_);
}

bool WorkerProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) return false;

    std::string data = line;
    data.push_back('\n');
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("Worker stdin write failed: ", std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> WorkerProcess::read_line() {
    if (stdout_fd_ < 0) return std::nullopt;

    char chunk[4096];
    for (;;) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("Worker stdout read failed: ", std::strerror(errno));
            return std::nullopt;
        }
        if (n == 0) {
            return std::nullopt;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void WorkerProcess::close_stdin() {
    close_fd(stdin_fd_);
}

bool WorkerProcess::reap(bool block) {
    if (pid_ <= 0 || exited_) return true;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
        exited_ = true;
        exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        exited_ = true;
        return true;
    }
    return false;
}

void WorkerProcess::terminate() {
    close_stdin();
    if (pid_ <= 0 || reap(false)) return;

    ::kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    LOG_WARN("Worker pid ", pid_, " ignored SIGTERM, killing");
    ::kill(pid_, SIGKILL);
    reap(true);
}

} // namespace promptspan::worker
