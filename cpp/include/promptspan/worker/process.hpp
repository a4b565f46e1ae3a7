#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace promptspan::worker {

/**
 * Child process with its stdin and stdout connected to pipes.
 *
 * The executable is started with fork/execv; extra environment variables are
 * set in the child only. Destruction terminates the child (SIGTERM, then
 * SIGKILL if it does not exit promptly) and reaps it.
 *
 * read_line() is meant for a single reader thread; write_line() callers
 * serialize among themselves.
 */
class WorkerProcess {
public:
    using Environment = std::vector<std::pair<std::string, std::string>>;

    // Throws WorkerError(WORKER_SPAWN_FAILED) if the executable is missing or fork fails.
    WorkerProcess(const std::string& executable,
                  const std::vector<std::string>& args,
                  const Environment& env);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    // Writes `line` plus a newline. False once the child's stdin is gone.
    bool write_line(const std::string& line);

    // Blocks for the next newline-terminated line; nullopt on EOF or read error.
    std::optional<std::string> read_line();

    void close_stdin();

    // SIGTERM, bounded wait, SIGKILL. Safe to call more than once.
    void terminate();

    pid_t pid() const noexcept { return pid_; }
    bool exited() const noexcept { return exited_; }
    int exit_status() const noexcept { return exit_status_; }

private:
    bool reap(bool block);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string buffer_;
    bool exited_ = false;
    int exit_status_ = 0;
};

} // namespace promptspan::worker
