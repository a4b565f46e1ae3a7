#pragma once

#include "promptspan/worker/process.hpp"
#include "promptspan/worker/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace promptspan::worker {

/**
 * Request/response multiplexer over one worker process.
 *
 * Each request gets the next id and a promise in the pending table; a reader
 * thread matches response lines to promises by id. Several requests may be in
 * flight at once. A timed-out request is removed from the table and a late
 * response for it is discarded; the worker itself is left running.
 *
 * When the worker's stdout reaches EOF every pending request fails with
 * WorkerError, the channel turns dead for good, and the exit callback runs
 * on the reader thread.
 */
class RpcChannel {
public:
    using ExitCallback = std::function<void(const std::string& reason)>;

    explicit RpcChannel(std::unique_ptr<WorkerProcess> process, ExitCallback on_exit = {});
    ~RpcChannel();

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    // Returns the response result. The timeout must be positive.
    // Throws WorkerTimeoutError on timeout, WorkerError on worker failure or an error response.
    boost::json::value request(RequestType type, boost::json::object payload,
                               std::chrono::milliseconds timeout);

    bool alive() const noexcept { return alive_.load(); }
    size_t pending() const;
    pid_t pid() const noexcept { return process_->pid(); }

private:
    void reader_loop();
    void fail_pending(const std::string& reason);

    std::unique_ptr<WorkerProcess> process_;
    ExitCallback on_exit_;

    std::mutex write_mutex_;
    mutable std::mutex pending_mutex_;
    std::unordered_map<uint64_t, std::promise<Response>> pending_;

    std::atomic<uint64_t> next_id_{1};
    std::atomic<bool> alive_{true};
    std::atomic<bool> closing_{false};
    std::thread reader_;
};

} // namespace promptspan::worker
