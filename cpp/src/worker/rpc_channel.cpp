#include "promptspan/worker/rpc_channel.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"

#include <vector>

namespace promptspan::worker {

RpcChannel::RpcChannel(std::unique_ptr<WorkerProcess> process, ExitCallback on_exit)
    : process_(std::move(process))
    , on_exit_(std::move(on_exit)) {
    PROMPTSPAN_CHECK_ARGUMENT(process_ != nullptr, "RpcChannel needs a worker process");
    reader_ = std::thread(&RpcChannel::reader_loop, this);
}

RpcChannel::~RpcChannel() {
    closing_ = true;
    process_->terminate();
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    fail_pending("worker channel closed");
}

size_t RpcChannel::pending() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

boost::json::value RpcChannel::request(RequestType type, boost::json::object payload,
                                       std::chrono::milliseconds timeout) {
    PROMPTSPAN_CHECK_ARGUMENT(timeout.count() > 0, "worker request timeout must be positive");

    Request req;
    req.id = next_id_.fetch_add(1);
    req.type = type;
    req.payload = std::move(payload);

    std::future<Response> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!alive_) {
            throw WorkerError("worker is not running", to_string(type));
        }
        future = pending_[req.id].get_future();
    }

    bool written = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        written = process_->write_line(encode_request(req));
    }
    if (!written) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(req.id);
        throw WorkerError("failed to write request to worker", to_string(type));
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        size_t erased = 0;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            erased = pending_.erase(req.id);
        }
        // Erased by the reader in the meantime: the promise is being fulfilled.
        if (erased > 0) {
            throw WorkerTimeoutError("worker request timed out after " +
                                         std::to_string(timeout.count()) + "ms",
                                     to_string(type));
        }
    }

    Response response = future.get();
    if (!response.ok) {
        throw WorkerError(response.error.empty() ? "worker reported an error" : response.error,
                          to_string(type));
    }
    return std::move(response.result);
}

void RpcChannel::reader_loop() {
    while (auto line = process_->read_line()) {
        if (line->empty()) continue;

        auto response = decode_response(*line);
        if (!response) {
            LOG_WARN("[worker] ignoring malformed line: ", line->substr(0, 120));
            continue;
        }

        std::promise<Response> promise;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(response->id);
            if (it == pending_.end()) {
                LOG_DEBUG("[worker] discarding response for request ", response->id);
                continue;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_value(std::move(*response));
    }

    std::string reason = closing_ ? "worker channel closed" : "worker exited";
    fail_pending(reason);
    if (!closing_) {
        LOG_WARN("[worker] pid ", process_->pid(), " stopped responding (", reason, ")");
        if (on_exit_) on_exit_(reason);
    }
}

void RpcChannel::fail_pending(const std::string& reason) {
    std::vector<std::promise<Response>> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        alive_ = false;
        for (auto& [id, promise] : pending_) {
            failed.push_back(std::move(promise));
        }
        pending_.clear();
    }
    for (auto& promise : failed) {
        promise.set_exception(std::make_exception_ptr(WorkerError(reason)));
    }
}

} // namespace promptspan::worker
