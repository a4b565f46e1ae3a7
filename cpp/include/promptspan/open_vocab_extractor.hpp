#pragma once

#include "promptspan/types.hpp"
#include "promptspan/worker/protocol.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptspan {

class Taxonomy;

namespace worker {
class RpcChannel;
}

struct OpenVocabConfig {
    bool enabled = false;
    std::string worker_path;
    std::vector<std::string> worker_args;
    std::string model_path;
    double threshold = 0.3;
    int timeout_ms = 1500;          // per inference, must be positive
    int max_width = 12;
    std::map<std::string, double> label_thresholds;   // keyed by label or taxonomy id
};

struct LabelSpec {
    std::string label;
    std::string taxonomy_id;
};

/**
 * Tier 2: open-vocabulary entities from an out-of-process model.
 *
 * The worker is spawned and initialized on first use. Concurrent first
 * callers share one initialization through a shared future. A failed
 * initialization stays failed until reset(); a worker that dies after a
 * successful start is dropped and the next call starts a fresh one.
 *
 * extract() never throws: timeouts, worker failures and protocol errors are
 * logged and yield no candidates.
 */
class OpenVocabExtractor {
public:
    OpenVocabExtractor(const Taxonomy& taxonomy, OpenVocabConfig config);
    ~OpenVocabExtractor();

    OpenVocabExtractor(const OpenVocabExtractor&) = delete;
    OpenVocabExtractor& operator=(const OpenVocabExtractor&) = delete;

    std::vector<CandidateSpan> extract(std::string_view text);

    // Starts the worker if needed and runs one throwaway inference.
    WarmupResult warmup();

    // Lazily starts the worker; true when it is ready for inference.
    bool ensure_initialized();

    bool is_ready() const;

    // Stops the worker and forgets any sticky initialization failure.
    void reset();

    // Maps a raw score above threshold t onto [0.5, 1.0], two decimals.
    static double calibrate(double score, double threshold) noexcept;

    double threshold_for(const std::string& label, const std::string& taxonomy_id) const;

    // Taxonomy id for a model label; nullopt when the label is not mapped.
    std::optional<std::string> map_label(const std::string& label) const;

    // Label vocabulary handed to the worker.
    const std::vector<std::string>& labels() const noexcept { return labels_; }
    size_t mapped_label_count() const noexcept { return label_map_.size(); }

    const OpenVocabConfig& config() const noexcept { return config_; }

    static const std::vector<LabelSpec>& default_label_specs();
    static constexpr const char* kWarmupText = "Low-Angle Shot, 24fps, 16:9, golden hour";
    static constexpr int kMinInitTimeoutMs = 15000;
    static constexpr int kMinWarmupTimeoutMs = 1000;

private:
    bool start_worker(uint64_t generation);
    std::shared_ptr<worker::RpcChannel> current_channel() const;
    worker::WorkerSettings settings() const;

    OpenVocabConfig config_;
    std::unordered_map<std::string, std::string> label_map_;
    std::vector<std::string> labels_;

    mutable std::mutex mutex_;
    std::shared_ptr<worker::RpcChannel> channel_;
    std::optional<std::shared_future<bool>> init_future_;
    bool ready_ = false;
    bool init_failed_ = false;
    uint64_t generation_ = 0;
};

} // namespace promptspan
