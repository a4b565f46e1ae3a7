#include "promptspan/open_vocab_extractor.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/util/text.hpp"
#include "promptspan/worker/process.hpp"
#include "promptspan/worker/rpc_channel.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

namespace promptspan {

const std::vector<LabelSpec>& OpenVocabExtractor::default_label_specs() {
    static const std::vector<LabelSpec> specs = {
        {"person", "subject.identity"},
        {"character", "subject.identity"},
        {"animal", "subject.identity"},
        {"creature", "subject.identity"},
        {"object", "subject.identity"},
        {"item", "subject.identity"},
        {"vehicle", "subject.identity"},
        {"food", "subject.identity"},
        {"drink", "subject.identity"},
        {"appearance", "subject.appearance"},
        {"physical trait", "subject.appearance"},
        {"body part", "subject.appearance"},
        {"clothing", "subject.wardrobe"},
        {"wardrobe", "subject.wardrobe"},
        {"outfit", "subject.wardrobe"},
        {"accessory", "subject.wardrobe"},

        {"place", "environment.location"},
        {"location", "environment.location"},
        {"building", "environment.location"},
        {"room", "environment.location"},
        {"environment", "environment.context"},
        {"setting", "environment.context"},
        {"scene", "environment.context"},
        {"context", "environment.context"},
        {"atmosphere", "environment.context"},
        {"weather", "environment.weather"},
        {"season", "environment.context"},

        {"action", "action.movement"},
        {"movement", "action.movement"},
        {"activity", "action.movement"},
        {"gesture", "action.gesture"},
        {"pose", "action.state"},
        {"state", "action.state"},

        {"emotion", "subject.emotion"},
        {"expression", "subject.emotion"},
        {"mood", "style.aesthetic"},

        {"shot type", "shot.type"},
        {"camera movement", "camera.movement"},
        {"camera angle", "camera.angle"},
        {"camera lens", "camera.lens"},
        {"lens", "camera.lens"},
        {"focus", "camera.focus"},
        {"depth of field", "camera.focus"},
        {"style", "style.aesthetic"},
        {"aesthetic", "style.aesthetic"},
        {"film stock", "style.filmStock"},
        {"color grade", "style.colorGrade"},
        {"color grading", "style.colorGrade"},
        {"color palette", "style.colorGrade"},
        {"palette", "style.colorGrade"},
        {"tones", "style.colorGrade"},
        {"color", "style.colorGrade"},

        {"lighting", "lighting.quality"},
        {"light source", "lighting.source"},
        {"time of day", "lighting.timeOfDay"},
        {"color temperature", "lighting.colorTemp"},

        {"frame rate", "technical.frameRate"},
        {"fps", "technical.frameRate"},
        {"duration", "technical.duration"},
        {"aspect ratio", "technical.aspectRatio"},
        {"resolution", "technical.resolution"},

        {"audio", "audio.ambient"},
        {"sound", "audio.ambient"},
        {"ambient sound", "audio.ambient"},
        {"ambience", "audio.ambient"},
        {"ambiance", "audio.ambient"},
        {"sound effect", "audio.soundEffect"},
        {"sfx", "audio.soundEffect"},
        {"music", "audio.score"},
        {"score", "audio.score"},
    };
    return specs;
}

OpenVocabExtractor::OpenVocabExtractor(const Taxonomy& taxonomy, OpenVocabConfig config)
    : config_(std::move(config)) {
    PROMPTSPAN_CHECK_ARGUMENT(config_.timeout_ms > 0, "open-vocabulary timeout_ms must be positive");

    std::string invalid;
    for (const auto& spec : default_label_specs()) {
        if (!taxonomy.is_valid(spec.taxonomy_id)) {
            if (!invalid.empty()) invalid += ", ";
            invalid += spec.label + "->" + spec.taxonomy_id;
            continue;
        }
        label_map_.emplace(spec.label, spec.taxonomy_id);
    }
    if (!invalid.empty()) {
        LOG_WARN("[open-vocab] label mappings with unknown taxonomy ids are ignored: ", invalid);
    }

    // Attribute names the taxonomy itself declares ("film stock", "time of day").
    for (const auto& category : taxonomy.categories()) {
        for (const auto& [key, id] : category.attributes) {
            if (taxonomy.is_valid(id)) {
                label_map_.emplace(Taxonomy::humanize_attribute(key), id);
            }
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& label : taxonomy.label_vocabulary()) {
        if (seen.insert(label).second) labels_.push_back(label);
    }
    for (const auto& spec : default_label_specs()) {
        if (label_map_.count(spec.label) && seen.insert(spec.label).second) {
            labels_.push_back(spec.label);
        }
    }

    LOG_DEBUG("[open-vocab] ", labels_.size(), " labels, ", label_map_.size(), " mapped to taxonomy ids");
}

OpenVocabExtractor::~OpenVocabExtractor() {
    std::shared_ptr<worker::RpcChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = std::move(channel_);
    }
}

double OpenVocabExtractor::calibrate(double score, double threshold) noexcept {
    double s = std::clamp(score, 0.0, 1.0);
    double t = std::clamp(threshold, 0.0, 0.99);
    double normalized = s <= t ? 0.0 : (s - t) / (1.0 - t);
    double calibrated = 0.5 + normalized * 0.5;
    return std::round(calibrated * 100.0) / 100.0;
}

double OpenVocabExtractor::threshold_for(const std::string& label,
                                         const std::string& taxonomy_id) const {
    const auto& overrides = config_.label_thresholds;
    auto it = overrides.find(util::to_lower_ascii(label));
    if (it == overrides.end()) it = overrides.find(taxonomy_id);
    if (it != overrides.end() && std::isfinite(it->second)) {
        return std::clamp(it->second, 0.0, 0.99);
    }
    return config_.threshold;
}

std::optional<std::string> OpenVocabExtractor::map_label(const std::string& label) const {
    auto it = label_map_.find(util::to_lower_ascii(util::trim(label)));
    if (it == label_map_.end()) return std::nullopt;
    return it->second;
}

worker::WorkerSettings OpenVocabExtractor::settings() const {
    worker::WorkerSettings s;
    s.model_path = config_.model_path;
    s.labels = labels_;
    s.label_thresholds = config_.label_thresholds;
    s.threshold = config_.threshold;
    s.max_width = config_.max_width;
    s.timeout_ms = config_.timeout_ms;
    return s;
}

std::shared_ptr<worker::RpcChannel> OpenVocabExtractor::current_channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

// =============================================================================
// Worker lifecycle
// =============================================================================

bool OpenVocabExtractor::ensure_initialized() {
    if (!config_.enabled) return false;

    std::shared_ptr<worker::RpcChannel> dead;
    std::shared_future<bool> pending;
    std::promise<bool> promise;
    bool owner = false;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (init_failed_) return false;

        if (ready_ && channel_ && !channel_->alive()) {
            LOG_WARN("[open-vocab] worker is gone, starting a new one");
            dead = std::move(channel_);
            ready_ = false;
            init_future_.reset();
        }
        if (ready_) return true;

        if (init_future_) {
            pending = *init_future_;
        } else {
            owner = true;
            generation = ++generation_;
            pending = promise.get_future().share();
            init_future_ = pending;
        }
    }
    dead.reset();

    if (owner) {
        promise.set_value(start_worker(generation));
    }
    return pending.get();
}

bool OpenVocabExtractor::start_worker(uint64_t generation) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    std::shared_ptr<worker::RpcChannel> channel;
    bool ok = false;

    if (config_.worker_path.empty()) {
        LOG_WARN("[open-vocab] no worker executable configured (ner.worker)");
    } else {
        try {
            worker::WorkerProcess::Environment env = {
                {worker::kSettingsEnvVar, worker::encode_settings(settings())}
            };
            auto process = std::make_unique<worker::WorkerProcess>(config_.worker_path,
                                                                   config_.worker_args, env);
            channel = std::make_shared<worker::RpcChannel>(
                std::move(process), [](const std::string& reason) {
                    LOG_WARN("[open-vocab] worker lost (", reason, "); next call restarts it");
                });

            int timeout = std::max(config_.timeout_ms, kMinInitTimeoutMs);
            auto result = channel->request(worker::RequestType::Initialize, {},
                                           std::chrono::milliseconds(timeout));
            ok = result.is_bool() && result.get_bool();
            if (!ok) {
                LOG_WARN("[open-vocab] worker declined initialization after ", elapsed_ms(), "ms");
            }
        } catch (const PromptSpanException& e) {
            LOG_ERROR("[open-vocab] worker initialization failed after ", elapsed_ms(), "ms: ", e.what());
        }
    }

    std::shared_ptr<worker::RpcChannel> discard;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            discard = std::move(channel);
            return false;
        }
        ready_ = ok;
        init_failed_ = !ok;
        if (ok) {
            channel_ = std::move(channel);
        } else {
            discard = std::move(channel);
        }
    }

    if (ok) {
        LOG_INFO("[open-vocab] worker ready in ", elapsed_ms(), "ms (", labels_.size(), " labels)");
    }
    return ok;
}

bool OpenVocabExtractor::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_ && !init_failed_ && channel_ && channel_->alive();
}

void OpenVocabExtractor::reset() {
    std::shared_ptr<worker::RpcChannel> old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = std::move(channel_);
        init_future_.reset();
        ready_ = false;
        init_failed_ = false;
        ++generation_;
    }
}

// =============================================================================
// Inference
// =============================================================================

std::vector<CandidateSpan> OpenVocabExtractor::extract(std::string_view text) {
    std::vector<CandidateSpan> out;
    if (text.empty() || !config_.enabled) return out;

    if (!ensure_initialized()) {
        LOG_DEBUG("[open-vocab] worker not ready, skipping");
        return out;
    }
    auto channel = current_channel();
    if (!channel) return out;

    std::vector<worker::Detection> detections;
    auto started = std::chrono::steady_clock::now();
    try {
        auto result = channel->request(worker::RequestType::Inference,
                                       worker::inference_payload(text, config_.threshold, config_.timeout_ms),
                                       std::chrono::milliseconds(config_.timeout_ms));
        detections = worker::decode_detections(result);
    } catch (const WorkerTimeoutError&) {
        LOG_WARN("[open-vocab] inference timed out after ", config_.timeout_ms, "ms");
        return out;
    } catch (const PromptSpanException& e) {
        LOG_WARN("[open-vocab] inference failed: ", e.what());
        return out;
    }

    for (const auto& d : detections) {
        auto role = map_label(d.label);
        if (!role) {
            LOG_DEBUG("[open-vocab] unmapped label '", d.label, "'");
            continue;
        }
        double threshold = threshold_for(d.label, *role);
        if (!std::isfinite(d.score) || d.score < threshold) continue;
        if (d.start >= d.end || d.end > text.size()) continue;

        auto [start, end] = util::trim_range(text, d.start, d.end);
        if (start >= end) continue;

        CandidateSpan span;
        span.start = start;
        span.end = end;
        span.text = std::string(text.substr(start, end - start));
        span.role = *role;
        span.confidence = calibrate(d.score, threshold);
        span.source = SpanSource::OpenVocab;
        out.push_back(std::move(span));
    }

    LOG_DEBUG("[open-vocab] ", out.size(), " of ", detections.size(), " detections kept in ",
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - started).count(), "ms");
    return out;
}

WarmupResult OpenVocabExtractor::warmup() {
    if (!config_.enabled) {
        return {false, "open-vocabulary tier is disabled"};
    }

    bool ready = ensure_initialized();
    if (ready) {
        if (auto channel = current_channel()) {
            boost::json::object payload;
            payload["text"] = kWarmupText;
            try {
                channel->request(worker::RequestType::Warmup, std::move(payload),
                                 std::chrono::milliseconds(std::max(config_.timeout_ms, kMinWarmupTimeoutMs)));
            } catch (const PromptSpanException& e) {
                LOG_WARN("[open-vocab] warmup inference failed, continuing: ", e.what());
            }
        }
    }

    LOG_INFO("[open-vocab] warmup ", ready ? "completed" : "failed");
    return {ready, ready ? "open-vocabulary worker initialized"
                         : "open-vocabulary worker initialization failed"};
}

} // namespace promptspan
