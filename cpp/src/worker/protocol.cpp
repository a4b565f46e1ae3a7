#include "promptspan/worker/protocol.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"

#include <cmath>

namespace promptspan::worker {

namespace {

boost::json::string_view view(std::string_view s) {
    return boost::json::string_view(s.data(), s.size());
}

std::string to_std(const boost::json::string& s) {
    return std::string(s.data(), s.size());
}

std::optional<boost::json::value> parse_line(std::string_view line) {
    boost::system::error_code ec;
    boost::json::value v = boost::json::parse(view(line), ec);
    if (ec) {
        return std::nullopt;
    }
    return v;
}

std::optional<uint64_t> as_index(const boost::json::value* v) {
    if (!v) return std::nullopt;
    if (v->is_uint64()) return v->get_uint64();
    if (v->is_int64()) {
        int64_t i = v->get_int64();
        if (i < 0) return std::nullopt;
        return static_cast<uint64_t>(i);
    }
    if (v->is_double()) {
        double d = v->get_double();
        if (!std::isfinite(d) || d < 0.0 || std::floor(d) != d) return std::nullopt;
        return static_cast<uint64_t>(d);
    }
    return std::nullopt;
}

std::optional<double> as_double(const boost::json::value* v) {
    if (!v || !v->is_number()) return std::nullopt;
    return v->to_number<double>();
}

} // namespace

const char* to_string(RequestType type) noexcept {
    switch (type) {
        case RequestType::Initialize: return "initialize";
        case RequestType::Warmup:     return "warmup";
        case RequestType::Inference:  return "inference";
    }
    return "inference";
}

std::optional<RequestType> parse_request_type(std::string_view name) noexcept {
    if (name == "initialize") return RequestType::Initialize;
    if (name == "warmup") return RequestType::Warmup;
    if (name == "inference") return RequestType::Inference;
    return std::nullopt;
}

// =============================================================================
// Envelopes
// =============================================================================

std::string encode_request(const Request& request) {
    boost::json::object obj;
    obj["id"] = request.id;
    obj["type"] = to_string(request.type);
    obj["payload"] = request.payload;
    return boost::json::serialize(obj);
}

std::optional<Request> decode_request(std::string_view line) {
    auto parsed = parse_line(line);
    if (!parsed || !parsed->is_object()) return std::nullopt;
    const auto& obj = parsed->get_object();

    auto id = as_index(obj.if_contains("id"));
    const auto* type = obj.if_contains("type");
    if (!id || !type || !type->is_string()) return std::nullopt;

    auto kind = parse_request_type(to_std(type->get_string()));
    if (!kind) return std::nullopt;

    Request request;
    request.id = *id;
    request.type = *kind;
    if (const auto* payload = obj.if_contains("payload")) {
        if (payload->is_object()) request.payload = payload->get_object();
    }
    return request;
}

std::string encode_response(const Response& response) {
    boost::json::object obj;
    obj["id"] = response.id;
    obj["ok"] = response.ok;
    if (response.ok) {
        obj["result"] = response.result;
    } else {
        obj["error"] = response.error;
    }
    return boost::json::serialize(obj);
}

std::optional<Response> decode_response(std::string_view line) {
    auto parsed = parse_line(line);
    if (!parsed || !parsed->is_object()) return std::nullopt;
    const auto& obj = parsed->get_object();

    auto id = as_index(obj.if_contains("id"));
    const auto* ok = obj.if_contains("ok");
    if (!id || !ok || !ok->is_bool()) return std::nullopt;

    Response response;
    response.id = *id;
    response.ok = ok->get_bool();
    if (const auto* result = obj.if_contains("result")) {
        response.result = *result;
    }
    if (const auto* error = obj.if_contains("error")) {
        response.error = error->is_string() ? to_std(error->get_string())
                                            : boost::json::serialize(*error);
    }
    return response;
}

// =============================================================================
// Inference payloads
// =============================================================================

boost::json::object inference_payload(std::string_view text, double threshold, int timeout_ms) {
    boost::json::object payload;
    payload["text"] = view(text);
    payload["threshold"] = threshold;
    payload["timeoutMs"] = timeout_ms;
    return payload;
}

boost::json::array encode_detections(const std::vector<Detection>& detections) {
    boost::json::array arr;
    for (const auto& d : detections) {
        boost::json::object obj;
        obj["start"] = static_cast<uint64_t>(d.start);
        obj["end"] = static_cast<uint64_t>(d.end);
        obj["label"] = d.label;
        obj["score"] = d.score;
        arr.push_back(std::move(obj));
    }
    return arr;
}

std::vector<Detection> decode_detections(const boost::json::value& result) {
    const auto* arr = result.if_array();
    if (!arr) {
        throw WorkerError("inference result is not an array", "", ErrorCode::WORKER_PROTOCOL);
    }

    std::vector<Detection> detections;
    detections.reserve(arr->size());
    for (const auto& item : *arr) {
        const auto* obj = item.if_object();
        if (!obj) {
            LOG_DEBUG("Skipping non-object detection");
            continue;
        }
        auto start = as_index(obj->if_contains("start"));
        auto end = as_index(obj->if_contains("end"));
        auto score = as_double(obj->if_contains("score"));
        const auto* label = obj->if_contains("label");
        if (!start || !end || !score || !label || !label->is_string()) {
            LOG_DEBUG("Skipping detection with missing fields");
            continue;
        }

        Detection d;
        d.start = static_cast<size_t>(*start);
        d.end = static_cast<size_t>(*end);
        d.score = *score;
        d.label = to_std(label->get_string());
        detections.push_back(std::move(d));
    }
    return detections;
}

// =============================================================================
// Spawn-time settings
// =============================================================================

std::string encode_settings(const WorkerSettings& settings) {
    boost::json::object obj;
    obj["modelPath"] = settings.model_path;

    boost::json::array labels;
    for (const auto& l : settings.labels) labels.emplace_back(l);
    obj["labels"] = std::move(labels);

    boost::json::object thresholds;
    for (const auto& [label, t] : settings.label_thresholds) thresholds[label] = t;
    obj["labelThresholds"] = std::move(thresholds);

    obj["threshold"] = settings.threshold;
    obj["maxWidth"] = settings.max_width;
    obj["timeoutMs"] = settings.timeout_ms;
    return boost::json::serialize(obj);
}

WorkerSettings decode_settings(std::string_view json_text) {
    auto parsed = parse_line(json_text);
    if (!parsed || !parsed->is_object()) {
        throw WorkerError("worker settings are not a JSON object", "", ErrorCode::WORKER_PROTOCOL);
    }
    const auto& obj = parsed->get_object();

    WorkerSettings settings;
    if (const auto* p = obj.if_contains("modelPath"); p && p->is_string()) {
        settings.model_path = to_std(p->get_string());
    }
    if (const auto* p = obj.if_contains("labels"); p && p->is_array()) {
        for (const auto& l : p->get_array()) {
            if (l.is_string()) settings.labels.push_back(to_std(l.get_string()));
        }
    }
    if (const auto* p = obj.if_contains("labelThresholds"); p && p->is_object()) {
        for (const auto& kv : p->get_object()) {
            if (kv.value().is_number()) {
                settings.label_thresholds[std::string(kv.key().data(), kv.key().size())] =
                    kv.value().to_number<double>();
            }
        }
    }
    if (auto t = as_double(obj.if_contains("threshold"))) settings.threshold = *t;
    if (auto w = as_index(obj.if_contains("maxWidth"))) settings.max_width = static_cast<int>(*w);
    if (auto ms = as_index(obj.if_contains("timeoutMs"))) settings.timeout_ms = static_cast<int>(*ms);
    return settings;
}

} // namespace promptspan::worker
