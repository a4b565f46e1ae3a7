#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptspan::worker {

/**
 * Wire format between the engine and an inference worker.
 *
 * One JSON object per line in each direction:
 *   request  {"id": n, "type": "initialize"|"warmup"|"inference", "payload": {...}}
 *   response {"id": n, "ok": true|false, "result": ..., "error": "..."}
 *
 * Static settings travel once, at spawn time, in PROMPTSPAN_WORKER_CONFIG.
 */

constexpr const char* kSettingsEnvVar = "PROMPTSPAN_WORKER_CONFIG";

enum class RequestType {
    Initialize,
    Warmup,
    Inference
};

const char* to_string(RequestType type) noexcept;
std::optional<RequestType> parse_request_type(std::string_view name) noexcept;

struct Request {
    uint64_t id = 0;
    RequestType type = RequestType::Inference;
    boost::json::object payload;
};

struct Response {
    uint64_t id = 0;
    bool ok = false;
    boost::json::value result;
    std::string error;
};

// One detection in an inference result. Offsets are bytes into the request text.
struct Detection {
    size_t start = 0;
    size_t end = 0;
    std::string label;
    double score = 0.0;
};

struct WorkerSettings {
    std::string model_path;
    std::vector<std::string> labels;
    std::map<std::string, double> label_thresholds;
    double threshold = 0.3;
    int max_width = 12;
    int timeout_ms = 1500;
};

std::string encode_request(const Request& request);
std::optional<Request> decode_request(std::string_view line);

std::string encode_response(const Response& response);
// nullopt for lines that are not a response envelope (the channel logs and skips them).
std::optional<Response> decode_response(std::string_view line);

boost::json::object inference_payload(std::string_view text, double threshold, int timeout_ms);

boost::json::array encode_detections(const std::vector<Detection>& detections);
// Throws WorkerError(WORKER_PROTOCOL) when the result is not an array of detections.
std::vector<Detection> decode_detections(const boost::json::value& result);

std::string encode_settings(const WorkerSettings& settings);
// Throws WorkerError(WORKER_PROTOCOL) on malformed settings.
WorkerSettings decode_settings(std::string_view json_text);

} // namespace promptspan::worker
