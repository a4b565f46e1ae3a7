// =============================================================================
// scripted_worker - deterministic stand-in for the open-vocabulary model
// =============================================================================
//
// Speaks the worker protocol on stdin/stdout. Inference "detects" a fixed
// word list at word boundaries so tests can predict the output exactly.
//
// Usage:
//   scripted_worker [normal|slow|crash|fail-init|garbage] [--delay-ms N]
//
// Modes:
//   normal     answers every request
//   slow       sleeps --delay-ms (default 2000) before each inference reply
//   crash      exits with status 3 on the first inference request
//   fail-init  rejects initialization
//   garbage    emits a non-JSON line, then a result that is not an array
//
// =============================================================================

#include "promptspan/worker/protocol.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace pw = promptspan::worker;

namespace {

struct ScriptedEntity {
    const char* word;
    const char* label;
    double score;
};

// "desert" scores below the default threshold; "gizmo" carries a label nothing maps.
const ScriptedEntity kEntities[] = {
    {"cowboy", "person", 0.92},
    {"horse", "animal", 0.81},
    {"rain", "weather", 0.66},
    {"saloon", "building", 0.74},
    {"desert", "place", 0.21},
    {"gizmo", "widget", 0.95},
};

bool boundary(const std::string& text, size_t pos) {
    if (pos >= text.size()) return true;
    unsigned char c = static_cast<unsigned char>(text[pos]);
    return !(std::isalnum(c) || c >= 0x80);
}

std::vector<pw::Detection> detect(const std::string& text) {
    std::string lower = text;
    for (auto& ch : lower) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    std::vector<pw::Detection> out;
    for (const auto& e : kEntities) {
        size_t len = std::strlen(e.word);
        for (size_t pos = lower.find(e.word); pos != std::string::npos; pos = lower.find(e.word, pos + 1)) {
            bool left = pos == 0 || boundary(lower, pos - 1);
            if (!left || !boundary(lower, pos + len)) continue;
            out.push_back({pos, pos + len, e.label, e.score});
        }
    }
    return out;
}

void reply(const pw::Response& response) {
    std::cout << pw::encode_response(response) << std::endl;
}

void reply_error(uint64_t id, const std::string& message) {
    pw::Response r;
    r.id = id;
    r.ok = false;
    r.error = message;
    reply(r);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string mode = "normal";
    int delay_ms = 2000;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--delay-ms" && i + 1 < argc) {
            delay_ms = std::atoi(argv[++i]);
        } else {
            mode = arg;
        }
    }

    // Settings must arrive through the environment; without them initialization is refused.
    bool have_settings = false;
    size_t label_count = 0;
    if (const char* raw = std::getenv(pw::kSettingsEnvVar)) {
        try {
            auto settings = pw::decode_settings(raw);
            have_settings = true;
            label_count = settings.labels.size();
        } catch (const std::exception& e) {
            std::cerr << "scripted_worker: bad settings: " << e.what() << std::endl;
        }
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        auto request = pw::decode_request(line);
        if (!request) {
            std::cerr << "scripted_worker: unreadable request" << std::endl;
            continue;
        }

        switch (request->type) {
            case pw::RequestType::Initialize: {
                if (mode == "fail-init") {
                    reply_error(request->id, "model failed to load");
                    break;
                }
                if (!have_settings || label_count == 0) {
                    reply_error(request->id, "missing worker settings");
                    break;
                }
                pw::Response r;
                r.id = request->id;
                r.ok = true;
                r.result = true;
                reply(r);
                break;
            }
            case pw::RequestType::Warmup: {
                pw::Response r;
                r.id = request->id;
                r.ok = true;
                reply(r);
                break;
            }
            case pw::RequestType::Inference: {
                if (mode == "crash") {
                    return 3;
                }
                if (mode == "slow") {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                }
                if (mode == "garbage") {
                    std::cout << "this is not a response" << std::endl;
                    pw::Response r;
                    r.id = request->id;
                    r.ok = true;
                    r.result = boost::json::object{{"unexpected", true}};
                    reply(r);
                    break;
                }

                std::string text;
                if (const auto* t = request->payload.if_contains("text"); t && t->is_string()) {
                    text.assign(t->get_string().data(), t->get_string().size());
                }
                pw::Response r;
                r.id = request->id;
                r.ok = true;
                r.result = pw::encode_detections(detect(text));
                reply(r);
                break;
            }
        }
    }
    return 0;
}
