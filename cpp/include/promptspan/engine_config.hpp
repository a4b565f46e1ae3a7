#pragma once

#include "promptspan/action_extractor.hpp"
#include "promptspan/fast_path.hpp"
#include "promptspan/lighting_extractor.hpp"
#include "promptspan/open_vocab_extractor.hpp"
#include "promptspan/span_merger.hpp"

#include <map>
#include <string>

namespace promptspan {

class Config;

// Typed engine settings, resolved once from the key/value Config.
struct EngineConfig {
    std::string vocab_path = "data/vocab.json";
    std::string taxonomy_path;            // empty: built-in taxonomy

    bool patterns_enabled = true;
    bool action_enabled = true;
    bool lighting_enabled = true;
    ActionExtractorConfig action;
    LightingExtractorConfig lighting;
    size_t embedding_dimensions = 256;

    OpenVocabConfig open_vocab;
    MergeOptions merge;
    FastPathConfig fast_path;

    // Throws ConfigError on out-of-range or unparseable values.
    static EngineConfig from(const Config& config);

    // "person=0.5, camera.lens=0.4" -> {person: 0.5, camera.lens: 0.4}. Throws ConfigError.
    static std::map<std::string, double> parse_label_thresholds(const std::string& text);
};

} // namespace promptspan
