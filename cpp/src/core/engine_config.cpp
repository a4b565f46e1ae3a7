#include "promptspan/engine_config.hpp"
#include "promptspan/config.hpp"
#include "promptspan/error.hpp"
#include "promptspan/util/text.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace promptspan {

namespace {

double unit_interval(const Config& config, const std::string& key, double fallback) {
    double v = config.get<double>(key, fallback);
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigError("value out of range [0,1]", key + "=" + config.get<std::string>(key));
    }
    return v;
}

size_t positive(const Config& config, const std::string& key, int fallback) {
    int v = config.get<int>(key, fallback);
    if (v <= 0) {
        throw ConfigError("value must be positive", key + "=" + config.get<std::string>(key));
    }
    return static_cast<size_t>(v);
}

} // namespace

std::map<std::string, double> EngineConfig::parse_label_thresholds(const std::string& text) {
    std::map<std::string, double> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string entry = util::trim(item);
        if (entry.empty()) continue;

        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("label threshold needs label=value", entry);
        }
        std::string label = util::to_lower_ascii(util::trim(entry.substr(0, eq)));
        std::string value = util::trim(entry.substr(eq + 1));
        // Taxonomy ids are camelCase ("lighting.timeOfDay"); keep them verbatim.
        if (label.find('.') != std::string::npos) {
            label = util::trim(entry.substr(0, eq));
        }

        double threshold = 0.0;
        try {
            size_t used = 0;
            threshold = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
        } catch (const std::exception&) {
            throw ConfigError("label threshold is not a number", entry);
        }
        if (label.empty() || !std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
            throw ConfigError("label threshold out of range [0,1]", entry);
        }
        out[label] = threshold;
    }
    return out;
}

EngineConfig EngineConfig::from(const Config& config) {
    EngineConfig ec;

    ec.vocab_path = config.get<std::string>("vocab.path", ec.vocab_path);
    ec.taxonomy_path = config.get<std::string>("taxonomy.path", "");

    ec.patterns_enabled = config.get<bool>("patterns.enabled", true);
    ec.action_enabled = config.get<bool>("action.enabled", true);
    ec.lighting_enabled = config.get<bool>("lighting.enabled", true);
    ec.action.min_confidence = unit_interval(config, "action.min_confidence", 0.75);
    ec.action.max_phrase_words = positive(config, "action.max_phrase_words", 5);
    ec.lighting.min_confidence = unit_interval(config, "lighting.min_confidence", 0.70);
    ec.lighting.max_phrase_words = positive(config, "lighting.max_phrase_words", 5);
    ec.embedding_dimensions = positive(config, "embedding.dimensions", 256);

    auto& ov = ec.open_vocab;
    ov.enabled = config.get<bool>("ner.enabled", false);
    ov.worker_path = config.get<std::string>("ner.worker", "");
    ov.model_path = config.get<std::string>("ner.model_path", "");
    ov.threshold = unit_interval(config, "ner.threshold", 0.3);
    ov.timeout_ms = config.get<int>("ner.timeout_ms", 1500);
    if (ov.timeout_ms < 1) {
        throw ConfigError("ner.timeout_ms must be positive",
                          "ner.timeout_ms=" + config.get<std::string>("ner.timeout_ms"));
    }
    ov.max_width = static_cast<int>(positive(config, "ner.max_width", 12));
    ov.label_thresholds = parse_label_thresholds(config.get<std::string>("ner.label_thresholds", ""));
    if (ov.enabled && ov.worker_path.empty()) {
        LOG_WARN("ner.enabled is set but ner.worker is empty; the open-vocabulary tier will stay idle");
    }

    ec.merge.prefer_source_priority = config.get<bool>("merge.prefer_source_priority", true);
    std::string strategy = config.get<std::string>("merge.strategy", "longest");
    auto parsed = parse_merge_strategy(strategy);
    if (!parsed) {
        throw ConfigError("unknown merge strategy", "merge.strategy=" + strategy,
                          "Use 'longest' or 'confidence'");
    }
    ec.merge.strategy = *parsed;

    auto& fp = ec.fast_path;
    fp.min_coverage_percent = config.get<double>("fast_path.min_coverage_percent", 30.0);
    if (fp.min_coverage_percent < 0.0 || fp.min_coverage_percent > 100.0) {
        throw ConfigError("fast_path.min_coverage_percent out of range [0,100]");
    }
    fp.min_spans = positive(config, "fast_path.min_spans", 3);
    fp.sparse_min_spans = positive(config, "fast_path.sparse_min_spans", 2);
    fp.sparse_high_confidence = unit_interval(config, "fast_path.sparse_high_confidence", 0.8);
    fp.sparse_min_signal_spans = positive(config, "fast_path.sparse_min_signal_spans", 2);

    return ec;
}

} // namespace promptspan
