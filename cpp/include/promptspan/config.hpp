#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include "promptspan/logging.hpp"

namespace promptspan {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Environment first, then the optional key=value file on top of it.
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();

            if (!config_file.empty()) {
                if (std::filesystem::exists(config_file)) {
                    load_from_file(config_file);
                } else {
                    LOG_WARN("Config file not found: ", config_file, ", using environment and defaults");
                }
            }
        }
        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Resources
        set_if_env("vocab.path", "PROMPTSPAN_VOCAB_PATH", "data/vocab.json");
        set_if_env("taxonomy.path", "PROMPTSPAN_TAXONOMY_PATH", "");

        // Logging
        set_if_env("log.level", "PROMPTSPAN_LOG_LEVEL", "info");
        set_if_env("log.file", "PROMPTSPAN_LOG_FILE", "");

        // Tier 1 patterns and Tier 1.5 heuristics
        set_if_env("patterns.enabled", "PROMPTSPAN_PATTERNS_ENABLED", "true");
        set_if_env("action.enabled", "PROMPTSPAN_ACTION_ENABLED", "true");
        set_if_env("action.min_confidence", "PROMPTSPAN_ACTION_MIN_CONFIDENCE", "0.75");
        set_if_env("action.max_phrase_words", "PROMPTSPAN_ACTION_MAX_PHRASE_WORDS", "5");
        set_if_env("lighting.enabled", "PROMPTSPAN_LIGHTING_ENABLED", "true");
        set_if_env("lighting.min_confidence", "PROMPTSPAN_LIGHTING_MIN_CONFIDENCE", "0.70");
        set_if_env("lighting.max_phrase_words", "PROMPTSPAN_LIGHTING_MAX_PHRASE_WORDS", "5");
        set_if_env("embedding.dimensions", "PROMPTSPAN_EMBEDDING_DIMENSIONS", "256");

        // Tier 2 worker
        set_if_env("ner.enabled", "PROMPTSPAN_NER_ENABLED", "false");
        set_if_env("ner.worker", "PROMPTSPAN_NER_WORKER", "");
        set_if_env("ner.model_path", "PROMPTSPAN_NER_MODEL_PATH", "");
        set_if_env("ner.threshold", "PROMPTSPAN_NER_THRESHOLD", "0.3");
        set_if_env("ner.timeout_ms", "PROMPTSPAN_NER_TIMEOUT_MS", "1500");
        set_if_env("ner.max_width", "PROMPTSPAN_NER_MAX_WIDTH", "12");
        set_if_env("ner.label_thresholds", "PROMPTSPAN_NER_LABEL_THRESHOLDS", "");

        // Merge
        set_if_env("merge.prefer_source_priority", "PROMPTSPAN_MERGE_PREFER_SOURCE_PRIORITY", "true");
        set_if_env("merge.strategy", "PROMPTSPAN_MERGE_STRATEGY", "longest");

        // Fast-path assessment
        set_if_env("fast_path.min_coverage_percent", "PROMPTSPAN_FAST_PATH_MIN_COVERAGE_PERCENT", "30");
        set_if_env("fast_path.min_spans", "PROMPTSPAN_FAST_PATH_MIN_SPANS", "3");
        set_if_env("fast_path.sparse_min_spans", "PROMPTSPAN_FAST_PATH_SPARSE_MIN_SPANS", "2");
        set_if_env("fast_path.sparse_high_confidence", "PROMPTSPAN_FAST_PATH_SPARSE_HIGH_CONFIDENCE", "0.8");
        set_if_env("fast_path.sparse_min_signal_spans", "PROMPTSPAN_FAST_PATH_SPARSE_MIN_SIGNAL_SPANS", "2");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line ", line_no, " in ", filename);
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        bool valid = true;

        LogLevel parsed;
        if (!parse_log_level(get<std::string>("log.level"), parsed)) {
            LOG_WARN("Unknown log level '", get<std::string>("log.level"), "', defaulting to 'info'");
            set("log.level", "info");
        }

        std::string strategy = get<std::string>("merge.strategy");
        if (strategy != "longest" && strategy != "confidence") {
            LOG_ERROR("Unknown merge strategy '", strategy, "' (expected 'longest' or 'confidence')");
            valid = false;
        }

        double threshold = get<double>("ner.threshold", 0.3);
        if (threshold < 0.0 || threshold > 1.0) {
            LOG_ERROR("ner.threshold out of range [0,1]: ", threshold);
            valid = false;
        }

        if (get<int>("embedding.dimensions", 256) <= 0) {
            LOG_ERROR("embedding.dimensions must be positive");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

// Loads configuration and applies the logging settings. Returns false on invalid values.
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    const char* log_level_env = std::getenv("PROMPTSPAN_LOG_LEVEL");
    if (log_level_env) {
        LogLevel level;
        if (parse_log_level(log_level_env, level)) set_log_level(level);
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level;
    parse_log_level(config.get<std::string>("log.level"), level);
    set_log_level(level);

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace promptspan
