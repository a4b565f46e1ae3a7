// =============================================================================
// promptspan CLI - Span extraction from the command line
// =============================================================================
//
// Usage:
//   promptspan [--config <file>] [-v|-q] <command> [options]
//
// Commands:
//   extract      Run every tier and print merged spans with stats
//   known        Closed vocabulary and technical patterns only
//   coverage     Estimated known-span coverage of the text
//   assess       Fast-path assessment of the merged spans
//   vocab-stats  Vocabulary and label statistics
//   warmup       Start and warm the open-vocabulary worker
//   version      Show version information
//
// Text arguments are joined with spaces; "-" reads the text from stdin.
// Results are printed as one JSON document on stdout, logs go to stderr.
//
// Examples:
//   promptspan extract "35mm lens, golden hour light, the camera slowly pans, 24fps"
//   echo "Wide shot of a desert road" | promptspan known -
//   promptspan --config promptspan.conf assess --max-spans 20 "..."
//
// =============================================================================

#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "promptspan/config.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/span_extractor.hpp"

namespace promptspan::cli {
    int cmd_extract(int argc, char* argv[]);
    int cmd_known(int argc, char* argv[]);
    int cmd_coverage(int argc, char* argv[]);
    int cmd_assess(int argc, char* argv[]);
    int cmd_vocab_stats(int argc, char* argv[]);
    int cmd_warmup(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================
//
// PROMPTSPAN_VERSION_* are defined by the build from project(VERSION).

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"extract",     "Run all tiers and print merged spans with stats", promptspan::cli::cmd_extract},
    {"known",       "Closed vocabulary and technical patterns only", promptspan::cli::cmd_known},
    {"coverage",    "Estimated known-span coverage (percent)", promptspan::cli::cmd_coverage},
    {"assess",      "Fast-path assessment of the merged spans", promptspan::cli::cmd_assess},
    {"vocab-stats", "Vocabulary and open-vocabulary label statistics", promptspan::cli::cmd_vocab_stats},
    {"warmup",      "Start and warm the open-vocabulary worker", promptspan::cli::cmd_warmup},
    {"version",     "Show version information", promptspan::cli::cmd_version},
    {"help",        "Show this help message", promptspan::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_CONFIG = 2,
    EXIT_SCAN = 3
};

namespace promptspan::cli {

namespace {

// Joins the remaining arguments; a lone "-" reads all of stdin.
bool read_text(int argc, char* argv[], std::string& out) {
    if (argc == 1 && std::strcmp(argv[0], "-") == 0) {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    if (argc < 1) return false;
    out.clear();
    for (int i = 0; i < argc; ++i) {
        if (i > 0) out += ' ';
        out += argv[i];
    }
    return true;
}

std::unique_ptr<SpanExtractionService> make_service() {
    if (!init_config(g_options.config_file)) {
        throw ConfigError("configuration is invalid", g_options.config_file);
    }
    if (g_options.verbose) {
        set_log_level(LogLevel::DEBUG);
        Config::getInstance().print();
    }
    if (g_options.quiet) set_log_level(LogLevel::ERROR);

    auto config = EngineConfig::from(Config::getInstance());
    return std::make_unique<SpanExtractionService>(config);
}

boost::json::array spans_json(const std::vector<Span>& spans) {
    boost::json::array arr;
    for (const auto& s : spans) {
        boost::json::object obj;
        obj["text"] = s.text;
        obj["role"] = s.role;
        obj["confidence"] = s.confidence;
        obj["start"] = static_cast<uint64_t>(s.start);
        obj["end"] = static_cast<uint64_t>(s.end);
        arr.push_back(std::move(obj));
    }
    return arr;
}

boost::json::object tier_json(const TierStats& t) {
    boost::json::object obj;
    obj["ran"] = t.ran;
    obj["candidates"] = static_cast<uint64_t>(t.candidates);
    obj["latencyMs"] = t.latency_ms;
    return obj;
}

boost::json::object stats_json(const ExtractionStats& s) {
    boost::json::object obj;
    obj["phase"] = s.phase;
    obj["totalSpans"] = static_cast<uint64_t>(s.total_spans);
    obj["closedVocab"] = tier_json(s.closed_vocab);
    obj["patterns"] = tier_json(s.patterns);
    obj["action"] = tier_json(s.action);
    obj["lighting"] = tier_json(s.lighting);
    obj["openVocab"] = tier_json(s.open_vocab);
    obj["mergeLatencyMs"] = s.merge_latency_ms;
    obj["totalLatencyMs"] = s.total_latency_ms;
    obj["openVocabReady"] = s.open_vocab_ready;
    return obj;
}

boost::json::object assessment_json(const FastPathAssessment& a) {
    boost::json::object coverage;
    coverage["subject"] = a.category_coverage.subject;
    coverage["action"] = a.category_coverage.action;
    coverage["environment"] = a.category_coverage.environment;
    coverage["count"] = static_cast<uint64_t>(a.category_coverage.count);

    boost::json::object obj;
    obj["accept"] = a.accept;
    obj["spanCount"] = static_cast<uint64_t>(a.span_count);
    obj["expectedMinSpans"] = static_cast<uint64_t>(a.expected_min_spans);
    obj["coveragePercent"] = std::round(a.coverage_percent * 10.0) / 10.0;
    obj["avgConfidence"] = a.avg_confidence;
    obj["highSignalCount"] = static_cast<uint64_t>(a.high_signal_count);
    obj["sparseHighConfidenceAccepted"] = a.sparse_high_confidence_accepted;
    obj["wordCount"] = static_cast<uint64_t>(a.word_count);
    obj["minSpanThreshold"] = static_cast<uint64_t>(a.min_span_threshold);
    obj["categoryCoverage"] = std::move(coverage);
    return obj;
}

void print(const boost::json::value& v) {
    std::cout << boost::json::serialize(v) << std::endl;
}

// Wraps a command body with the shared error-to-exit-code mapping.
template<typename Body>
int run_command(const char* name, Body&& body) {
    try {
        return body();
    } catch (const ConfigError& e) {
        std::cerr << name << ": " << e.what() << "\n";
        return EXIT_CONFIG;
    } catch (const ScanError& e) {
        std::cerr << name << ": " << e.what() << "\n";
        return EXIT_SCAN;
    } catch (const PromptSpanException& e) {
        std::cerr << name << ": " << e.what() << "\n";
        return EXIT_CONFIG;
    }
}

int usage(const char* name, const char* args) {
    std::cerr << "Usage: promptspan " << name << " " << args << "\n";
    return EXIT_USAGE;
}

} // namespace

// =============================================================================
// Commands
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "promptspan - taxonomy span extraction for video prompts\n";
    std::cout << "Version " << PROMPTSPAN_VERSION_STRING << "\n\n";
    std::cout << "Usage: promptspan [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 13; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nPROMPTSPAN_* environment variables set defaults; the config file overrides them.\n";
    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "promptspan " << PROMPTSPAN_VERSION_STRING << "\n";
    return EXIT_OK;
}

int cmd_extract(int argc, char* argv[]) {
    ExtractionOptions options;
    int i = 0;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-open-vocab") options.use_open_vocabulary = false;
        else if (arg == "--open-vocab") options.use_open_vocabulary = true;
        else if (arg == "--no-patterns") options.use_patterns = false;
        else if (arg == "--no-action") options.use_action = false;
        else if (arg == "--no-lighting") options.use_lighting = false;
        else break;
    }

    std::string text;
    if (!read_text(argc - i, argv + i, text)) {
        return usage("extract", "[--no-open-vocab|--open-vocab] [--no-patterns] [--no-action] "
                                "[--no-lighting] <text|->");
    }

    return run_command("extract", [&] {
        auto service = make_service();
        auto result = service->extract_spans(text, options);

        boost::json::object out;
        out["spans"] = spans_json(result.spans);
        out["stats"] = stats_json(result.stats);
        print(out);
        return EXIT_OK;
    });
}

int cmd_known(int argc, char* argv[]) {
    std::string text;
    if (!read_text(argc, argv, text)) return usage("known", "<text|->");

    return run_command("known", [&] {
        auto service = make_service();
        boost::json::object out;
        out["spans"] = spans_json(service->extract_known_spans(text));
        print(out);
        return EXIT_OK;
    });
}

int cmd_coverage(int argc, char* argv[]) {
    std::string text;
    if (!read_text(argc, argv, text)) return usage("coverage", "<text|->");

    return run_command("coverage", [&] {
        auto service = make_service();
        boost::json::object out;
        out["coveragePercent"] = service->estimate_coverage(text);
        print(out);
        return EXIT_OK;
    });
}

int cmd_assess(int argc, char* argv[]) {
    size_t max_spans = 0;
    int i = 0;
    if (argc >= 2 && std::strcmp(argv[0], "--max-spans") == 0) {
        try {
            int parsed = std::stoi(argv[1]);
            if (parsed <= 0) return usage("assess", "[--max-spans N>0] <text|->");
            max_spans = static_cast<size_t>(parsed);
        } catch (const std::exception&) {
            return usage("assess", "[--max-spans N] <text|->");
        }
        i = 2;
    }

    std::string text;
    if (!read_text(argc - i, argv + i, text)) return usage("assess", "[--max-spans N] <text|->");

    return run_command("assess", [&] {
        auto service = make_service();
        auto result = service->extract_spans(text);
        auto assessment = service->assess_fast_path(result.spans, text, max_spans);

        boost::json::object out;
        out["assessment"] = assessment_json(assessment);
        out["spans"] = spans_json(result.spans);
        print(out);
        return assessment.accept ? EXIT_OK : EXIT_USAGE;
    });
}

int cmd_vocab_stats([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    return run_command("vocab-stats", [&] {
        auto service = make_service();
        auto stats = service->vocab_stats();

        boost::json::object categories;
        for (const auto& [id, cat] : stats.categories) {
            boost::json::array samples;
            for (const auto& t : cat.sample_terms) samples.emplace_back(t);
            boost::json::object entry;
            entry["termCount"] = static_cast<uint64_t>(cat.term_count);
            entry["sampleTerms"] = std::move(samples);
            categories[id] = std::move(entry);
        }

        boost::json::object out;
        out["totalCategories"] = static_cast<uint64_t>(stats.total_categories);
        out["totalTerms"] = static_cast<uint64_t>(stats.total_terms);
        out["categories"] = std::move(categories);
        out["openVocabLabels"] = static_cast<uint64_t>(stats.open_vocab_labels);
        out["openVocabReady"] = stats.open_vocab_ready;
        print(out);
        return EXIT_OK;
    });
}

int cmd_warmup([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    return run_command("warmup", [&] {
        auto service = make_service();
        auto result = service->warmup();

        boost::json::object out;
        out["success"] = result.success;
        out["message"] = result.message;
        print(out);
        return result.success ? EXIT_OK : EXIT_USAGE;
    });
}

}  // namespace promptspan::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        promptspan::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'promptspan help' for usage.\n";
    return EXIT_USAGE;
}
