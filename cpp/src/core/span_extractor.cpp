#include "promptspan/span_extractor.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/util/text.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace promptspan {

namespace {

using Clock = std::chrono::steady_clock;

double ms_since(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::shared_ptr<const embedding::TextEncoder> default_encoder(
    std::shared_ptr<const embedding::TextEncoder> encoder, size_t dimensions) {
    if (encoder) return encoder;
    return std::make_shared<embedding::HashedNgramEncoder>(dimensions);
}

template<typename Tier>
void run_tier(TierStats& stats, std::vector<CandidateSpan>& sink, Tier&& tier) {
    auto start = Clock::now();
    auto found = tier();
    stats.ran = true;
    stats.candidates = found.size();
    stats.latency_ms = ms_since(start);
    sink.insert(sink.end(), std::make_move_iterator(found.begin()),
                std::make_move_iterator(found.end()));
}

} // namespace

SpanExtractionService::SpanExtractionService(const EngineConfig& config)
    : SpanExtractionService(Taxonomy::load_or_builtin(config.taxonomy_path),
                            VocabularyStore::load(config.vocab_path),
                            config) {}

SpanExtractionService::SpanExtractionService(Taxonomy taxonomy,
                                             const VocabularyStore& vocabulary,
                                             const EngineConfig& config,
                                             std::shared_ptr<const embedding::TextEncoder> encoder)
    : config_(config)
    , taxonomy_(std::move(taxonomy))
    , vocabulary_(vocabulary.resolved(taxonomy_))
    , encoder_(default_encoder(std::move(encoder), config.embedding_dimensions))
    , closed_vocab_(vocabulary_, taxonomy_)
    , patterns_()
    , action_(encoder_, config.action)
    , lighting_(encoder_, config.lighting)
    , open_vocab_(taxonomy_, config.open_vocab)
    , merger_(taxonomy_, config.merge) {
    LOG_INFO("Span extraction ready: ", taxonomy_.categories().size(), " categories, ",
             vocabulary_.term_count(), " terms, ", closed_vocab_.pattern_count(), " automaton patterns");
}

std::vector<CandidateSpan> SpanExtractionService::known_candidates(std::string_view text,
                                                                   bool use_patterns) const {
    auto candidates = closed_vocab_.match(text);
    if (use_patterns) {
        auto technical = patterns_.match(text);
        candidates.insert(candidates.end(), std::make_move_iterator(technical.begin()),
                          std::make_move_iterator(technical.end()));
    }
    return candidates;
}

ExtractionResult SpanExtractionService::extract_spans(std::string_view text,
                                                      const ExtractionOptions& options) {
    ExtractionResult result;
    auto started = Clock::now();

    if (util::trim(text).empty()) {
        result.stats.phase = "empty-input";
        result.stats.open_vocab_ready = open_vocab_.is_ready();
        return result;
    }
    result.stats.phase = "neuro-symbolic";

    bool use_patterns = options.use_patterns.value_or(config_.patterns_enabled);
    bool use_action = options.use_action.value_or(config_.action_enabled);
    bool use_lighting = options.use_lighting.value_or(config_.lighting_enabled);
    bool use_open = options.use_open_vocabulary.value_or(config_.open_vocab.enabled);

    std::vector<CandidateSpan> candidates;
    auto& stats = result.stats;

    run_tier(stats.closed_vocab, candidates, [&] { return closed_vocab_.match(text); });
    if (use_patterns) {
        run_tier(stats.patterns, candidates, [&] { return patterns_.match(text); });
    }
    if (use_action) {
        run_tier(stats.action, candidates, [&] { return action_.extract(text); });
    }
    if (use_lighting) {
        run_tier(stats.lighting, candidates, [&] { return lighting_.extract(text); });
    }
    if (use_open) {
        run_tier(stats.open_vocab, candidates, [&] { return open_vocab_.extract(text); });
    }
    stats.open_vocab_ready = open_vocab_.is_ready();

    auto merge_start = Clock::now();
    auto merged = merger_.merge(text, std::move(candidates));
    stats.merge_latency_ms = ms_since(merge_start);

    result.spans = to_spans(merged);
    stats.total_spans = result.spans.size();
    stats.total_latency_ms = ms_since(started);

    LOG_DEBUG("extract_spans: ", stats.total_spans, " spans (closed=", stats.closed_vocab.candidates,
              " patterns=", stats.patterns.candidates, " action=", stats.action.candidates,
              " lighting=", stats.lighting.candidates, " open=", stats.open_vocab.candidates,
              ") in ", stats.total_latency_ms, "ms");
    return result;
}

std::vector<Span> SpanExtractionService::extract_known_spans(std::string_view text) const {
    if (util::trim(text).empty()) return {};
    return to_spans(merger_.merge(text, known_candidates(text, config_.patterns_enabled)));
}

int SpanExtractionService::estimate_coverage(std::string_view text) const {
    size_t words = util::count_words(text);
    if (words == 0) return 0;

    size_t covered = 0;
    for (const auto& span : extract_known_spans(text)) {
        covered += std::max<size_t>(1, util::count_words(span.text));
    }

    double percent = std::round(static_cast<double>(covered) / static_cast<double>(words) * 100.0);
    return static_cast<int>(std::min(100.0, percent));
}

FastPathAssessment SpanExtractionService::assess_fast_path(const std::vector<Span>& spans,
                                                           std::string_view text,
                                                           size_t max_spans) const {
    return promptspan::assess_fast_path(spans, text, config_.fast_path, max_spans);
}

VocabStats SpanExtractionService::vocab_stats() const {
    VocabStats stats = vocabulary_.stats();
    stats.open_vocab_labels = open_vocab_.labels().size();
    stats.open_vocab_ready = open_vocab_.is_ready();
    return stats;
}

WarmupResult SpanExtractionService::warmup() {
    auto started = Clock::now();
    WarmupResult result = open_vocab_.warmup();
    LOG_INFO("Warmup ", result.success ? "succeeded" : "failed", " in ", ms_since(started), "ms");
    return result;
}

} // namespace promptspan
