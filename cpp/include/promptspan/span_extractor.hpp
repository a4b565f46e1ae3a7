/**
 * Span Extraction Service
 *
 * One object owns every table and tier: taxonomy, vocabulary, the Tier 1
 * automaton and pattern rules, the Tier 1.5 action and lighting extractors,
 * the Tier 2 worker handle and the merger. Build it once and share it by
 * reference; all read paths are safe for concurrent callers.
 *
 * Usage:
 *   auto ec = EngineConfig::from(Config::getInstance());
 *   SpanExtractionService service(ec);
 *   auto result = service.extract_spans("35mm lens, golden hour light");
 */

#pragma once

#include "promptspan/action_extractor.hpp"
#include "promptspan/closed_vocab_matcher.hpp"
#include "promptspan/engine_config.hpp"
#include "promptspan/fast_path.hpp"
#include "promptspan/lighting_extractor.hpp"
#include "promptspan/open_vocab_extractor.hpp"
#include "promptspan/pattern_matcher.hpp"
#include "promptspan/span_merger.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/types.hpp"
#include "promptspan/vocabulary.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace promptspan {

class SpanExtractionService {
public:
    // Loads the taxonomy and vocabulary named by the config; load failures degrade to defaults.
    explicit SpanExtractionService(const EngineConfig& config);

    SpanExtractionService(Taxonomy taxonomy,
                          const VocabularyStore& vocabulary,
                          const EngineConfig& config,
                          std::shared_ptr<const embedding::TextEncoder> encoder = nullptr);

    SpanExtractionService(const SpanExtractionService&) = delete;
    SpanExtractionService& operator=(const SpanExtractionService&) = delete;

    /**
     * Runs every enabled tier and merges the candidates.
     *
     * Tier 2 failures and timeouts only remove its contribution. Throws
     * ScanError when the pattern engine cannot scan the input.
     */
    ExtractionResult extract_spans(std::string_view text, const ExtractionOptions& options = {});

    // Tier 1 and patterns only, merged. No classifiers, no worker.
    std::vector<Span> extract_known_spans(std::string_view text) const;

    // Words covered by known spans over words in the text, as a percentage capped at 100.
    int estimate_coverage(std::string_view text) const;

    FastPathAssessment assess_fast_path(const std::vector<Span>& spans, std::string_view text,
                                        size_t max_spans = 0) const;

    VocabStats vocab_stats() const;

    WarmupResult warmup();

    const Taxonomy& taxonomy() const noexcept { return taxonomy_; }
    const VocabularyStore& vocabulary() const noexcept { return vocabulary_; }
    const EngineConfig& config() const noexcept { return config_; }
    OpenVocabExtractor& open_vocab() noexcept { return open_vocab_; }

private:
    std::vector<CandidateSpan> known_candidates(std::string_view text, bool use_patterns) const;

    EngineConfig config_;
    Taxonomy taxonomy_;
    VocabularyStore vocabulary_;
    std::shared_ptr<const embedding::TextEncoder> encoder_;

    ClosedVocabMatcher closed_vocab_;
    PatternMatcher patterns_;
    ActionExtractor action_;
    LightingExtractor lighting_;
    OpenVocabExtractor open_vocab_;
    SpanMerger merger_;
};

} // namespace promptspan
