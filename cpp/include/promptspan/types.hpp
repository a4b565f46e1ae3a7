#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace promptspan {

// =============================================================================
// Span types
// =============================================================================

// Which tier produced a candidate. Never part of the public Span.
enum class SpanSource {
    ClosedVocab,
    Pattern,
    ActionHeuristic,
    Lighting,
    OpenVocab
};

const char* to_string(SpanSource source) noexcept;

// Merge trust rank: exact matchers above the model, the model above heuristics.
int source_priority(SpanSource source) noexcept;

/**
 * Labeled substring of the input.
 *
 * Offsets are half-open byte offsets into the UTF-8 input and satisfy
 * 0 <= start < end <= input size.
 */
struct Span {
    std::string text;
    std::string role;
    double confidence = 0.0;
    size_t start = 0;
    size_t end = 0;

    size_t length() const noexcept { return end - start; }

    bool operator==(const Span& other) const {
        return start == other.start && end == other.end && role == other.role &&
               text == other.text && confidence == other.confidence;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

// Internal candidate with provenance.
struct CandidateSpan {
    std::string text;
    std::string role;
    double confidence = 0.0;
    size_t start = 0;
    size_t end = 0;
    SpanSource source = SpanSource::ClosedVocab;

    size_t length() const noexcept { return end - start; }
    bool overlaps(const CandidateSpan& other) const noexcept {
        return start < other.end && other.start < end;
    }
};

// Projection at the pipeline boundary: drops the source tag.
Span to_span(const CandidateSpan& candidate);
std::vector<Span> to_spans(const std::vector<CandidateSpan>& candidates);

// =============================================================================
// Extraction call types
// =============================================================================

// Per-call switches. Unset fields fall back to the engine configuration.
struct ExtractionOptions {
    std::optional<bool> use_open_vocabulary;
    std::optional<bool> use_patterns;
    std::optional<bool> use_action;
    std::optional<bool> use_lighting;
};

struct TierStats {
    size_t candidates = 0;
    double latency_ms = 0.0;
    bool ran = false;
};

struct ExtractionStats {
    std::string phase;
    size_t total_spans = 0;
    TierStats closed_vocab;
    TierStats patterns;
    TierStats action;
    TierStats lighting;
    TierStats open_vocab;
    double merge_latency_ms = 0.0;
    double total_latency_ms = 0.0;
    bool open_vocab_ready = false;
};

struct ExtractionResult {
    std::vector<Span> spans;
    ExtractionStats stats;
};

struct CategoryVocabStats {
    size_t term_count = 0;
    std::vector<std::string> sample_terms;
};

struct VocabStats {
    size_t total_categories = 0;
    size_t total_terms = 0;
    std::map<std::string, CategoryVocabStats> categories;
    size_t open_vocab_labels = 0;
    bool open_vocab_ready = false;
};

struct WarmupResult {
    bool success = false;
    std::string message;
};

} // namespace promptspan
