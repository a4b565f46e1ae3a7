#pragma once

#include "promptspan/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptspan {

struct FastPathConfig {
    double min_coverage_percent = 30.0;
    size_t min_spans = 3;
    size_t sparse_min_spans = 2;
    double sparse_high_confidence = 0.8;
    size_t sparse_min_signal_spans = 2;
    double base_min_confidence = 0.5;
    size_t max_spans = 60;
};

struct CategoryCoverage {
    bool subject = false;
    bool action = false;
    bool environment = false;
    size_t count = 0;
};

struct FastPathAssessment {
    bool accept = false;
    size_t span_count = 0;
    size_t expected_min_spans = 0;   // after the long-prompt floor
    double coverage_percent = 0.0;
    double avg_confidence = 0.0;
    size_t high_signal_count = 0;
    bool sparse_high_confidence_accepted = false;
    size_t word_count = 0;
    size_t min_span_threshold = 0;
    CategoryCoverage category_coverage;
};

// Span count a prompt of this length should reach: 1, 4, 8, 12 or 15 by word count, capped by max_spans.
size_t expected_min_spans(std::string_view text, size_t max_spans);

// Percent of words touched by at least one span.
double word_coverage_percent(const std::vector<Span>& spans, std::string_view text);

// technical, camera, shot, style, audio and lighting roles.
bool is_high_signal_role(const std::string& role);

/**
 * Decides whether merged spans are rich enough to skip the LLM tier.
 *
 * Accepts when the span count reaches the length-based expectation, or when
 * a low-coverage result is still made of few but confident technical spans.
 * A max_spans of 0 uses config.max_spans.
 */
FastPathAssessment assess_fast_path(const std::vector<Span>& spans, std::string_view text,
                                    const FastPathConfig& config, size_t max_spans = 0);

} // namespace promptspan
