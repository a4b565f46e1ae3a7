#include "promptspan/fast_path.hpp"
#include "promptspan/util/text.hpp"

#include <algorithm>

namespace promptspan {

namespace {

struct WordRange {
    size_t start;
    size_t end;
};

bool is_joiner(char c) {
    return c == '\'' || c == '-';
}

// Letter/digit runs with inner apostrophes and hyphens.
std::vector<WordRange> word_ranges(std::string_view text) {
    std::vector<WordRange> words;
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (!util::word_char_at(text, i) && !is_joiner(text[i])) {
            size_t length = 0;
            util::decode_utf8_at(text, i, length);
            i += length;
            continue;
        }
        size_t start = i;
        while (i < n) {
            if (size_t step = util::word_char_at(text, i)) i += step;
            else if (is_joiner(text[i])) ++i;
            else break;
        }
        size_t end = i;
        while (start < end && is_joiner(text[start])) ++start;
        while (end > start && is_joiner(text[end - 1])) --end;
        if (start < end) words.push_back({start, end});
    }
    return words;
}

std::string parent_category(const std::string& role) {
    size_t dot = role.find('.');
    return dot == std::string::npos ? role : role.substr(0, dot);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

size_t expected_min_spans(std::string_view text, size_t max_spans) {
    size_t words = util::count_words(text);

    size_t expected;
    if (words < 40) expected = 1;
    else if (words < 80) expected = 4;
    else if (words < 140) expected = 8;
    else if (words < 220) expected = 12;
    else expected = 15;

    size_t limit = max_spans > 0 ? max_spans : 60;
    return std::max<size_t>(1, std::min(expected, limit));
}

double word_coverage_percent(const std::vector<Span>& spans, std::string_view text) {
    if (spans.empty() || text.empty()) return 0.0;

    auto words = word_ranges(text);
    if (words.empty()) return 0.0;

    std::vector<bool> covered(words.size(), false);
    for (const auto& span : spans) {
        for (size_t i = 0; i < words.size(); ++i) {
            if (words[i].end <= span.start) continue;
            if (words[i].start >= span.end) break;
            covered[i] = true;
        }
    }

    size_t count = static_cast<size_t>(std::count(covered.begin(), covered.end(), true));
    return static_cast<double>(count) / static_cast<double>(words.size()) * 100.0;
}

bool is_high_signal_role(const std::string& role) {
    std::string lower = util::to_lower_ascii(role);
    for (const char* prefix : {"technical", "camera", "shot", "style", "audio", "lighting"}) {
        if (starts_with(lower, prefix)) return true;
    }
    return false;
}

FastPathAssessment assess_fast_path(const std::vector<Span>& spans, std::string_view text,
                                    const FastPathConfig& config, size_t max_spans) {
    FastPathAssessment a;
    a.span_count = spans.size();
    a.word_count = util::count_words(text);
    a.coverage_percent = word_coverage_percent(spans, text);
    a.min_span_threshold = config.min_spans;

    size_t expected = expected_min_spans(text, max_spans > 0 ? max_spans : config.max_spans);

    double total = 0.0;
    for (const auto& s : spans) total += s.confidence;
    a.avg_confidence = spans.empty() ? 0.0 : total / static_cast<double>(spans.size());

    double high_confidence = std::max(config.sparse_high_confidence, config.base_min_confidence);
    for (const auto& s : spans) {
        if (s.confidence >= high_confidence && is_high_signal_role(s.role)) ++a.high_signal_count;
    }

    a.sparse_high_confidence_accepted =
        a.coverage_percent < config.min_coverage_percent &&
        a.span_count >= config.sparse_min_spans &&
        a.avg_confidence >= high_confidence &&
        a.high_signal_count >= config.sparse_min_signal_spans;

    for (const auto& s : spans) {
        std::string parent = parent_category(s.role);
        if (parent == "subject") a.category_coverage.subject = true;
        if (parent == "action") a.category_coverage.action = true;
        if (parent == "environment") a.category_coverage.environment = true;
    }
    a.category_coverage.count = static_cast<size_t>(a.category_coverage.subject) +
                                static_cast<size_t>(a.category_coverage.action) +
                                static_cast<size_t>(a.category_coverage.environment);

    a.expected_min_spans = a.word_count >= 80 ? std::max(expected, config.min_spans) : expected;
    a.accept = a.span_count >= a.expected_min_spans || a.sparse_high_confidence_accepted;
    return a;
}

} // namespace promptspan
