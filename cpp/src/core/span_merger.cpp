#include "promptspan/span_merger.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/util/text.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <tuple>

namespace promptspan {

namespace {

bool candidate_order(const CandidateSpan& a, const CandidateSpan& b) {
    if (a.start != b.start) return a.start < b.start;
    if (a.end != b.end) return a.end > b.end;
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.source != b.source) return static_cast<int>(a.source) < static_cast<int>(b.source);
    if (a.role != b.role) return a.role < b.role;
    return a.text < b.text;
}

bool output_order(const CandidateSpan& a, const CandidateSpan& b) {
    return std::tie(a.start, a.end, a.role) < std::tie(b.start, b.end, b.role);
}

bool is_header_marker(char c) {
    return std::strchr("#*-_>", c) != nullptr;
}

} // namespace

const char* to_string(MergeStrategy strategy) noexcept {
    return strategy == MergeStrategy::Confidence ? "confidence" : "longest";
}

std::optional<MergeStrategy> parse_merge_strategy(std::string_view name) noexcept {
    if (name == "longest") return MergeStrategy::Longest;
    if (name == "confidence") return MergeStrategy::Confidence;
    return std::nullopt;
}

SpanMerger::SpanMerger(const Taxonomy& taxonomy, MergeOptions options)
    : taxonomy_(taxonomy)
    , options_(options) {}

bool SpanMerger::is_well_formed(std::string_view text, const CandidateSpan& c) const {
    if (c.start >= c.end || c.end > text.size()) return false;
    if (util::trim(c.text).empty()) return false;
    if (!std::isfinite(c.confidence)) return false;
    return taxonomy_.is_valid(c.role);
}

bool SpanMerger::beats(const CandidateSpan& a, const CandidateSpan& b) const {
    if (options_.prefer_source_priority) {
        int pa = source_priority(a.source);
        int pb = source_priority(b.source);
        if (pa != pb) return pa > pb;
    }

    int sa = Taxonomy::specificity(a.role);
    int sb = Taxonomy::specificity(b.role);
    if (sa != sb) return sa > sb;

    if (options_.strategy == MergeStrategy::Longest) {
        if (a.length() != b.length()) return a.length() > b.length();
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
    } else {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.length() != b.length()) return a.length() > b.length();
    }

    if (a.start != b.start) return a.start < b.start;
    if (a.role != b.role) return a.role < b.role;
    return static_cast<int>(a.source) < static_cast<int>(b.source);
}

bool SpanMerger::is_section_header(std::string_view text, const CandidateSpan& span) const {
    if (util::split_whitespace(span.text).size() > 2) return false;

    std::string label = util::to_lower_ascii(util::trim(span.text));
    bool colon_in_span = !label.empty() && label.back() == ':';
    if (colon_in_span) {
        label.pop_back();
        label = util::trim(label);
    }
    if (label.empty() || taxonomy_.header_labels().count(label) == 0) return false;

    // Line prefix may only hold markdown markers and whitespace.
    size_t line_start = span.start;
    while (line_start > 0 && text[line_start - 1] != '\n') --line_start;
    bool marker = false;
    for (size_t i = line_start; i < span.start; ++i) {
        char c = text[i];
        if (is_header_marker(c)) {
            marker = true;
        } else if (!util::is_space(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    // Suffix: optional emphasis close, optional colon, then end of line.
    size_t i = span.end;
    while (i < text.size() && (text[i] == '*' || text[i] == '_')) ++i;
    bool colon = colon_in_span;
    if (i < text.size() && text[i] == ':') {
        colon = true;
        ++i;
    }
    while (i < text.size() && (text[i] == '*' || text[i] == '_')) ++i;
    while (i < text.size() && text[i] != '\n') {
        if (!util::is_space(static_cast<unsigned char>(text[i]))) return false;
        ++i;
    }

    return marker || colon;
}

std::vector<CandidateSpan> SpanMerger::merge(std::string_view text,
                                             std::vector<CandidateSpan> candidates) const {
    size_t before = candidates.size();
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const CandidateSpan& c) { return !is_well_formed(text, c); }),
                     candidates.end());
    if (candidates.size() != before) {
        LOG_DEBUG("[merge] dropped ", before - candidates.size(), " malformed candidates");
    }

    std::sort(candidates.begin(), candidates.end(), candidate_order);

    std::vector<CandidateSpan> accepted;
    std::vector<std::string> accepted_parents;
    std::vector<size_t> overlapping;

    for (auto& candidate : candidates) {
        std::string parent = taxonomy_.parent_of(candidate.role);

        overlapping.clear();
        for (size_t i = 0; i < accepted.size(); ++i) {
            if (accepted_parents[i] == parent && accepted[i].overlaps(candidate)) {
                overlapping.push_back(i);
            }
        }

        if (overlapping.empty()) {
            accepted.push_back(std::move(candidate));
            accepted_parents.push_back(std::move(parent));
            continue;
        }

        bool candidate_wins = true;
        for (size_t idx : overlapping) {
            if (!beats(candidate, accepted[idx])) {
                candidate_wins = false;
                break;
            }
        }
        if (!candidate_wins) continue;

        LOG_DEBUG("[merge] ", to_string(candidate.source), " '", candidate.text, "' (", candidate.role,
                  ") replaces ", overlapping.size(), " overlapping span(s)");
        // Erase back to front so earlier indices stay valid.
        for (auto it = overlapping.rbegin(); it != overlapping.rend(); ++it) {
            accepted.erase(accepted.begin() + static_cast<std::ptrdiff_t>(*it));
            accepted_parents.erase(accepted_parents.begin() + static_cast<std::ptrdiff_t>(*it));
        }
        accepted.push_back(std::move(candidate));
        accepted_parents.push_back(std::move(parent));
    }

    accepted.erase(std::remove_if(accepted.begin(), accepted.end(),
                                  [&](const CandidateSpan& s) { return is_section_header(text, s); }),
                   accepted.end());

    std::sort(accepted.begin(), accepted.end(), output_order);
    return accepted;
}

} // namespace promptspan
