#pragma once

#include "promptspan/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace promptspan {

class Taxonomy;

enum class MergeStrategy {
    Longest,      // length, then confidence
    Confidence    // confidence, then length
};

const char* to_string(MergeStrategy strategy) noexcept;
std::optional<MergeStrategy> parse_merge_strategy(std::string_view name) noexcept;

struct MergeOptions {
    bool prefer_source_priority = true;
    MergeStrategy strategy = MergeStrategy::Longest;
};

/**
 * Overlap resolution across tiers.
 *
 * Candidates are validated, put in a total order, then admitted greedily.
 * A candidate overlapping accepted spans of its own parent branch competes
 * with them on, in order:
 *   1. source priority (when enabled),
 *   2. role specificity,
 *   3. the configured strategy (length/confidence),
 *   4. leftmost start,
 *   5. role, then source.
 * Spans of different branches never compete. Section-header words
 * ("## Camera", "Style:") are dropped last.
 */
class SpanMerger {
public:
    explicit SpanMerger(const Taxonomy& taxonomy, MergeOptions options = {});

    std::vector<CandidateSpan> merge(std::string_view text,
                                     std::vector<CandidateSpan> candidates) const;

    bool is_well_formed(std::string_view text, const CandidateSpan& candidate) const;

    // True when `a` beats `b` under the ordered tie-break keys.
    bool beats(const CandidateSpan& a, const CandidateSpan& b) const;

    bool is_section_header(std::string_view text, const CandidateSpan& span) const;

    const MergeOptions& options() const noexcept { return options_; }

private:
    const Taxonomy& taxonomy_;
    MergeOptions options_;
};

} // namespace promptspan
