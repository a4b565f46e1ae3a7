#pragma once

#include "promptspan/aho_corasick.hpp"
#include "promptspan/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptspan {

class Taxonomy;
class VocabularyStore;

/**
 * Tier 1: literal vocabulary matching.
 *
 * One automaton is compiled from the lower-cased vocabulary at construction.
 * match() lowers the input (ASCII only, so offsets are preserved), scans it
 * once and keeps matches that
 *   - sit on word boundaries at both ends,
 *   - for ambiguous camera verbs ("pan", "crane", "truck"...), have an
 *     independent camera cue within 50 characters and no culinary/domestic
 *     collocation next to them,
 *   - for "NNmm" lenses, are not immediately followed by "film".
 * Every accepted match has confidence 1.0 and casing taken from the input.
 */
class ClosedVocabMatcher {
public:
    ClosedVocabMatcher(const VocabularyStore& vocabulary, const Taxonomy& taxonomy);

    std::vector<CandidateSpan> match(std::string_view text) const;

    size_t pattern_count() const noexcept { return automaton_.pattern_count(); }

    // Window helpers, exposed for the action extractor's camera-verb suppression.
    static bool has_camera_context(std::string_view lowered, size_t start, size_t end,
                                   size_t radius = 50);
    static bool has_culinary_collocation(std::string_view lowered, size_t start, size_t end);

    static bool is_ambiguous_camera_term(const std::string& lowered_term);

private:
    static bool on_word_boundary(std::string_view text, size_t start, size_t end);
    static bool is_lens_before_film(std::string_view lowered, size_t start, size_t end);

    AhoCorasick automaton_;
    std::vector<std::vector<std::string>> pattern_roles_;
    std::vector<bool> pattern_ambiguous_;
};

} // namespace promptspan
