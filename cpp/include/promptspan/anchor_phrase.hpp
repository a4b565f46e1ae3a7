#pragma once

#include "promptspan/util/text.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace promptspan {

/**
 * Word classes shared by the anchor-based extractors (Tier 1.5).
 *
 * Function words may sit inside a phrase ("across the valley") but never end
 * one. Clause breaks always end a phrase.
 */
namespace words {

bool is_determiner(const std::string& lower);
bool is_preposition(const std::string& lower);
bool is_function_word(const std::string& lower);   // determiners and prepositions
bool is_clause_break(const std::string& lower);    // conjunctions, relatives, auxiliaries, pronouns
bool is_stop_word(const std::string& lower);       // function words or clause breaks
bool is_adverb(const std::string& lower);          // "-ly" words plus a few bare adverbs

} // namespace words

// Token index range [first, last] around an anchor.
struct PhraseWindow {
    size_t first = 0;
    size_t last = 0;
    size_t anchor = 0;

    size_t word_count() const noexcept { return last - first + 1; }
};

// Builds the candidate text and offsets for tokens[first..last] of `text`.
std::string phrase_text(std::string_view text, const std::vector<util::Token>& tokens,
                        const PhraseWindow& window);

// Space-joined lower-cased content words of the window, skipping the anchor and function words.
std::string phrase_content(const std::vector<util::Token>& tokens, const PhraseWindow& window);

inline double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace promptspan
