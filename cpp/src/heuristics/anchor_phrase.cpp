#include "promptspan/anchor_phrase.hpp"

#include <unordered_set>

namespace promptspan {

namespace words {

namespace {

const std::unordered_set<std::string>& determiners() {
    static const std::unordered_set<std::string> s = {
        "a", "an", "the", "this", "that", "these", "those", "his", "her", "their", "its",
        "my", "your", "our", "some", "every", "each", "another", "any"
    };
    return s;
}

const std::unordered_set<std::string>& prepositions() {
    static const std::unordered_set<std::string> s = {
        "across", "along", "through", "toward", "towards", "into", "onto", "over", "under",
        "above", "below", "beside", "behind", "past", "around", "against", "down", "up",
        "on", "in", "at", "from", "to", "by", "with", "without", "near", "inside", "outside",
        "beyond", "between", "among", "off", "out", "of", "for", "upon", "within", "via", "beneath"
    };
    return s;
}

const std::unordered_set<std::string>& clause_breaks() {
    static const std::unordered_set<std::string> s = {
        // conjunctions
        "and", "or", "but", "while", "as", "then", "when", "where", "before", "after",
        "because", "so", "yet", "until", "nor", "whilst",
        // relatives
        "who", "which", "that", "whose", "whom",
        // auxiliaries
        "is", "are", "was", "were", "be", "been", "being", "am", "has", "have", "had",
        "do", "does", "did", "will", "would", "can", "could", "should", "may", "might",
        "must", "shall",
        // subject pronouns
        "he", "she", "they", "it", "we", "i", "you"
    };
    return s;
}

const std::unordered_set<std::string>& bare_adverbs() {
    static const std::unordered_set<std::string> s = {
        "still", "fast", "just", "almost", "barely", "hard", "very", "too", "alone", "together"
    };
    return s;
}

} // namespace

bool is_determiner(const std::string& lower) { return determiners().count(lower) > 0; }
bool is_preposition(const std::string& lower) { return prepositions().count(lower) > 0; }

bool is_function_word(const std::string& lower) {
    return is_determiner(lower) || is_preposition(lower);
}

bool is_clause_break(const std::string& lower) { return clause_breaks().count(lower) > 0; }

bool is_stop_word(const std::string& lower) {
    return is_function_word(lower) || is_clause_break(lower);
}

bool is_adverb(const std::string& lower) {
    if (bare_adverbs().count(lower)) return true;
    return lower.size() > 4 && lower.compare(lower.size() - 2, 2, "ly") == 0;
}

} // namespace words

std::string phrase_text(std::string_view text, const std::vector<util::Token>& tokens,
                        const PhraseWindow& window) {
    size_t start = tokens[window.first].start;
    size_t end = tokens[window.last].end;
    return std::string(text.substr(start, end - start));
}

std::string phrase_content(const std::vector<util::Token>& tokens, const PhraseWindow& window) {
    std::string out;
    for (size_t i = window.first; i <= window.last; ++i) {
        if (i == window.anchor || !tokens[i].is_word) continue;
        if (words::is_function_word(tokens[i].lower)) continue;
        if (!out.empty()) out += ' ';
        out += tokens[i].lower;
    }
    return out;
}

} // namespace promptspan
