#include "promptspan/closed_vocab_matcher.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/util/text.hpp"
#include "promptspan/verb_forms.hpp"
#include "promptspan/vocabulary.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <unordered_set>

namespace promptspan {

namespace {

constexpr const char* kCameraMovement = "camera.movement";
constexpr const char* kCameraLens = "camera.lens";

// Camera moves that are also everyday verbs or nouns.
const std::vector<std::string>& ambiguous_bases() {
    static const std::vector<std::string> bases = {
        "pan", "roll", "tilt", "zoom", "drone", "crane", "boom", "truck"
    };
    return bases;
}

// Camera-movement verbs whose conjugations are added to the automaton.
const std::vector<std::string>& camera_verbs() {
    static const std::vector<std::string> verbs = {
        "pan", "tilt", "dolly", "truck", "crane", "boom", "zoom", "roll", "track", "pedestal", "orbit"
    };
    return verbs;
}

const std::vector<std::string>& camera_cues() {
    static const std::vector<std::string> cues = {
        "camera", "shot", "lens", "frame", "cinematography", "cinematic", "filming", "video", "footage"
    };
    return cues;
}

const std::unordered_set<std::string>& culinary_words() {
    static const std::unordered_set<std::string> words = {
        "frying", "saute", "sauté", "sauce", "saucepan", "iron", "bread", "dough", "batter",
        "dinner", "hair", "skillet", "kitchen", "cake", "muffin", "roasting", "baking", "gold",
        "oven", "stove", "egg", "eggs", "flour", "spring", "sushi", "cinnamon"
    };
    return words;
}

bool ends_collocation(char c) {
    return c == '.' || c == ',' || c == ';' || c == '!' || c == '?';
}

// Word tokens (lowered) ending at or before `pos`, nearest first.
std::vector<std::string> words_before(std::string_view lowered, size_t pos, size_t count) {
    std::vector<std::string> words;
    size_t i = pos;
    while (words.size() < count && i > 0) {
        while (i > 0 && !util::word_char_before(lowered, i)) {
            // Sentence punctuation ends the collocation window.
            if (ends_collocation(lowered[i - 1])) return words;
            i = util::prev_char_start(lowered, i);
        }
        size_t end = i;
        while (size_t step = util::word_char_before(lowered, i)) i -= step;
        if (end > i) words.emplace_back(lowered.substr(i, end - i));
    }
    return words;
}

std::vector<std::string> words_after(std::string_view lowered, size_t pos, size_t count) {
    std::vector<std::string> words;
    size_t i = pos;
    const size_t n = lowered.size();
    while (words.size() < count && i < n) {
        while (i < n && !util::word_char_at(lowered, i)) {
            if (ends_collocation(lowered[i])) return words;
            size_t length = 0;
            util::decode_utf8_at(lowered, i, length);
            i += length;
        }
        size_t start = i;
        while (size_t step = util::word_char_at(lowered, i)) i += step;
        if (i > start) words.emplace_back(lowered.substr(start, i - start));
    }
    return words;
}

} // namespace

ClosedVocabMatcher::ClosedVocabMatcher(const VocabularyStore& vocabulary, const Taxonomy& taxonomy) {
    // pattern id -> ordered unique roles
    std::vector<std::set<std::string>> roles;

    auto add = [&](const std::string& lowered, const std::string& role) {
        uint32_t id = automaton_.add_pattern(lowered);
        if (id >= roles.size()) {
            roles.resize(id + 1);
            pattern_ambiguous_.resize(id + 1, false);
        }
        roles[id].insert(role);
        if (role == kCameraMovement && is_ambiguous_camera_term(lowered)) {
            pattern_ambiguous_[id] = true;
        }
    };

    const auto& verbs = camera_verbs();
    size_t skipped = 0;
    for (const auto& [id, terms] : vocabulary.entries()) {
        if (!taxonomy.is_valid(id)) {
            LOG_WARN("Skipping vocabulary for unknown taxonomy id '", id, "'");
            ++skipped;
            continue;
        }
        for (const auto& term : terms) {
            std::string lowered = util::to_lower_ascii(term);
            if (lowered.empty()) continue;
            add(lowered, id);

            if (id == kCameraMovement &&
                std::find(verbs.begin(), verbs.end(), lowered) != verbs.end()) {
                for (const auto& form : VerbForms::forms(lowered)) {
                    add(form, id);
                }
            }
        }
    }

    automaton_.build();

    pattern_roles_.reserve(roles.size());
    for (auto& r : roles) {
        pattern_roles_.emplace_back(r.begin(), r.end());
    }

    LOG_DEBUG("Closed vocabulary automaton: ", automaton_.pattern_count(), " patterns, ",
              automaton_.node_count(), " nodes, ", skipped, " unknown ids skipped");
}

bool ClosedVocabMatcher::is_ambiguous_camera_term(const std::string& lowered_term) {
    for (const auto& base : ambiguous_bases()) {
        if (VerbForms::forms(base).count(lowered_term)) return true;
        if (lowered_term == base + "s") return true;
    }
    return false;
}

bool ClosedVocabMatcher::on_word_boundary(std::string_view text, size_t start, size_t end) {
    if (start > 0 && util::word_char_at(text, start) && util::word_char_before(text, start)) {
        return false;
    }
    if (end < text.size() && util::word_char_before(text, end) && util::word_char_at(text, end)) {
        return false;
    }
    return true;
}

bool ClosedVocabMatcher::has_camera_context(std::string_view lowered, size_t start, size_t end,
                                            size_t radius) {
    size_t lo = start > radius ? start - radius : 0;
    size_t hi = std::min(lowered.size(), end + radius);
    std::string_view window = lowered.substr(lo, hi - lo);

    for (const auto& cue : camera_cues()) {
        size_t pos = window.find(cue);
        while (pos != std::string_view::npos) {
            size_t abs_start = lo + pos;
            size_t abs_end = abs_start + cue.size();
            bool left_ok = abs_start == 0 || !util::word_char_before(lowered, abs_start);
            bool independent = abs_end <= start || abs_start >= end;
            if (left_ok && independent) {
                return true;
            }
            pos = window.find(cue, pos + 1);
        }
    }
    return false;
}

bool ClosedVocabMatcher::has_culinary_collocation(std::string_view lowered, size_t start, size_t end) {
    const auto& words = culinary_words();
    for (const auto& w : words_before(lowered, start, 2)) {
        if (words.count(w)) return true;
    }
    for (const auto& w : words_after(lowered, end, 3)) {
        if (words.count(w)) return true;
    }
    return false;
}

bool ClosedVocabMatcher::is_lens_before_film(std::string_view lowered, size_t start, size_t end) {
    std::string_view matched = lowered.substr(start, end - start);
    if (matched.find("mm") == std::string_view::npos) return false;
    std::string_view tail = lowered.substr(end, std::min<size_t>(10, lowered.size() - end));
    return tail.find("film") != std::string_view::npos;
}

std::vector<CandidateSpan> ClosedVocabMatcher::match(std::string_view text) const {
    std::vector<CandidateSpan> out;
    if (text.empty() || automaton_.pattern_count() == 0) return out;

    const std::string lowered = util::to_lower_ascii(text);
    std::set<std::tuple<size_t, size_t, std::string>> seen;

    for (const auto& m : automaton_.find_all(lowered)) {
        if (!on_word_boundary(lowered, m.start, m.end)) continue;

        for (const auto& role : pattern_roles_[m.pattern_id]) {
            if (role == kCameraMovement && pattern_ambiguous_[m.pattern_id]) {
                if (has_culinary_collocation(lowered, m.start, m.end)) continue;
                if (!has_camera_context(lowered, m.start, m.end)) continue;
            }
            if (role == kCameraLens && is_lens_before_film(lowered, m.start, m.end)) continue;

            auto [s, e] = util::trim_range(text, m.start, m.end);
            if (s >= e) continue;
            if (!seen.emplace(s, e, role).second) continue;

            CandidateSpan span;
            span.text = std::string(text.substr(s, e - s));
            span.role = role;
            span.confidence = 1.0;
            span.start = s;
            span.end = e;
            span.source = SpanSource::ClosedVocab;
            out.push_back(std::move(span));
        }
    }

    return out;
}

} // namespace promptspan
