#include "promptspan/action_extractor.hpp"
#include "promptspan/anchor_phrase.hpp"
#include "promptspan/closed_vocab_matcher.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/verb_forms.hpp"

#include <algorithm>
#include <unordered_set>

namespace promptspan {

namespace {

const std::unordered_set<std::string>& standalone_verbs() {
    static const std::unordered_set<std::string> s = {
        "wait", "sleep", "rest", "pause", "smile", "nod", "wave", "shrug", "wink", "kneel", "crouch"
    };
    return s;
}

const std::unordered_set<std::string>& camera_ambiguous_verbs() {
    static const std::unordered_set<std::string> s = {
        "pan", "tilt", "track", "zoom", "roll", "dolly", "truck", "crane", "boom"
    };
    return s;
}

// Verbs whose grammatical subject is light are lighting descriptions, not actions.
const std::unordered_set<std::string>& lighting_subjects() {
    static const std::unordered_set<std::string> s = {
        "light", "lights", "sunlight", "moonlight", "lamplight", "candlelight", "shadow",
        "shadows", "glow", "beam", "beams", "rays", "sun", "moon", "fog", "mist", "haze"
    };
    return s;
}

// Template instructions ("draws the viewer's attention") rather than depicted actions.
const std::unordered_set<std::string>& meta_objects() {
    static const std::unordered_set<std::string> s = {
        "viewer", "viewers", "viewer's", "audience", "composition", "framing", "prompt", "attention"
    };
    return s;
}

// Noun and adjective homographs of verb forms.
const std::unordered_set<std::string>& excluded_forms() {
    static const std::unordered_set<std::string> s = {
        "rose", "wound", "dove", "bit", "lay", "fell", "left", "hung", "race", "races"
    };
    return s;
}

} // namespace

const char* to_role(ActionGroup group) noexcept {
    switch (group) {
        case ActionGroup::Movement: return "action.movement";
        case ActionGroup::State:    return "action.state";
        case ActionGroup::Gesture:  return "action.gesture";
    }
    return "action.movement";
}

const std::vector<std::pair<std::string, ActionGroup>>& ActionExtractor::base_verbs() {
    static const std::vector<std::pair<std::string, ActionGroup>> verbs = [] {
        std::vector<std::pair<std::string, ActionGroup>> v;
        for (const char* b : {
                 "walk", "run", "jog", "sprint", "dash", "rush", "stroll", "wander", "march",
                 "stride", "stumble", "jump", "leap", "hop", "skip", "climb", "crawl", "swim",
                 "dive", "fly", "soar", "glide", "drift", "float", "spin", "twirl", "dance",
                 "ride", "drive", "chase", "fall", "slide", "rise", "sink", "turn", "pace",
                 "hurry", "flee", "approach", "emerge", "descend", "ascend", "cross", "circle",
                 "sway", "stagger", "trudge", "tiptoe", "pan", "tilt", "track", "zoom", "roll"}) {
            v.emplace_back(b, ActionGroup::Movement);
        }
        for (const char* b : {
                 "sit", "stand", "lie", "lean", "rest", "wait", "sleep", "pose", "crouch",
                 "kneel", "perch", "hover", "linger", "lounge", "slump", "sprawl", "hang",
                 "hide", "stay", "remain", "stare", "gaze", "watch", "freeze", "pause", "meditate"}) {
            v.emplace_back(b, ActionGroup::State);
        }
        for (const char* b : {
                 "wave", "point", "nod", "shake", "shrug", "bow", "salute", "beckon", "gesture",
                 "signal", "clap", "wink", "smile", "frown", "grin", "laugh", "cry", "weep",
                 "sigh", "reach", "grab", "grip", "raise", "hug", "kiss", "touch", "tap",
                 "brush", "wipe", "clench", "crane", "blink", "glance"}) {
            v.emplace_back(b, ActionGroup::Gesture);
        }
        return v;
    }();
    return verbs;
}

bool ActionExtractor::is_standalone_verb(const std::string& base) {
    return standalone_verbs().count(base) > 0;
}

bool ActionExtractor::is_camera_ambiguous_verb(const std::string& base) {
    return camera_ambiguous_verbs().count(base) > 0;
}

const std::vector<embedding::PrototypeCluster>& ActionExtractor::default_prototypes() {
    static const std::vector<embedding::PrototypeCluster> clusters = {
        {"movement", {
            "field", "crowd", "street", "beach", "stairs", "horizon", "quickly",
            "energetically", "forward", "away", "room", "forest", "water", "rooftops",
            "corner", "briskly", "rapidly", "gracefully", "hallway", "road", "path", "hill",
            "distance", "valley"}},
        {"state", {
            "bench", "chair", "wall", "ground", "still", "motionless", "quietly", "alone",
            "silently", "window", "doorway", "floor", "calmly", "patiently", "peacefully",
            "couch", "bed", "railing", "stool", "steps"}},
        {"gesture", {
            "hello", "goodbye", "hand", "hands", "head", "agreement", "warmly", "politely",
            "shoulders", "fist", "fingers", "salute", "nervously", "softly", "brightly",
            "arms", "eyes", "finger"}},
    };
    return clusters;
}

ActionExtractor::ActionExtractor(std::shared_ptr<const embedding::TextEncoder> encoder,
                                 ActionExtractorConfig config)
    : config_(config)
    , classifier_(std::move(encoder), default_prototypes()) {
    if (config_.max_phrase_words < 1) {
        config_.max_phrase_words = 1;
    }

    for (const auto& [base, group] : base_verbs()) {
        for (const auto& form : VerbForms::forms(base)) {
            if (excluded_forms().count(form)) continue;
            anchors_.emplace(form, Anchor{base, group});
        }
    }
    LOG_DEBUG("Action extractor: ", base_verbs().size(), " base verbs, ", anchors_.size(), " surface forms");
}

const ActionExtractor::Anchor* ActionExtractor::find_anchor(const std::string& lower) const {
    auto it = anchors_.find(lower);
    return it == anchors_.end() ? nullptr : &it->second;
}

std::vector<CandidateSpan> ActionExtractor::extract(std::string_view text) const {
    std::vector<CandidateSpan> out;
    const auto tokens = util::tokenize(text);
    std::string lowered;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (!tok.is_word) continue;
        const Anchor* anchor = find_anchor(tok.lower);
        if (!anchor) continue;

        // "the run", "her smile", "the rolling hills": noun or adjective use.
        if (i > 0 && tokens[i - 1].is_word && words::is_determiner(tokens[i - 1].lower)) continue;

        PhraseWindow window{i, i, i};
        while (window.first > 0 && window.word_count() < config_.max_phrase_words) {
            const auto& prev = tokens[window.first - 1];
            if (!prev.is_word || !words::is_adverb(prev.lower)) break;
            --window.first;
        }

        if (window.first > 0 && tokens[window.first - 1].is_word &&
            lighting_subjects().count(tokens[window.first - 1].lower)) {
            continue;
        }

        if (is_camera_ambiguous_verb(anchor->base)) {
            if (lowered.empty()) lowered = util::to_lower_ascii(text);
            if (ClosedVocabMatcher::has_camera_context(lowered, tok.start, tok.end)) continue;
        }

        size_t j = i + 1;
        while (j < tokens.size() && window.word_count() < config_.max_phrase_words) {
            const auto& next = tokens[j];
            if (!next.is_word || words::is_clause_break(next.lower) || find_anchor(next.lower)) break;
            window.last = j;
            ++j;
        }
        while (window.last > i && words::is_function_word(tokens[window.last].lower)) {
            --window.last;
        }

        bool meta = false;
        for (size_t k = window.first; k <= window.last; ++k) {
            if (meta_objects().count(tokens[k].lower)) {
                meta = true;
                break;
            }
        }
        if (meta) continue;

        std::string content = phrase_content(tokens, window);
        if (content.empty() && !is_standalone_verb(anchor->base)) continue;

        std::string role = to_role(anchor->group);
        double confidence = config_.min_confidence;
        if (!content.empty()) {
            auto best = classifier_.classify(content);
            if (!best.label.empty() && best.similarity >= config_.min_confidence) {
                role = "action." + best.label;
                confidence = best.similarity;
            }
        }

        CandidateSpan span;
        span.start = tokens[window.first].start;
        span.end = tokens[window.last].end;
        span.text = phrase_text(text, tokens, window);
        span.role = std::move(role);
        span.confidence = round2(std::min(1.0, confidence));
        span.source = SpanSource::ActionHeuristic;
        out.push_back(std::move(span));

        i = window.last;
    }

    return out;
}

} // namespace promptspan
