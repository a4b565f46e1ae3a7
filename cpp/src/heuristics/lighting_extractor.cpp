#include "promptspan/lighting_extractor.hpp"
#include "promptspan/anchor_phrase.hpp"
#include "promptspan/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace promptspan {

namespace {

const std::unordered_set<std::string>& shadow_nouns() {
    static const std::unordered_set<std::string> s = {
        "shadow", "shadows", "silhouette", "silhouettes"
    };
    return s;
}

const std::unordered_set<std::string>& light_nouns() {
    static const std::unordered_set<std::string> s = {
        "light", "lights", "lighting", "glow", "glows", "highlight", "highlights",
        "illumination", "luminance", "radiance", "beam", "beams", "ray", "rays"
    };
    return s;
}

const std::unordered_set<std::string>& excluded_compounds() {
    static const std::unordered_set<std::string> s = {
        "traffic light", "traffic lights", "light switch", "light switches", "light bulb",
        "light bulbs", "light fixture", "light fixtures", "light meter", "highlight reel"
    };
    return s;
}

const std::unordered_set<std::string>& source_indicators() {
    static const std::unordered_set<std::string> s = {"from", "through", "via", "of"};
    return s;
}

} // namespace

LightingExtractor::LightingExtractor(std::shared_ptr<const embedding::TextEncoder> encoder,
                                     LightingExtractorConfig config)
    : config_(config)
    , classifier_(std::move(encoder), default_prototypes()) {
    if (config_.max_phrase_words < 2) {
        config_.max_phrase_words = 2;
    }
}

bool LightingExtractor::is_shadow_anchor(const std::string& lower) {
    return shadow_nouns().count(lower) > 0;
}

bool LightingExtractor::is_anchor(const std::string& lower) {
    return shadow_nouns().count(lower) > 0 || light_nouns().count(lower) > 0;
}

bool LightingExtractor::is_excluded_compound(const std::string& first, const std::string& second) {
    return excluded_compounds().count(first + " " + second) > 0;
}

const std::vector<embedding::PrototypeCluster>& LightingExtractor::default_prototypes() {
    static const std::vector<embedding::PrototypeCluster> clusters = {
        {"quality", {
            "soft", "hard", "harsh", "diffused", "diffuse", "dramatic", "gentle", "moody",
            "low key", "low-key", "high key", "high-key", "rim", "back", "contrasty",
            "high contrast", "dappled", "subtle", "bright", "dim", "deep", "long", "crisp",
            "even", "flat", "volumetric", "ethereal", "chiaroscuro", "bounced", "flickering",
            "strong", "faint", "eerie"}},
        {"source", {
            "neon", "candle", "candlelit", "lamp", "window", "street", "streetlamp",
            "fluorescent", "moon", "sun", "fire", "firelight", "headlight", "car headlights",
            "spotlight", "lantern", "led", "practical", "overhead", "studio", "torch",
            "screen", "monitor", "stage", "sky", "natural", "ambient", "the window"}},
        {"timeOfDay", {
            "golden hour", "blue hour", "magic hour", "sunset", "sunrise", "dawn", "dusk",
            "twilight", "morning", "early morning", "midday", "noon", "afternoon",
            "late afternoon", "evening", "night", "midnight", "nighttime"}},
        {"colorTemp", {
            "warm", "cool", "cold", "amber", "blue", "orange", "teal", "tungsten",
            "daylight balanced", "yellow", "red", "green", "pink", "purple", "neutral",
            "icy", "warm white"}},
    };
    return clusters;
}

std::vector<CandidateSpan> LightingExtractor::extract(std::string_view text) const {
    std::vector<CandidateSpan> out;
    const auto tokens = util::tokenize(text);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (!tok.is_word || !is_anchor(tok.lower)) continue;

        bool has_prev = i > 0 && tokens[i - 1].is_word;
        bool has_next = i + 1 < tokens.size() && tokens[i + 1].is_word;
        if (has_prev && is_excluded_compound(tokens[i - 1].lower, tok.lower)) continue;
        if (has_next && is_excluded_compound(tok.lower, tokens[i + 1].lower)) continue;

        PhraseWindow window{i, i, i};

        // Modifier run to the left.
        while (window.first > 0 && window.word_count() < config_.max_phrase_words) {
            const auto& prev = tokens[window.first - 1];
            if (!prev.is_word || words::is_stop_word(prev.lower) || is_anchor(prev.lower)) break;
            --window.first;
        }
        bool has_modifier = window.first < i;

        // Optional source phrase: "light from the window".
        size_t j = i + 1;
        if (j < tokens.size() && tokens[j].is_word && source_indicators().count(tokens[j].lower) &&
            window.word_count() + 1 < config_.max_phrase_words) {
            size_t k = j + 1;
            while (k < tokens.size() && tokens[k].is_word && words::is_determiner(tokens[k].lower) &&
                   window.word_count() + (k - i) <= config_.max_phrase_words) {
                ++k;
            }
            size_t content_end = k;
            while (content_end < tokens.size() && tokens[content_end].is_word &&
                   !words::is_stop_word(tokens[content_end].lower) &&
                   !is_anchor(tokens[content_end].lower) &&
                   window.word_count() + (content_end - i) <= config_.max_phrase_words) {
                ++content_end;
            }
            if (content_end > k) {
                window.last = content_end - 1;
            }
        }
        bool has_source = window.last > i;

        if (!has_modifier && !has_source) continue;

        std::string content = phrase_content(tokens, window);
        if (content.empty()) continue;

        auto best = classifier_.classify(content);
        std::string cls = best.label;
        double confidence = best.similarity;
        if (cls.empty() || confidence < config_.min_confidence) {
            cls = "quality";
            confidence = config_.min_confidence;
        }

        CandidateSpan span;
        span.start = tokens[window.first].start;
        span.end = tokens[window.last].end;
        span.text = phrase_text(text, tokens, window);
        span.role = "lighting." + cls;
        span.confidence = round2(std::min(1.0, confidence));
        span.source = SpanSource::Lighting;
        out.push_back(std::move(span));

        LOG_DEBUG("lighting phrase '", out.back().text, "' -> ", out.back().role,
                  " (", out.back().confidence, ")");
    }

    return out;
}

} // namespace promptspan
