#include "promptspan/pattern_matcher.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/util/text.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace promptspan {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

bool near_keyword(std::string_view lowered, size_t start, size_t end, size_t radius,
                  std::initializer_list<const char*> words) {
    size_t lo = start > radius ? start - radius : 0;
    size_t hi = std::min(lowered.size(), end + radius);
    std::string_view window = lowered.substr(lo, hi - lo);
    for (const char* w : words) {
        if (window.find(w) != std::string_view::npos) return true;
    }
    return false;
}

std::string strip_spaces(std::string_view s) {
    std::string out;
    for (char c : s) {
        if (!util::is_space(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view word_after(std::string_view lowered, size_t end) {
    size_t i = end;
    while (i < lowered.size() && util::is_space(static_cast<unsigned char>(lowered[i]))) ++i;
    size_t j = i;
    while (j < lowered.size() && util::is_ascii_alnum(static_cast<unsigned char>(lowered[j]))) ++j;
    return lowered.substr(i, j - i);
}

std::string_view word_before(std::string_view lowered, size_t start) {
    size_t j = start;
    while (j > 0 && util::is_space(static_cast<unsigned char>(lowered[j - 1]))) --j;
    size_t i = j;
    while (i > 0 && util::is_ascii_alnum(static_cast<unsigned char>(lowered[i - 1]))) --i;
    return lowered.substr(i, j - i);
}

// "1980s", "'90s" and "70s film grain" name decades. "10s clip", "a 20s shot" and
// "after 90s" stay durations.
bool is_decade(std::string_view lowered, size_t start, size_t end) {
    std::string_view m = lowered.substr(start, end - start);
    if (m.size() < 3 || m.back() != 's') return false;
    std::string_view digits = m.substr(0, m.size() - 1);
    if (!all_digits(digits)) return false;
    if (digits.size() == 4) return true;
    if (digits.size() != 2 || digits[1] != '0' || digits[0] < '2') return false;

    std::string_view before = lowered.substr(0, start);
    if (!before.empty() && before.back() == '\'') return true;
    if (before.size() >= 3 && before.substr(before.size() - 3) == "\xe2\x80\x99") return true;

    static const std::set<std::string_view> duration_nouns = {
        "clip", "clips", "shot", "shots", "video", "take", "loop", "scene", "sequence", "cut",
        "ad", "spot", "teaser", "trailer", "timelapse", "reel", "intro", "outro", "long",
        "each", "per", "of", "duration", "runtime"
    };
    static const std::set<std::string_view> era_words = {"the", "early", "mid", "late"};

    std::string_view next = word_after(lowered, end);
    if (duration_nouns.count(next)) return false;
    if (era_words.count(word_before(lowered, start))) return true;
    return !next.empty();
}

} // namespace

PatternMatcher::PatternMatcher()
    : rules_(default_rules()) {}

PatternMatcher::PatternMatcher(std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

bool PatternMatcher::is_common_aspect_ratio(std::string_view ratio) {
    static const std::set<std::string> common = {
        "16:9", "9:16", "4:3", "3:4", "1:1", "21:9", "4:5", "5:4", "2:1", "32:9",
        "2.39:1", "2.35:1", "2.40:1", "2.4:1", "1.85:1", "1.33:1", "1.37:1",
        "1.43:1", "1.66:1", "1.78:1", "1.9:1", "2.20:1", "2.2:1", "2.76:1"
    };
    return common.count(strip_spaces(ratio)) > 0;
}

std::vector<PatternMatcher::Rule> PatternMatcher::default_rules() {
    std::vector<Rule> rules;

    rules.push_back({"frame_rate", "technical.frameRate",
                     std::regex(R"(\b\d{1,3}(?:\.\d{1,3})?\s?(?:fps|frames per second)\b)", kFlags),
                     0.95, nullptr, ""});

    rules.push_back({"duration", "technical.duration",
                     std::regex(R"(\b\d+(?:\.\d+)?(?:\s?-\s?\d+(?:\.\d+)?)?\s?(?:seconds?|secs?|s|minutes?|mins?)\b)", kFlags),
                     0.90,
                     [](std::string_view lowered, size_t start, size_t end) {
                         return !is_decade(lowered, start, end);
                     },
                     ""});

    rules.push_back({"resolution", "technical.resolution",
                     std::regex(R"(\b(?:\d{3,5}\s?(?:x|×)\s?\d{3,5}|(?:480|576|720|1080|1440|2160|4320)[pi]|[2468]k|uhd)\b)", kFlags),
                     0.95, nullptr, ""});

    rules.push_back({"aspect_ratio", "technical.aspectRatio",
                     std::regex(R"(\b\d{1,2}(?:\.\d{1,2})?\s?:\s?\d{1,2}\b)", kFlags),
                     0.90,
                     [](std::string_view lowered, size_t start, size_t end) {
                         if (is_common_aspect_ratio(lowered.substr(start, end - start))) return true;
                         return near_keyword(lowered, start, end, 30, {"aspect", "ratio"});
                     },
                     ""});

    rules.push_back({"lens_focal_length", "camera.lens",
                     std::regex(R"(\b\d{1,4}(?:-\d{1,4})?\s?mm\b)", kFlags),
                     0.90,
                     [](std::string_view lowered, size_t, size_t end) {
                         // "35mm film" is a film stock.
                         std::string_view tail = lowered.substr(end, std::min<size_t>(10, lowered.size() - end));
                         return tail.find("film") == std::string_view::npos;
                     },
                     ""});

    rules.push_back({"aperture_range", "camera.focus",
                     std::regex(R"(\bf\s?/?\s?\d{1,2}(?:\.\d)?\s?(?:-|–|to)\s?(?:f\s?/?\s?)?\d{1,2}(?:\.\d)?\b)", kFlags),
                     0.90, nullptr, ""});

    rules.push_back({"aperture", "camera.focus",
                     std::regex(R"(\bf\s?/\s?\d{1,2}(?:\.\d)?\b|\bf\d{1,2}(?:\.\d)?\b)", kFlags),
                     0.85, nullptr, "aperture_range"});

    rules.push_back({"color_temperature", "lighting.colorTemp",
                     std::regex(R"(\b\d{4,5}\s?k\b)", kFlags),
                     0.90, nullptr, ""});

    return rules;
}

std::vector<CandidateSpan> PatternMatcher::match(std::string_view text) const {
    std::vector<CandidateSpan> out;
    if (text.empty()) return out;

    const std::string input(text);
    const std::string lowered = util::to_lower_ascii(text);
    std::map<std::string, std::vector<std::pair<size_t, size_t>>> by_rule;

    for (const auto& rule : rules_) {
        auto& ranges = by_rule[rule.name];
        try {
            auto begin = std::sregex_iterator(input.begin(), input.end(), rule.pattern);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const auto& m = *it;
                if (m.length(0) == 0) continue;
                size_t start = static_cast<size_t>(m.position(0));
                size_t end = start + static_cast<size_t>(m.length(0));

                auto [s, e] = util::trim_range(text, start, end);
                if (s >= e) continue;

                if (rule.validator && !rule.validator(lowered, s, e)) continue;

                if (!rule.yields_to.empty()) {
                    const auto& stronger = by_rule[rule.yields_to];
                    bool shadowed = std::any_of(stronger.begin(), stronger.end(),
                        [&](const auto& r) { return s < r.second && r.first < e; });
                    if (shadowed) continue;
                }

                ranges.emplace_back(s, e);

                CandidateSpan span;
                span.text = input.substr(s, e - s);
                span.role = rule.role;
                span.confidence = rule.confidence;
                span.start = s;
                span.end = e;
                span.source = SpanSource::Pattern;
                out.push_back(std::move(span));
            }
        } catch (const std::regex_error& e) {
            LOG_ERROR("Pattern rule '", rule.name, "' failed while scanning: ", e.what());
            throw ScanError(std::string("pattern rule '") + rule.name + "' could not complete: " + e.what(),
                            "text length " + std::to_string(text.size()));
        }
    }

    return out;
}

} // namespace promptspan
