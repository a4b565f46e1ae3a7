#pragma once

#include "promptspan/types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptspan {

/**
 * Technical-pattern rules: frame rate, duration, resolution, aspect ratio,
 * focal length, aperture and color temperature.
 *
 * Each rule runs over the whole text independently. A rule may name an
 * earlier rule it yields to; its matches overlapping that rule's matches are
 * dropped, which is how the ranged f-stop form wins over the single form.
 */
class PatternMatcher {
public:
    using Validator = std::function<bool(std::string_view lowered, size_t start, size_t end)>;

    struct Rule {
        std::string name;
        std::string role;
        std::regex pattern;
        double confidence;
        Validator validator;        // optional
        std::string yields_to;      // optional rule name
    };

    // Default cinema rule set.
    PatternMatcher();
    explicit PatternMatcher(std::vector<Rule> rules);

    // Throws ScanError if the regex engine gives up (complexity or stack).
    std::vector<CandidateSpan> match(std::string_view text) const;

    const std::vector<Rule>& rules() const noexcept { return rules_; }

    static std::vector<Rule> default_rules();

    // "16:9", "2.39:1" and friends.
    static bool is_common_aspect_ratio(std::string_view ratio);

private:
    std::vector<Rule> rules_;
};

} // namespace promptspan
