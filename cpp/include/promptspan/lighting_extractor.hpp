#pragma once

#include "promptspan/embedding/prototype_classifier.hpp"
#include "promptspan/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace promptspan {

struct LightingExtractorConfig {
    double min_confidence = 0.70;
    size_t max_phrase_words = 5;
};

/**
 * Tier 1.5b: lighting descriptors.
 *
 * Anchors on light and shadow nouns ("glow", "shadows", "rim light"), takes
 * the modifier run to the left and an optional "from/through ..." source
 * phrase to the right, then classifies the modifiers against the quality,
 * source, timeOfDay and colorTemp prototypes. A bare anchor with no modifier
 * is not a descriptor and is skipped.
 */
class LightingExtractor {
public:
    explicit LightingExtractor(std::shared_ptr<const embedding::TextEncoder> encoder,
                               LightingExtractorConfig config = {});

    std::vector<CandidateSpan> extract(std::string_view text) const;

    static bool is_anchor(const std::string& lower);
    static bool is_shadow_anchor(const std::string& lower);
    static const std::vector<embedding::PrototypeCluster>& default_prototypes();

    const embedding::PrototypeClassifier& classifier() const noexcept { return classifier_; }
    const LightingExtractorConfig& config() const noexcept { return config_; }

private:
    static bool is_excluded_compound(const std::string& first, const std::string& second);

    LightingExtractorConfig config_;
    embedding::PrototypeClassifier classifier_;
};

} // namespace promptspan
