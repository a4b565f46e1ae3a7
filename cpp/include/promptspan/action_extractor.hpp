#pragma once

#include "promptspan/embedding/prototype_classifier.hpp"
#include "promptspan/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptspan {

struct ActionExtractorConfig {
    double min_confidence = 0.75;
    size_t max_phrase_words = 5;
};

enum class ActionGroup {
    Movement,
    State,
    Gesture
};

const char* to_role(ActionGroup group) noexcept;

/**
 * Tier 1.5a: verb-centred action phrases.
 *
 * Anchors are the surface forms of a closed base-verb list, expanded once
 * through VerbForms. Each anchor takes a preceding adverb run and a bounded
 * run of following words up to a clause break. The non-anchor content is
 * classified against movement/state/gesture prototypes; when no prototype is
 * close enough, the anchor's own group decides at floor confidence.
 */
class ActionExtractor {
public:
    struct Anchor {
        std::string base;
        ActionGroup group;
    };

    explicit ActionExtractor(std::shared_ptr<const embedding::TextEncoder> encoder,
                             ActionExtractorConfig config = {});

    std::vector<CandidateSpan> extract(std::string_view text) const;

    // Surface form -> anchor; nullptr if the word is not a known verb form.
    const Anchor* find_anchor(const std::string& lower) const;

    static const std::vector<std::pair<std::string, ActionGroup>>& base_verbs();
    static bool is_standalone_verb(const std::string& base);
    static bool is_camera_ambiguous_verb(const std::string& base);
    static const std::vector<embedding::PrototypeCluster>& default_prototypes();

    const ActionExtractorConfig& config() const noexcept { return config_; }
    size_t anchor_count() const noexcept { return anchors_.size(); }

private:
    ActionExtractorConfig config_;
    embedding::PrototypeClassifier classifier_;
    std::unordered_map<std::string, Anchor> anchors_;
};

} // namespace promptspan
