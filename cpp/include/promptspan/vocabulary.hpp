#pragma once

#include "promptspan/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace promptspan {

class Taxonomy;

/**
 * Closed vocabulary: taxonomy id -> ordered literal terms.
 *
 * Loaded once at startup from a JSON object of string arrays. A missing or
 * corrupt resource yields an empty store; Tier 1 then finds nothing.
 */
class VocabularyStore {
public:
    using Entries = std::map<std::string, std::vector<std::string>>;

    VocabularyStore() = default;
    explicit VocabularyStore(Entries entries);

    // Throws PromptSpanException(RESOURCE_PARSE_FAILED) when the text is not a JSON object.
    static VocabularyStore from_json(const std::string& json_text);

    // Never throws; failures are logged and produce an empty store.
    static VocabularyStore load(const std::string& path);

    // Legacy ids resolved through the taxonomy; ids still unknown are dropped with a warning.
    VocabularyStore resolved(const Taxonomy& taxonomy) const;

    const Entries& entries() const noexcept { return entries_; }
    size_t category_count() const noexcept { return entries_.size(); }
    size_t term_count() const noexcept;
    bool empty() const noexcept { return entries_.empty(); }

    // Per-category counts with up to five sample terms.
    VocabStats stats() const;

private:
    Entries entries_;
};

} // namespace promptspan
