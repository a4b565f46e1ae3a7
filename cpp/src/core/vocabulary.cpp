#include "promptspan/vocabulary.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/taxonomy.hpp"
#include "promptspan/util/text.hpp"

#include <boost/json.hpp>

#include <unordered_set>

namespace promptspan {

VocabularyStore::VocabularyStore(Entries entries)
    : entries_(std::move(entries)) {}

VocabularyStore VocabularyStore::from_json(const std::string& json_text) {
    boost::json::value root;
    try {
        root = boost::json::parse(json_text);
    } catch (const std::exception& e) {
        PROMPTSPAN_THROW(ErrorCode::RESOURCE_PARSE_FAILED,
                         std::string("vocabulary JSON does not parse: ") + e.what());
    }

    const auto* obj = root.if_object();
    PROMPTSPAN_CHECK(obj != nullptr, ErrorCode::RESOURCE_PARSE_FAILED,
                     "vocabulary root must be an object of term arrays");

    Entries entries;
    for (const auto& kv : *obj) {
        std::string id(kv.key().data(), kv.key().size());
        const auto* terms = kv.value().if_array();
        if (!terms) {
            LOG_WARN("Vocabulary entry '", id, "' is not an array, skipping");
            continue;
        }

        auto& list = entries[id];
        for (const auto& term : *terms) {
            const auto* s = term.if_string();
            if (!s) {
                LOG_WARN("Vocabulary entry '", id, "' has a non-string term, skipping it");
                continue;
            }
            std::string trimmed = util::trim(std::string_view(s->data(), s->size()));
            if (!trimmed.empty()) {
                list.push_back(std::move(trimmed));
            }
        }
    }

    return VocabularyStore(std::move(entries));
}

VocabularyStore VocabularyStore::load(const std::string& path) {
    try {
        VocabularyStore store = from_json(util::read_file(path));
        LOG_INFO("Loaded vocabulary from ", path, ": ", store.category_count(),
                 " categories, ", store.term_count(), " terms");
        return store;
    } catch (const PromptSpanException& e) {
        LOG_WARN("Could not load vocabulary from ", path, " (closed vocabulary disabled): ", e.what());
        return VocabularyStore();
    }
}

VocabularyStore VocabularyStore::resolved(const Taxonomy& taxonomy) const {
    Entries out;
    for (const auto& [id, terms] : entries_) {
        std::string canonical = taxonomy.resolve(id);
        if (!taxonomy.is_valid(canonical)) {
            LOG_WARN("Vocabulary id '", id, "' is not in the taxonomy; dropping ", terms.size(), " terms");
            continue;
        }

        auto& dest = out[canonical];
        std::unordered_set<std::string> seen(dest.begin(), dest.end());
        for (const auto& term : terms) {
            if (seen.insert(term).second) {
                dest.push_back(term);
            }
        }
    }
    return VocabularyStore(std::move(out));
}

size_t VocabularyStore::term_count() const noexcept {
    size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.second.size();
    }
    return total;
}

VocabStats VocabularyStore::stats() const {
    VocabStats stats;
    stats.total_categories = entries_.size();
    for (const auto& [id, terms] : entries_) {
        CategoryVocabStats cat;
        cat.term_count = terms.size();
        for (size_t i = 0; i < terms.size() && i < 5; ++i) {
            cat.sample_terms.push_back(terms[i]);
        }
        stats.total_terms += terms.size();
        stats.categories.emplace(id, std::move(cat));
    }
    return stats;
}

} // namespace promptspan
