#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace promptspan {

/**
 * Read-only category table every emitted role is validated against.
 *
 * Ids are dotted paths: a root category ("lighting") or an attribute
 * ("lighting.timeOfDay"). An attribute's parent branch is its id prefix when
 * that prefix is itself a category, so "shot.type" listed under camera still
 * belongs to the shot branch.
 */
class Taxonomy {
public:
    struct Category {
        std::string id;
        std::string label;
        // Attribute key (e.g. "COLOR_TEMP") and its dotted id, in declaration order.
        std::vector<std::pair<std::string, std::string>> attributes;
    };

    Taxonomy() = default;
    Taxonomy(std::vector<Category> categories,
             std::unordered_map<std::string, std::string> legacy_ids);

    // The built-in shot/subject/action/environment/lighting/camera/style/technical/audio table.
    static Taxonomy builtin();

    // Parses {"categories":[{id,label,attributes:{KEY:id}}], "legacy":{old:new}}.
    // Throws PromptSpanException(RESOURCE_PARSE_FAILED) on malformed input.
    static Taxonomy from_json(const std::string& json_text);

    // Empty path or any load failure yields builtin(), with a warning for the failure.
    static Taxonomy load_or_builtin(const std::string& path);

    bool is_valid(const std::string& id) const;
    std::string parent_of(const std::string& id) const;
    std::string resolve(const std::string& id) const;
    std::string label_of(const std::string& id) const;

    // Number of dotted segments; deeper ids are more specific.
    static int specificity(const std::string& id) noexcept;

    // Humanized attribute key: "FILM_STOCK" -> "film stock".
    static std::string humanize_attribute(const std::string& key);

    const std::vector<Category>& categories() const noexcept { return categories_; }
    const std::unordered_set<std::string>& valid_ids() const noexcept { return valid_; }

    // Lower-cased words a template header may use ("camera", "style", "technical specs").
    const std::unordered_set<std::string>& header_labels() const noexcept { return header_labels_; }

    // Lower-cased category labels plus humanized attribute keys, deduplicated, sorted.
    std::vector<std::string> label_vocabulary() const;

    bool empty() const noexcept { return categories_.empty(); }

private:
    void index();

    std::vector<Category> categories_;
    std::unordered_map<std::string, std::string> legacy_;
    std::unordered_set<std::string> valid_;
    std::unordered_map<std::string, std::string> parent_;
    std::unordered_set<std::string> header_labels_;
};

} // namespace promptspan
