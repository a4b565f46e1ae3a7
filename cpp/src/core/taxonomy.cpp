#include "promptspan/taxonomy.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"
#include "promptspan/util/text.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <set>

namespace promptspan {

namespace {

std::string json_string(const boost::json::string& s) {
    return std::string(s.data(), s.size());
}

} // namespace

Taxonomy::Taxonomy(std::vector<Category> categories,
                   std::unordered_map<std::string, std::string> legacy_ids)
    : categories_(std::move(categories))
    , legacy_(std::move(legacy_ids)) {
    index();
}

void Taxonomy::index() {
    valid_.clear();
    parent_.clear();
    header_labels_.clear();

    std::unordered_set<std::string> roots;
    for (const auto& cat : categories_) {
        roots.insert(cat.id);
    }

    for (const auto& cat : categories_) {
        valid_.insert(cat.id);
        parent_[cat.id] = cat.id;

        header_labels_.insert(util::to_lower_ascii(cat.id));
        std::string label = util::to_lower_ascii(cat.label);
        header_labels_.insert(label);
        // "Style & Aesthetic" also heads sections as "Style" or "Aesthetic".
        size_t amp = label.find('&');
        if (amp != std::string::npos) {
            header_labels_.insert(util::trim(label.substr(0, amp)));
            header_labels_.insert(util::trim(label.substr(amp + 1)));
        }

        for (const auto& [key, attr_id] : cat.attributes) {
            valid_.insert(attr_id);
            size_t dot = attr_id.find('.');
            std::string prefix = dot == std::string::npos ? attr_id : attr_id.substr(0, dot);
            // First declaration wins; later aliases (camera FRAMING -> shot.type) keep the prefix owner.
            if (!parent_.count(attr_id)) {
                parent_[attr_id] = roots.count(prefix) ? prefix : cat.id;
            }
            header_labels_.insert(humanize_attribute(key));
        }
    }

    for (auto it = legacy_.begin(); it != legacy_.end();) {
        if (!valid_.count(it->second)) {
            LOG_WARN("Taxonomy legacy id '", it->first, "' maps to unknown id '", it->second, "', ignoring");
            it = legacy_.erase(it);
        } else {
            ++it;
        }
    }
}

Taxonomy Taxonomy::builtin() {
    std::vector<Category> cats = {
        {"shot", "Shot Type", {{"TYPE", "shot.type"}}},
        {"subject", "Subject & Character", {
            {"IDENTITY", "subject.identity"},
            {"APPEARANCE", "subject.appearance"},
            {"WARDROBE", "subject.wardrobe"},
            {"ACTION", "action.movement"},
            {"EMOTION", "subject.emotion"}}},
        {"action", "Action & Motion", {
            {"MOVEMENT", "action.movement"},
            {"STATE", "action.state"},
            {"GESTURE", "action.gesture"}}},
        {"environment", "Environment", {
            {"LOCATION", "environment.location"},
            {"WEATHER", "environment.weather"},
            {"CONTEXT", "environment.context"}}},
        {"lighting", "Lighting", {
            {"SOURCE", "lighting.source"},
            {"QUALITY", "lighting.quality"},
            {"TIME", "lighting.timeOfDay"},
            {"COLOR_TEMP", "lighting.colorTemp"}}},
        {"camera", "Camera", {
            {"FRAMING", "shot.type"},
            {"MOVEMENT", "camera.movement"},
            {"LENS", "camera.lens"},
            {"ANGLE", "camera.angle"},
            {"FOCUS", "camera.focus"}}},
        {"style", "Style & Aesthetic", {
            {"AESTHETIC", "style.aesthetic"},
            {"FILM_STOCK", "style.filmStock"},
            {"COLOR_GRADE", "style.colorGrade"}}},
        {"technical", "Technical Specs", {
            {"ASPECT_RATIO", "technical.aspectRatio"},
            {"FPS", "technical.frameRate"},
            {"RESOLUTION", "technical.resolution"},
            {"DURATION", "technical.duration"}}},
        {"audio", "Audio", {
            {"SCORE", "audio.score"},
            {"SFX", "audio.soundEffect"},
            {"AMBIENT", "audio.ambient"}}},
    };

    std::unordered_map<std::string, std::string> legacy = {
        {"identity", "subject.identity"},
        {"appearance", "subject.appearance"},
        {"wardrobe", "subject.wardrobe"},
        {"emotion", "subject.emotion"},
        {"subject.action", "action.movement"},
        {"location", "environment.location"},
        {"weather", "environment.weather"},
        {"context", "environment.context"},
        {"lighting_source", "lighting.source"},
        {"lightingSource", "lighting.source"},
        {"lighting_quality", "lighting.quality"},
        {"lightingQuality", "lighting.quality"},
        {"time_of_day", "lighting.timeOfDay"},
        {"timeOfDay", "lighting.timeOfDay"},
        {"timeofday", "lighting.timeOfDay"},
        {"colorTemp", "lighting.colorTemp"},
        {"color_temp", "lighting.colorTemp"},
        {"framing", "shot.type"},
        {"camera.framing", "shot.type"},
        {"camera_move", "camera.movement"},
        {"cameraMove", "camera.movement"},
        {"lens", "camera.lens"},
        {"angle", "camera.angle"},
        {"aperture", "camera.focus"},
        {"depth_of_field", "camera.focus"},
        {"aesthetic", "style.aesthetic"},
        {"film_stock", "style.filmStock"},
        {"filmStock", "style.filmStock"},
        {"color_grade", "style.colorGrade"},
        {"colorGrade", "style.colorGrade"},
        {"aspect_ratio", "technical.aspectRatio"},
        {"aspectRatio", "technical.aspectRatio"},
        {"frame_rate", "technical.frameRate"},
        {"frameRate", "technical.frameRate"},
        {"fps", "technical.frameRate"},
        {"resolution", "technical.resolution"},
        {"duration", "technical.duration"},
        {"score", "audio.score"},
        {"sound_effect", "audio.soundEffect"},
        {"soundEffect", "audio.soundEffect"},
        {"sfx", "audio.soundEffect"},
        {"ambience", "audio.ambient"},
    };

    return Taxonomy(std::move(cats), std::move(legacy));
}

Taxonomy Taxonomy::from_json(const std::string& json_text) {
    boost::json::value root;
    try {
        root = boost::json::parse(json_text);
    } catch (const std::exception& e) {
        PROMPTSPAN_THROW(ErrorCode::RESOURCE_PARSE_FAILED,
                         std::string("taxonomy JSON does not parse: ") + e.what());
    }

    const auto* obj = root.if_object();
    PROMPTSPAN_CHECK(obj != nullptr, ErrorCode::RESOURCE_PARSE_FAILED, "taxonomy root must be an object");
    const auto* cats_value = obj->if_contains("categories");
    PROMPTSPAN_CHECK(cats_value && cats_value->is_array(), ErrorCode::RESOURCE_PARSE_FAILED,
                     "taxonomy needs a 'categories' array");

    std::vector<Category> cats;
    for (const auto& entry : cats_value->get_array()) {
        const auto* cat_obj = entry.if_object();
        if (!cat_obj) {
            LOG_WARN("Skipping non-object taxonomy category entry");
            continue;
        }
        const auto* id = cat_obj->if_contains("id");
        if (!id || !id->is_string() || id->get_string().empty()) {
            LOG_WARN("Skipping taxonomy category without an id");
            continue;
        }

        Category cat;
        cat.id = json_string(id->get_string());
        const auto* label = cat_obj->if_contains("label");
        cat.label = (label && label->is_string()) ? json_string(label->get_string()) : cat.id;

        if (const auto* attrs = cat_obj->if_contains("attributes")) {
            if (const auto* attr_obj = attrs->if_object()) {
                for (const auto& kv : *attr_obj) {
                    if (!kv.value().is_string()) continue;
                    cat.attributes.emplace_back(std::string(kv.key().data(), kv.key().size()),
                                                json_string(kv.value().get_string()));
                }
            }
        }
        cats.push_back(std::move(cat));
    }

    std::unordered_map<std::string, std::string> legacy;
    if (const auto* legacy_value = obj->if_contains("legacy")) {
        if (const auto* legacy_obj = legacy_value->if_object()) {
            for (const auto& kv : *legacy_obj) {
                if (kv.value().is_string()) {
                    legacy[std::string(kv.key().data(), kv.key().size())] =
                        json_string(kv.value().get_string());
                }
            }
        }
    }

    PROMPTSPAN_CHECK(!cats.empty(), ErrorCode::RESOURCE_PARSE_FAILED, "taxonomy has no usable categories");
    return Taxonomy(std::move(cats), std::move(legacy));
}

Taxonomy Taxonomy::load_or_builtin(const std::string& path) {
    if (path.empty()) {
        return builtin();
    }

    try {
        Taxonomy t = from_json(util::read_file(path));
        LOG_INFO("Loaded taxonomy from ", path, " (", t.valid_ids().size(), " ids)");
        return t;
    } catch (const PromptSpanException& e) {
        LOG_WARN("Could not load taxonomy from ", path, ": ", e.what(), "; using built-in taxonomy");
        return builtin();
    }
}

bool Taxonomy::is_valid(const std::string& id) const {
    return valid_.count(id) > 0;
}

std::string Taxonomy::parent_of(const std::string& id) const {
    auto it = parent_.find(id);
    if (it != parent_.end()) {
        return it->second;
    }
    size_t dot = id.find('.');
    return dot == std::string::npos ? id : id.substr(0, dot);
}

std::string Taxonomy::resolve(const std::string& id) const {
    if (valid_.count(id)) return id;
    auto it = legacy_.find(id);
    return it != legacy_.end() ? it->second : id;
}

std::string Taxonomy::label_of(const std::string& id) const {
    std::string root = parent_of(id);
    for (const auto& cat : categories_) {
        if (cat.id == root) return cat.label;
    }
    return std::string();
}

int Taxonomy::specificity(const std::string& id) noexcept {
    if (id.empty()) return 0;
    return 1 + static_cast<int>(std::count(id.begin(), id.end(), '.'));
}

std::string Taxonomy::humanize_attribute(const std::string& key) {
    std::string out = util::to_lower_ascii(key);
    std::replace(out.begin(), out.end(), '_', ' ');
    return out;
}

std::vector<std::string> Taxonomy::label_vocabulary() const {
    std::set<std::string> labels;
    for (const auto& cat : categories_) {
        labels.insert(util::to_lower_ascii(cat.label));
        for (const auto& attr : cat.attributes) {
            labels.insert(humanize_attribute(attr.first));
        }
    }
    return std::vector<std::string>(labels.begin(), labels.end());
}

} // namespace promptspan
