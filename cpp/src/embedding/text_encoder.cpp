#include "promptspan/embedding/text_encoder.hpp"
#include "promptspan/error.hpp"
#include "promptspan/util/text.hpp"

#include <string>

namespace promptspan {
namespace embedding {

// =============================================================================
// Hashed n-gram encoder
// =============================================================================

HashedNgramEncoder::HashedNgramEncoder(size_t dimensions)
    : dimensions_(dimensions) {
    PROMPTSPAN_CHECK_ARGUMENT(dimensions_ > 0, "encoder dimensions must be positive");
}

uint64_t HashedNgramEncoder::fnv1a(std::string_view bytes) noexcept {
    uint64_t h = 14695981039346656037ULL;
    for (char c : bytes) {
        h ^= static_cast<unsigned char>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

void HashedNgramEncoder::add_feature(Eigen::VectorXf& v, std::string_view feature, float weight) const {
    uint64_t h = fnv1a(feature);
    size_t index = static_cast<size_t>(h % dimensions_);
    float sign = (h >> 63) ? -1.0f : 1.0f;
    v[static_cast<Eigen::Index>(index)] += sign * weight;
}

Eigen::VectorXf HashedNgramEncoder::encode(std::string_view text) const {
    Eigen::VectorXf v = Eigen::VectorXf::Zero(static_cast<Eigen::Index>(dimensions_));

    std::string previous;
    for (const auto& tok : util::tokenize(text)) {
        if (!tok.is_word) {
            previous.clear();
            continue;
        }

        const std::string& word = tok.lower;
        add_feature(v, "w:" + word, 1.0f);

        // Character trigrams over the padded word carry morphology.
        std::string padded = "<" + word + ">";
        for (size_t i = 0; i + 3 <= padded.size(); ++i) {
            add_feature(v, "c:" + padded.substr(i, 3), 0.35f);
        }

        if (!previous.empty()) {
            add_feature(v, "b:" + previous + "_" + word, 0.5f);
        }
        previous = word;
    }

    float norm = v.norm();
    if (norm > 0.0f) {
        v /= norm;
    }
    return v;
}

// =============================================================================
// Similarity
// =============================================================================

double cosine_similarity(const Eigen::VectorXf& a, const Eigen::VectorXf& b) noexcept {
    if (a.size() != b.size() || a.size() == 0) return 0.0;
    double na = a.norm();
    double nb = b.norm();
    if (na == 0.0 || nb == 0.0) return 0.0;
    return static_cast<double>(a.dot(b)) / (na * nb);
}

} // namespace embedding
} // namespace promptspan
