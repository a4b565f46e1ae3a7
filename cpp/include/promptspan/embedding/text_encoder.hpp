/**
 * Text Encoders for the Semantic Classifiers
 *
 * Phrases are embedded into a fixed-width dense vector so the Tier 1.5
 * extractors can compare them against prototype examples by cosine
 * similarity. The default encoder hashes word and character-trigram features
 * (feature hashing with a sign bit), which needs no model files and gives
 * morphological neighbours ("soft", "softly", "softer") overlapping vectors.
 */

#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace promptspan {
namespace embedding {

class TextEncoder {
public:
    virtual ~TextEncoder() = default;

    // L2-normalized embedding; the zero vector for text with no word tokens.
    virtual Eigen::VectorXf encode(std::string_view text) const = 0;

    virtual size_t dimensions() const = 0;
};

class HashedNgramEncoder : public TextEncoder {
public:
    explicit HashedNgramEncoder(size_t dimensions = 256);

    Eigen::VectorXf encode(std::string_view text) const override;
    size_t dimensions() const override { return dimensions_; }

    static uint64_t fnv1a(std::string_view bytes) noexcept;

private:
    void add_feature(Eigen::VectorXf& v, std::string_view feature, float weight) const;

    size_t dimensions_;
};

// Cosine of two vectors; 0 when either is all zeros or sizes differ.
double cosine_similarity(const Eigen::VectorXf& a, const Eigen::VectorXf& b) noexcept;

} // namespace embedding
} // namespace promptspan
