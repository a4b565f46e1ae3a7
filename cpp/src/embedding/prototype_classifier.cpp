#include "promptspan/embedding/prototype_classifier.hpp"
#include "promptspan/error.hpp"
#include "promptspan/logging.hpp"

namespace promptspan {
namespace embedding {

PrototypeClassifier::PrototypeClassifier(std::shared_ptr<const TextEncoder> encoder,
                                         std::vector<PrototypeCluster> clusters)
    : encoder_(std::move(encoder))
    , clusters_(std::move(clusters)) {
    PROMPTSPAN_CHECK_ARGUMENT(encoder_ != nullptr, "prototype classifier needs an encoder");
}

void PrototypeClassifier::prepare() const {
    std::call_once(embed_once_, [this]() {
        const auto dims = static_cast<Eigen::Index>(encoder_->dimensions());
        embeddings_.reserve(clusters_.size());

        size_t total = 0;
        for (const auto& cluster : clusters_) {
            Eigen::MatrixXf m(static_cast<Eigen::Index>(cluster.examples.size()), dims);
            for (size_t i = 0; i < cluster.examples.size(); ++i) {
                Eigen::VectorXf e = encoder_->encode(cluster.examples[i]);
                PROMPTSPAN_CHECK(e.size() == dims, ErrorCode::INTERNAL_ERROR,
                                 "encoder returned a vector of the wrong width");
                float norm = e.norm();
                if (norm > 0.0f) e /= norm;
                m.row(static_cast<Eigen::Index>(i)) = e.transpose();
            }
            total += cluster.examples.size();
            embeddings_.push_back(std::move(m));
        }

        LOG_DEBUG("Embedded ", total, " prototype examples across ", clusters_.size(), " clusters");
    });
}

std::vector<PrototypeClassifier::Classification> PrototypeClassifier::scores(std::string_view phrase) const {
    prepare();

    std::vector<Classification> out;
    out.reserve(clusters_.size());

    Eigen::VectorXf query = encoder_->encode(phrase);
    float qnorm = query.norm();

    for (size_t c = 0; c < clusters_.size(); ++c) {
        Classification cls;
        cls.label = clusters_[c].name;

        const auto& m = embeddings_[c];
        if (qnorm > 0.0f && m.rows() > 0 && query.size() == m.cols()) {
            // Rows were normalized in prepare(), so this is the cosine per example.
            Eigen::VectorXf sims = (m * query) / qnorm;
            cls.similarity = static_cast<double>(sims.maxCoeff());
        }
        out.push_back(std::move(cls));
    }
    return out;
}

PrototypeClassifier::Classification PrototypeClassifier::classify(std::string_view phrase) const {
    Classification best;
    bool first = true;
    for (auto& cls : scores(phrase)) {
        if (first || cls.similarity > best.similarity) {
            best = std::move(cls);
            first = false;
        }
    }
    return best;
}

} // namespace embedding
} // namespace promptspan
