#pragma once

#include "promptspan/embedding/text_encoder.hpp"

#include <Eigen/Dense>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace promptspan {
namespace embedding {

struct PrototypeCluster {
    std::string name;
    std::vector<std::string> examples;
};

/**
 * Nearest-prototype classifier.
 *
 * A phrase scores against a cluster by its best cosine similarity to any of
 * the cluster's examples. Example embeddings are computed on first use,
 * exactly once, and shared read-only by every caller afterwards.
 */
class PrototypeClassifier {
public:
    struct Classification {
        std::string label;
        double similarity = 0.0;
    };

    PrototypeClassifier(std::shared_ptr<const TextEncoder> encoder,
                        std::vector<PrototypeCluster> clusters);

    // Best cluster; ties keep the cluster declared first. Empty label if there are no clusters.
    Classification classify(std::string_view phrase) const;

    // One score per cluster, in declaration order.
    std::vector<Classification> scores(std::string_view phrase) const;

    const std::vector<PrototypeCluster>& clusters() const noexcept { return clusters_; }

    // Forces the one-time embedding pass.
    void prepare() const;

private:
    std::shared_ptr<const TextEncoder> encoder_;
    std::vector<PrototypeCluster> clusters_;

    mutable std::once_flag embed_once_;
    mutable std::vector<Eigen::MatrixXf> embeddings_;   // rows = examples
};

} // namespace embedding
} // namespace promptspan
