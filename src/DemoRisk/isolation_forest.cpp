#include "isolation_forest.h"
#include "sampling_engine.h"

#include "DemoRisk.Core/math_util.h"
#include "DemoRisk.Core/thread_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace {
constexpr double euler_gamma = 0.5772156649;

/// @brief Pending tree node, the rows are the range [begin, end) of the sample indices
struct NodeTask {
    int node;
    std::size_t begin;
    std::size_t end;
    int depth;
};
} // namespace

namespace drisk {

IsolationForest::IsolationForest(unsigned int n_estimators, unsigned int max_samples,
                                 double contamination)
    : n_estimators_{n_estimators}, max_samples_{max_samples}, contamination_{contamination} {
    if (n_estimators_ < 1) {
        throw std::invalid_argument("The number of estimators must be greater than zero.");
    }

    if (max_samples_ < 1) {
        throw std::invalid_argument("The maximum number of samples must be greater than zero.");
    }

    if (!(contamination_ > 0.0 && contamination_ <= 0.5)) {
        throw std::invalid_argument(
            fmt::format("Contamination must be in the range (0, 0.5], actual: {}.", contamination));
    }
}

IsolationForest::IsolationForest(const AnomalyModelParameters &parameters)
    : IsolationForest(parameters.n_estimators, parameters.max_samples, parameters.contamination) {}

std::string IsolationForest::name() const noexcept { return "Isolation Forest"; }

unsigned int IsolationForest::n_estimators() const noexcept { return n_estimators_; }

unsigned int IsolationForest::max_samples() const noexcept { return max_samples_; }

double IsolationForest::contamination() const noexcept { return contamination_; }

double IsolationForest::average_path_length(std::size_t size) noexcept {
    if (size <= 1) {
        return 0.0;
    }

    if (size == 2) {
        return 1.0;
    }

    auto n = static_cast<double>(size);
    return 2.0 * (std::log(n - 1.0) + euler_gamma) - 2.0 * (n - 1.0) / n;
}

AnomalyResult IsolationForest::detect(const Eigen::MatrixXd &data, unsigned int seed) const {
    const auto rows = static_cast<std::size_t>(data.rows());
    auto result = AnomalyResult{};
    if (rows == 0) {
        return result;
    }

    const auto sample_size = std::min<std::size_t>(max_samples_, rows);
    const auto height_limit =
        static_cast<int>(std::ceil(std::log2(std::max<double>(sample_size, 2.0))));

    // Per-tree seeds are drawn upfront, so the outcome does not depend on scheduling
    auto engine = SamplingEngine{seed};
    auto tree_seeds = std::vector<unsigned int>(n_estimators_);
    for (auto &tree_seed : tree_seeds) {
        tree_seed = engine.next_seed();
    }

    auto trees = std::vector<Tree>(n_estimators_);
    core::parallel_for(std::size_t{0}, trees.size(), [&](std::size_t index) {
        trees[index] = grow_tree(data, tree_seeds[index], sample_size, height_limit);
    });

    auto raw_scores = std::vector<double>(rows);
    const auto normaliser = average_path_length(sample_size);
    core::parallel_for(std::size_t{0}, rows, [&](std::size_t row) {
        if (normaliser <= 0.0) {
            raw_scores[row] = -0.5;
            return;
        }

        auto total_length = 0.0;
        for (const auto &tree : trees) {
            total_length += path_length(tree, data, static_cast<Eigen::Index>(row));
        }

        auto mean_length = total_length / static_cast<double>(trees.size());
        raw_scores[row] = -std::pow(2.0, -mean_length / normaliser);
    });

    result.offset = core::MathHelper::percentile(raw_scores, 100.0 * contamination_);
    result.scores.reserve(rows);
    result.flags.reserve(rows);
    for (const auto raw : raw_scores) {
        auto score = raw - result.offset;
        result.scores.push_back(score);
        result.flags.push_back(score < 0.0 ? outlier_flag : inlier_flag);
    }

    return result;
}

IsolationForest::Tree IsolationForest::grow_tree(const Eigen::MatrixXd &data, unsigned int seed,
                                                 std::size_t sample_size,
                                                 int height_limit) const {
    auto random = SamplingEngine{seed};
    auto indices = std::vector<Eigen::Index>(static_cast<std::size_t>(data.rows()));
    std::iota(indices.begin(), indices.end(), Eigen::Index{0});
    random.sample_front(indices, sample_size);

    const auto num_features = static_cast<std::size_t>(data.cols());
    auto features = std::vector<Eigen::Index>(num_features);

    auto tree = Tree{};
    tree.push_back(Node{.size = sample_size});
    auto pending = std::vector<NodeTask>{};
    pending.push_back(NodeTask{0, 0, sample_size, 0});
    while (!pending.empty()) {
        auto task = pending.back();
        pending.pop_back();

        if (task.depth >= height_limit || task.end - task.begin <= 1) {
            continue;
        }

        // Visit the features in random order, split on the first non-constant one
        std::iota(features.begin(), features.end(), Eigen::Index{0});
        auto split_feature = Eigen::Index{-1};
        auto lower = 0.0;
        auto upper = 0.0;
        for (auto remaining = num_features; remaining > 0; remaining--) {
            auto pick = random.next_index(0, remaining - 1);
            auto feature = features[pick];
            std::swap(features[pick], features[remaining - 1]);

            auto [min_it, max_it] = std::minmax_element(
                indices.begin() + static_cast<std::ptrdiff_t>(task.begin),
                indices.begin() + static_cast<std::ptrdiff_t>(task.end),
                [&](Eigen::Index a, Eigen::Index b) {
                    return data(a, feature) < data(b, feature);
                });

            lower = data(*min_it, feature);
            upper = data(*max_it, feature);
            if (lower < upper) {
                split_feature = feature;
                break;
            }
        }

        if (split_feature < 0) {
            continue;
        }

        auto threshold = random.next_uniform(lower, upper);
        auto middle = std::partition(indices.begin() + static_cast<std::ptrdiff_t>(task.begin),
                                     indices.begin() + static_cast<std::ptrdiff_t>(task.end),
                                     [&](Eigen::Index row) {
                                         return data(row, split_feature) <= threshold;
                                     });

        auto split = static_cast<std::size_t>(std::distance(indices.begin(), middle));
        auto left = static_cast<int>(tree.size());
        auto right = left + 1;
        tree.push_back(Node{.size = split - task.begin});
        tree.push_back(Node{.size = task.end - split});

        auto &node = tree[static_cast<std::size_t>(task.node)];
        node.feature = static_cast<int>(split_feature);
        node.threshold = threshold;
        node.left = left;
        node.right = right;

        pending.push_back(NodeTask{right, split, task.end, task.depth + 1});
        pending.push_back(NodeTask{left, task.begin, split, task.depth + 1});
    }

    return tree;
}

double IsolationForest::path_length(const Tree &tree, const Eigen::MatrixXd &data,
                                    Eigen::Index row) {
    auto index = 0;
    auto depth = 0.0;
    while (tree[static_cast<std::size_t>(index)].feature >= 0) {
        const auto &node = tree[static_cast<std::size_t>(index)];
        index = data(row, node.feature) <= node.threshold ? node.left : node.right;
        depth += 1.0;
    }

    return depth + average_path_length(tree[static_cast<std::size_t>(index)].size);
}

} // namespace drisk
