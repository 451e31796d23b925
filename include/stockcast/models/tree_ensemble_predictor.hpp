#pragma once

#include "stockcast/models/ipredictor.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace stockcast::models {

/**
 * @struct TreeNode
 * @brief A split or leaf of a regression tree.
 *
 * Split nodes send a sample to the left child when its feature value is
 * strictly less than the threshold.
 */
struct TreeNode {
	std::optional<std::size_t> split_feature; ///< Unset for leaves.
	double threshold = 0.0;
	std::size_t left_child = 0;
	std::size_t right_child = 0;
	double leaf_value = 0.0;

	bool isLeaf() const {
		return !split_feature.has_value();
	}
};

/// Nodes of one tree; index 0 is the root.
using RegressionTree = std::vector<TreeNode>;

/**
 * @class TreeEnsemblePredictor
 * @brief Additive ensemble of regression trees (gradient-boosted form).
 *
 * The prediction is the base score plus the leaf value reached in every tree.
 */
class TreeEnsemblePredictor final : public IPredictor {
public:
	/**
	 * @throws std::invalid_argument If a tree is empty, a split references an
	 *         unknown feature, or a child index does not point forward to an
	 *         existing node.
	 */
	TreeEnsemblePredictor(double base_score, std::vector<RegressionTree> trees);

	double predict(const features::FeatureVector &features) const override;
	std::string getName() const override {
		return "tree_ensemble";
	}
	nlohmann::json toJson() const override;

	static TreeEnsemblePredictor fromJson(const nlohmann::json &document);

	std::size_t treeCount() const {
		return trees_.size();
	}

private:
	static void validateTree(const RegressionTree &tree, std::size_t tree_index);

	double base_score_;
	std::vector<RegressionTree> trees_;
};

} // namespace stockcast::models
