#include "stockcast/models/tree_ensemble_predictor.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace stockcast::models {

using features::FeatureVector;

namespace {

const char *const kSplitFeature = "split_feature";
const char *const kThreshold = "threshold";
const char *const kLeftChild = "left_child";
const char *const kRightChild = "right_child";
const char *const kLeafValue = "leaf_value";

double requireNumber(const nlohmann::json &node, const char *key) {
	if (!node.contains(key) || !node[key].is_number()) {
		throw std::invalid_argument(std::string("Tree node requires numeric '") + key + "'.");
	}
	return node[key].get<double>();
}

std::size_t requireIndex(const nlohmann::json &node, const char *key) {
	if (!node.contains(key) || !node[key].is_number_unsigned()) {
		throw std::invalid_argument(std::string("Tree node requires a non-negative integer '") + key + "'.");
	}
	return node[key].get<std::size_t>();
}

TreeNode parseNode(const nlohmann::json &node) {
	if (!node.is_object()) {
		throw std::invalid_argument("Tree nodes must be JSON objects.");
	}
	TreeNode parsed;
	if (node.contains(kSplitFeature)) {
		if (!node[kSplitFeature].is_string()) {
			throw std::invalid_argument("'split_feature' must be a feature name.");
		}
		const auto name = node[kSplitFeature].get<std::string>();
		const auto index = FeatureVector::indexOf(name);
		if (!index) {
			throw std::invalid_argument("Unknown split feature '" + name + "'.");
		}
		parsed.split_feature = *index;
		parsed.threshold = requireNumber(node, kThreshold);
		parsed.left_child = requireIndex(node, kLeftChild);
		parsed.right_child = requireIndex(node, kRightChild);
	} else {
		parsed.leaf_value = requireNumber(node, kLeafValue);
	}
	return parsed;
}

} // namespace

TreeEnsemblePredictor::TreeEnsemblePredictor(double base_score, std::vector<RegressionTree> trees)
    : base_score_(base_score), trees_(std::move(trees)) {
	if (!std::isfinite(base_score_)) {
		throw std::invalid_argument("Base score must be finite.");
	}
	for (std::size_t t = 0; t < trees_.size(); ++t) {
		validateTree(trees_[t], t);
	}
}

void TreeEnsemblePredictor::validateTree(const RegressionTree &tree, std::size_t tree_index) {
	const std::string where = "tree " + std::to_string(tree_index);
	if (tree.empty()) {
		throw std::invalid_argument("Empty " + where + ".");
	}
	for (std::size_t i = 0; i < tree.size(); ++i) {
		const auto &node = tree[i];
		if (node.isLeaf()) {
			if (!std::isfinite(node.leaf_value)) {
				throw std::invalid_argument("Non-finite leaf value in " + where + ".");
			}
			continue;
		}
		if (*node.split_feature >= FeatureVector::kSize) {
			throw std::invalid_argument("Split feature out of range in " + where + ".");
		}
		// Children must point forward so evaluation always terminates.
		if (node.left_child <= i || node.left_child >= tree.size() || node.right_child <= i ||
		    node.right_child >= tree.size()) {
			throw std::invalid_argument("Invalid child index at node " + std::to_string(i) + " of " + where + ".");
		}
	}
}

double TreeEnsemblePredictor::predict(const FeatureVector &features) const {
	const auto values = features.toArray();
	double total = base_score_;
	for (const auto &tree : trees_) {
		std::size_t index = 0;
		while (!tree[index].isLeaf()) {
			const auto &node = tree[index];
			index = values[*node.split_feature] < node.threshold ? node.left_child : node.right_child;
		}
		total += tree[index].leaf_value;
	}
	return total;
}

nlohmann::json TreeEnsemblePredictor::toJson() const {
	const auto &names = FeatureVector::names();
	nlohmann::json trees = nlohmann::json::array();
	for (const auto &tree : trees_) {
		nlohmann::json nodes = nlohmann::json::array();
		for (const auto &node : tree) {
			if (node.isLeaf()) {
				nodes.push_back({{kLeafValue, node.leaf_value}});
			} else {
				nodes.push_back({{kSplitFeature, std::string(names[*node.split_feature])},
				                 {kThreshold, node.threshold},
				                 {kLeftChild, node.left_child},
				                 {kRightChild, node.right_child}});
			}
		}
		trees.push_back({{"nodes", nodes}});
	}
	return {{"model_type", getName()}, {"base_score", base_score_}, {"trees", trees}};
}

TreeEnsemblePredictor TreeEnsemblePredictor::fromJson(const nlohmann::json &document) {
	const double base_score = document.contains("base_score") ? requireNumber(document, "base_score") : 0.0;
	if (!document.contains("trees") || !document["trees"].is_array()) {
		throw std::invalid_argument("Tree ensemble artifact requires a 'trees' array.");
	}

	std::vector<RegressionTree> trees;
	trees.reserve(document["trees"].size());
	for (const auto &tree_doc : document["trees"]) {
		if (!tree_doc.is_object() || !tree_doc.contains("nodes") || !tree_doc["nodes"].is_array()) {
			throw std::invalid_argument("Each tree requires a 'nodes' array.");
		}
		RegressionTree tree;
		tree.reserve(tree_doc["nodes"].size());
		for (const auto &node_doc : tree_doc["nodes"]) {
			tree.push_back(parseNode(node_doc));
		}
		trees.push_back(std::move(tree));
	}
	return TreeEnsemblePredictor(base_score, std::move(trees));
}

} // namespace stockcast::models
