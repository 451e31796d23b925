#include "stockcast/features/training_set.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace stockcast::features {

TrainingSet TrainingSetBuilder::build(const core::UsageHistory &history) const {
	TrainingSet result;
	if (history.empty()) {
		return result;
	}

	core::UsageHistory ordered = history;
	std::stable_sort(ordered.begin(), ordered.end(),
	                 [](const core::UsageRecord &lhs, const core::UsageRecord &rhs) { return lhs.date < rhs.date; });

	const core::EntityId entity_id = ordered.front().entity_id;
	double opening_sum = 0.0;
	for (std::size_t i = 0; i < ordered.size(); ++i) {
		if (ordered[i].entity_id != entity_id) {
			throw std::invalid_argument("Training history must belong to a single entity.");
		}
		if (i > 0 && ordered[i].date == ordered[i - 1].date) {
			throw std::invalid_argument("Training history contains duplicate date " + ordered[i].date.toString() +
			                            ".");
		}
		opening_sum += static_cast<double>(ordered[i].opening_stock);
	}
	const double opening_mean = opening_sum / static_cast<double>(ordered.size());

	const auto lookback = static_cast<std::size_t>(FeatureBuilder::kLookbackDays);
	if (ordered.size() <= lookback) {
		STOCKCAST_DEBUG("Entity {} has {} records; no training examples built.", entity_id, ordered.size());
		return result;
	}

	const std::size_t count = ordered.size() - lookback;
	result.features.reserve(count);
	result.targets.reserve(count);
	result.dates.reserve(count);

	std::vector<double> window(lookback);
	for (std::size_t t = lookback; t < ordered.size(); ++t) {
		for (std::size_t k = 0; k < lookback; ++k) {
			window[k] = ordered[t - 1 - k].quantity_used;
		}
		const double ratio = static_cast<double>(ordered[t].opening_stock) / (opening_mean + 1.0);
		result.features.push_back(feature_builder_.build(ordered[t].date, FeatureBuilder::summarize(window), ratio));
		result.targets.push_back(ordered[t].quantity_used);
		result.dates.push_back(ordered[t].date);
	}

	STOCKCAST_DEBUG("Built {} training examples for entity {}.", result.size(), entity_id);
	return result;
}

} // namespace stockcast::features
