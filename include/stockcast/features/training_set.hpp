#pragma once

#include "stockcast/core/usage_record.hpp"
#include "stockcast/features/feature_builder.hpp"
#include "stockcast/features/feature_vector.hpp"

#include <cstddef>
#include <vector>

namespace stockcast::features {

/// Supervised examples for one entity, in chronological order.
struct TrainingSet {
	std::vector<FeatureVector> features;
	std::vector<double> targets;
	std::vector<core::Date> dates;

	std::size_t size() const {
		return targets.size();
	}

	bool empty() const {
		return targets.empty();
	}
};

/**
 * @class TrainingSetBuilder
 * @brief Replays an entity's ledger into (FeatureVector, usage) pairs.
 *
 * Every day with a full lookback of prior records becomes one example whose
 * features are exactly what FeatureBuilder would produce when forecasting
 * that day, so trained models see the same inputs at serving time.
 */
class TrainingSetBuilder {
public:
	/**
	 * @param history Records of a single entity in any order.
	 * @throws std::invalid_argument If records span several entities or repeat a date.
	 */
	TrainingSet build(const core::UsageHistory &history) const;

private:
	FeatureBuilder feature_builder_;
};

} // namespace stockcast::features
