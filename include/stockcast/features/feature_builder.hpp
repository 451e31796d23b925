#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"
#include "stockcast/features/feature_vector.hpp"

#include <vector>

namespace stockcast::features {

/**
 * @struct UsageSummary
 * @brief The usage-derived half of a FeatureVector.
 *
 * Depends only on the usage window, so it is computed once per entity and
 * shared by every target date of a forecast horizon.
 */
struct UsageSummary {
	std::vector<double> series; ///< Padded series, most recent first.
	double lag_1 = 0.0;
	double lag_3 = 0.0;
	double lag_7 = 0.0;
	double lag_14 = 0.0;
	double mean_7d = 0.0;
	double std_7d = 0.0;
	double mean_14d = 0.0;
	double std_14d = 0.0;
};

/**
 * @class FeatureBuilder
 * @brief Turns a target date and recent usage into a FeatureVector.
 *
 * Pure: the output depends only on the arguments. Short or empty histories
 * are padded or replaced with defaults so downstream arithmetic never
 * divides by zero or indexes past the history.
 */
class FeatureBuilder {
public:
	static constexpr int kLookbackDays = 14;
	static constexpr double kDefaultUsage = 30.0;
	static constexpr double kDefaultStdDev = 5.0;

	/**
	 * @brief Builds the features for one target date.
	 * @param entity_id Entity the history belongs to (used for diagnostics).
	 * @param target Date the prediction is for.
	 * @param usage Usage values, most recent first. Only the first
	 *        kLookbackDays values are used.
	 * @param stock_level_ratio Stock ratio feature; serving paths pass 1.0.
	 */
	FeatureVector build(core::EntityId entity_id, const core::Date &target, const std::vector<double> &usage,
	                    double stock_level_ratio = 1.0) const;

	/// Combines a precomputed usage summary with the calendar features of @p target.
	FeatureVector build(const core::Date &target, const UsageSummary &summary, double stock_level_ratio = 1.0) const;

	static UsageSummary summarize(const std::vector<double> &usage);

	/// Fills the seven calendar fields of @p features from @p target.
	static void applyCalendar(const core::Date &target, FeatureVector &features);

	static bool isRainySeason(unsigned month);
};

} // namespace stockcast::features
