#pragma once

#include "stockcast/adjusters/seasonal_adjuster.hpp"
#include "stockcast/adjusters/trend_adjuster.hpp"
#include "stockcast/core/date.hpp"
#include "stockcast/core/usage_record.hpp"
#include "stockcast/features/feature_builder.hpp"
#include "stockcast/forecast/forecast_point.hpp"
#include "stockcast/models/ipredictor.hpp"

#include <vector>

namespace stockcast::forecast {

/**
 * @class ForecastEngine
 * @brief Produces day-by-day adaptive forecasts for one entity.
 *
 * Days run from tomorrow to `today + horizon`. Both paths share the raw
 * prediction step: the usage summary is taken from the 14-day trailing
 * window of the supplied history and the stock ratio is held at 1.0, so
 * identical inputs give identical raw values on either path.
 *
 * The engine owns the SeasonalAdjuster and therefore its cache; it must
 * outlive every request that uses it.
 */
class ForecastEngine {
public:
	/**
	 * @brief Raw model output per forecast day, clamped at zero.
	 * @param history Usage records as of @p today, most recent first.
	 */
	std::vector<double> rawPredictions(const models::IPredictor &predictor, const core::UsageHistory &history,
	                                   const core::Date &today, int horizon) const;

	/**
	 * @brief Single-entity path.
	 *
	 * The trend factor is computed once from the 30-day window, the seasonal
	 * factor once per day from the 21-day window.
	 *
	 * @param history At least the trailing 30 days of usage, most recent first.
	 * @throws std::invalid_argument If @p horizon is not positive.
	 */
	std::vector<AdaptiveForecastPoint> forecast(const models::IPredictor &predictor, core::EntityId entity_id,
	                                            const core::UsageHistory &history, const core::Date &today,
	                                            int horizon);

	/**
	 * @brief Batch path.
	 *
	 * Same as forecast() except the seasonal factor is held at 1.0, which
	 * keeps the batch free of per-day seasonal work across all entities.
	 */
	std::vector<AdaptiveForecastPoint> forecastBatch(const models::IPredictor &predictor, core::EntityId entity_id,
	                                                 const core::UsageHistory &history, const core::Date &today,
	                                                 int horizon) const;

	adjusters::SeasonalAdjuster &seasonalAdjuster() {
		return seasonal_;
	}

private:
	std::vector<AdaptiveForecastPoint> assemble(const std::vector<double> &raw, const core::Date &today,
	                                            double trend_factor) const;

	features::FeatureBuilder features_;
	adjusters::TrendAdjuster trend_;
	adjusters::SeasonalAdjuster seasonal_;
};

} // namespace stockcast::forecast
