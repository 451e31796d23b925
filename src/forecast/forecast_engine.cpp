#include "stockcast/forecast/forecast_engine.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace stockcast::forecast {

namespace {

void requirePositiveHorizon(int horizon) {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
}

} // namespace

std::vector<double> ForecastEngine::rawPredictions(const models::IPredictor &predictor,
                                                   const core::UsageHistory &history, const core::Date &today,
                                                   int horizon) const {
	requirePositiveHorizon(horizon);

	const auto window = core::trailingWindow(history, today, features::FeatureBuilder::kLookbackDays);
	const auto summary = features::FeatureBuilder::summarize(core::usageValues(window));

	std::vector<double> raw;
	raw.reserve(static_cast<std::size_t>(horizon));
	for (int day = 1; day <= horizon; ++day) {
		const auto vector = features_.build(today.addDays(day), summary);
		raw.push_back(std::max(0.0, predictor.predict(vector)));
	}
	return raw;
}

std::vector<AdaptiveForecastPoint> ForecastEngine::assemble(const std::vector<double> &raw, const core::Date &today,
                                                            double trend_factor) const {
	std::vector<AdaptiveForecastPoint> points;
	points.reserve(raw.size());
	for (std::size_t i = 0; i < raw.size(); ++i) {
		AdaptiveForecastPoint point;
		point.date = today.addDays(static_cast<std::int64_t>(i) + 1);
		point.raw = raw[i];
		point.trend_factor = trend_factor;
		points.push_back(point);
	}
	return points;
}

std::vector<AdaptiveForecastPoint> ForecastEngine::forecast(const models::IPredictor &predictor,
                                                            core::EntityId entity_id,
                                                            const core::UsageHistory &history,
                                                            const core::Date &today, int horizon) {
	const auto raw = rawPredictions(predictor, history, today, horizon);

	const auto trend_window = core::trailingWindow(history, today, adjusters::TrendAdjuster::kWindowDays);
	const auto seasonal_window = core::trailingWindow(history, today, adjusters::SeasonalAdjuster::kWindowDays);
	const double trend_factor = trend_.factor(entity_id, trend_window);

	auto points = assemble(raw, today, trend_factor);
	for (auto &point : points) {
		point.seasonal_factor = seasonal_.factor(entity_id, point.date, seasonal_window);
		point.combined_adjustment = point.trend_factor * point.seasonal_factor;
		point.adjusted = std::max(0.0, point.raw * point.combined_adjustment);
	}
	STOCKCAST_DEBUG("Entity {}: {} day forecast, trend factor {:.3f}.", entity_id, horizon, trend_factor);
	return points;
}

std::vector<AdaptiveForecastPoint> ForecastEngine::forecastBatch(const models::IPredictor &predictor,
                                                                 core::EntityId entity_id,
                                                                 const core::UsageHistory &history,
                                                                 const core::Date &today, int horizon) const {
	const auto raw = rawPredictions(predictor, history, today, horizon);
	const auto trend_window = core::trailingWindow(history, today, adjusters::TrendAdjuster::kWindowDays);
	const double trend_factor = trend_.factor(entity_id, trend_window);

	auto points = assemble(raw, today, trend_factor);
	for (auto &point : points) {
		point.seasonal_factor = 1.0;
		point.combined_adjustment = point.trend_factor;
		point.adjusted = std::max(0.0, point.raw * point.combined_adjustment);
	}
	return points;
}

} // namespace stockcast::forecast
