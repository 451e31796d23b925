#pragma once

#include "stockcast/forecast/forecast_point.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stockcast::forecast {

enum class Severity { Urgent, Critical, Warning, Ok };

std::string toString(Severity severity);

struct Recommendation {
	Severity level = Severity::Ok;
	/// Unclamped days of cover; kAmpleDays when no demand is forecast.
	double days_of_stock = 0.0;
	/// Days shown to the operator (capped for the ok level).
	double display_days = 0.0;
	std::string message;
};

/**
 * @class RecommendationEngine
 * @brief Classifies stock cover into a restocking recommendation.
 *
 * Days of cover are stock divided by the forecast's average over a 7-day
 * week. Being at or below the reorder level is urgent regardless of cover.
 */
class RecommendationEngine {
public:
	static constexpr double kAmpleDays = 999.0;
	static constexpr double kCriticalDays = 3.0;
	static constexpr double kWarningDays = 7.0;
	static constexpr double kMaxDisplayDays = 30.0;

	Recommendation recommend(double total_predicted, std::int64_t current_stock, std::int64_t reorder_level) const;

	/// Sums the adjusted demand of @p points and classifies it.
	Recommendation recommend(const std::vector<AdaptiveForecastPoint> &points, std::int64_t current_stock,
	                         std::int64_t reorder_level) const;

	static double daysOfStock(double total_predicted, std::int64_t current_stock);
};

} // namespace stockcast::forecast
