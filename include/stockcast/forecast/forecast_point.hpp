#pragma once

#include "stockcast/core/date.hpp"

#include <string>

namespace stockcast::forecast {

/**
 * @struct AdaptiveForecastPoint
 * @brief One forecast day with its adjustment breakdown.
 *
 * `adjusted == max(0, raw * trend_factor * seasonal_factor)` and
 * `combined_adjustment == trend_factor * seasonal_factor`.
 */
struct AdaptiveForecastPoint {
	core::Date date;
	double adjusted = 0.0;
	double raw = 0.0;
	double trend_factor = 1.0;
	double seasonal_factor = 1.0;
	double combined_adjustment = 1.0;

	std::string weekday() const {
		return date.weekdayName();
	}
};

} // namespace stockcast::forecast
