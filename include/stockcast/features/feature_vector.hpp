#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace stockcast::features {

/**
 * @struct FeatureVector
 * @brief Fixed-shape model input for one (entity, target date).
 *
 * Calendar features come from the target date; usage features come from the
 * recent consumption history. The canonical feature order (see names()) is
 * the column order every predictor artifact is keyed against.
 */
struct FeatureVector {
	static constexpr std::size_t kSize = 16;

	// Calendar
	double day_of_week = 0.0;
	double day_of_month = 0.0;
	double month = 0.0;
	double week_of_month = 0.0;
	double is_weekend = 0.0;
	double is_month_end = 0.0;
	double is_rainy_season = 0.0;

	// Usage history
	double usage_lag_1 = 0.0;
	double usage_lag_3 = 0.0;
	double usage_lag_7 = 0.0;
	double usage_lag_14 = 0.0;
	double usage_mean_7d = 0.0;
	double usage_std_7d = 0.0;
	double usage_mean_14d = 0.0;
	double usage_std_14d = 0.0;
	double stock_level_ratio = 1.0;

	std::array<double, kSize> toArray() const;

	/// Value at a canonical index.
	/// @throws std::out_of_range If the index is not below kSize.
	double at(std::size_t index) const;

	static const std::array<std::string_view, kSize> &names();
	static std::optional<std::size_t> indexOf(std::string_view name);
};

} // namespace stockcast::features
