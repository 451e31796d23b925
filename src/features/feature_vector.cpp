#include "stockcast/features/feature_vector.hpp"

#include <stdexcept>

namespace stockcast::features {

std::array<double, FeatureVector::kSize> FeatureVector::toArray() const {
	return {day_of_week,   day_of_month,  month,          week_of_month, is_weekend,     is_month_end,
	        is_rainy_season, usage_lag_1, usage_lag_3,    usage_lag_7,   usage_lag_14,   usage_mean_7d,
	        usage_std_7d,  usage_mean_14d, usage_std_14d, stock_level_ratio};
}

double FeatureVector::at(std::size_t index) const {
	if (index >= kSize) {
		throw std::out_of_range("Feature index out of range.");
	}
	return toArray()[index];
}

const std::array<std::string_view, FeatureVector::kSize> &FeatureVector::names() {
	static const std::array<std::string_view, kSize> kNames{
	    "day_of_week",    "day_of_month",  "month",          "week_of_month",
	    "is_weekend",     "is_month_end",  "is_rainy_season", "usage_lag_1",
	    "usage_lag_3",    "usage_lag_7",   "usage_lag_14",   "usage_mean_7d",
	    "usage_std_7d",   "usage_mean_14d", "usage_std_14d", "stock_level_ratio"};
	return kNames;
}

std::optional<std::size_t> FeatureVector::indexOf(std::string_view name) {
	const auto &all = names();
	for (std::size_t i = 0; i < all.size(); ++i) {
		if (all[i] == name) {
			return i;
		}
	}
	return std::nullopt;
}

} // namespace stockcast::features
