#include "stockcast/features/feature_builder.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace stockcast::features {

namespace {

double meanOfPrefix(const std::vector<double> &series, std::size_t count) {
	const double sum = std::accumulate(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(count), 0.0);
	return sum / static_cast<double>(count);
}

// Population standard deviation of the first `count` values.
double stdOfPrefix(const std::vector<double> &series, std::size_t count) {
	const double mean = meanOfPrefix(series, count);
	double sum_sq = 0.0;
	for (std::size_t i = 0; i < count; ++i) {
		const double diff = series[i] - mean;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(count));
}

double lagOrDefault(const std::vector<double> &series, std::size_t lag) {
	return series.size() >= lag ? series[lag - 1] : FeatureBuilder::kDefaultUsage;
}

} // namespace

UsageSummary FeatureBuilder::summarize(const std::vector<double> &usage) {
	const auto lookback = static_cast<std::size_t>(kLookbackDays);

	UsageSummary summary;
	if (usage.empty()) {
		summary.series.assign(lookback, kDefaultUsage);
	} else {
		const std::size_t available = std::min(usage.size(), lookback);
		summary.series.assign(usage.begin(), usage.begin() + static_cast<std::ptrdiff_t>(available));
		const double fill = meanOfPrefix(summary.series, available);
		summary.series.resize(lookback, fill);
	}

	const auto &series = summary.series;
	summary.lag_1 = lagOrDefault(series, 1);
	summary.lag_3 = lagOrDefault(series, 3);
	summary.lag_7 = lagOrDefault(series, 7);
	summary.lag_14 = lagOrDefault(series, 14);

	summary.mean_7d = series.size() >= 7 ? meanOfPrefix(series, 7) : kDefaultUsage;
	summary.std_7d = series.size() >= 7 ? stdOfPrefix(series, 7) : kDefaultStdDev;
	summary.mean_14d = series.size() >= 14 ? meanOfPrefix(series, 14) : kDefaultUsage;
	summary.std_14d = series.size() >= 14 ? stdOfPrefix(series, 14) : kDefaultStdDev;
	return summary;
}

bool FeatureBuilder::isRainySeason(unsigned month) {
	switch (month) {
	case 4:
	case 5:
	case 6:
	case 7:
	case 9:
	case 10:
	case 11:
		return true;
	default:
		return false;
	}
}

void FeatureBuilder::applyCalendar(const core::Date &target, FeatureVector &features) {
	const unsigned weekday = target.weekday();
	const unsigned day = target.day();
	const unsigned month = target.month();

	features.day_of_week = static_cast<double>(weekday);
	features.day_of_month = static_cast<double>(day);
	features.month = static_cast<double>(month);
	features.week_of_month = static_cast<double>((day - 1) / 7 + 1);
	features.is_weekend = weekday >= 5 ? 1.0 : 0.0;
	features.is_month_end = day > 25 ? 1.0 : 0.0;
	features.is_rainy_season = isRainySeason(month) ? 1.0 : 0.0;
}

FeatureVector FeatureBuilder::build(const core::Date &target, const UsageSummary &summary,
                                    double stock_level_ratio) const {
	FeatureVector features;
	applyCalendar(target, features);
	features.usage_lag_1 = summary.lag_1;
	features.usage_lag_3 = summary.lag_3;
	features.usage_lag_7 = summary.lag_7;
	features.usage_lag_14 = summary.lag_14;
	features.usage_mean_7d = summary.mean_7d;
	features.usage_std_7d = summary.std_7d;
	features.usage_mean_14d = summary.mean_14d;
	features.usage_std_14d = summary.std_14d;
	features.stock_level_ratio = stock_level_ratio;
	return features;
}

FeatureVector FeatureBuilder::build(core::EntityId entity_id, const core::Date &target,
                                    const std::vector<double> &usage, double stock_level_ratio) const {
	if (usage.empty()) {
		STOCKCAST_DEBUG("No recent usage for entity {}; using flat default series.", entity_id);
	}
	return build(target, summarize(usage), stock_level_ratio);
}

} // namespace stockcast::features
