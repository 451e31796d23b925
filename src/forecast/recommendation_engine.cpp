#include "stockcast/forecast/recommendation_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace stockcast::forecast {

namespace {

std::string formatDays(double days) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(0) << days;
	return out.str();
}

} // namespace

std::string toString(Severity severity) {
	switch (severity) {
	case Severity::Urgent:
		return "urgent";
	case Severity::Critical:
		return "critical";
	case Severity::Warning:
		return "warning";
	case Severity::Ok:
		return "ok";
	}
	return "unknown";
}

double RecommendationEngine::daysOfStock(double total_predicted, std::int64_t current_stock) {
	if (total_predicted <= 0.0) {
		return kAmpleDays;
	}
	return static_cast<double>(current_stock) / (total_predicted / 7.0);
}

Recommendation RecommendationEngine::recommend(double total_predicted, std::int64_t current_stock,
                                               std::int64_t reorder_level) const {
	Recommendation rec;
	rec.days_of_stock = daysOfStock(total_predicted, current_stock);
	rec.display_days = rec.days_of_stock;

	if (current_stock <= reorder_level) {
		rec.level = Severity::Urgent;
		rec.message = "URGENT: Stock below reorder level. Order immediately!";
	} else if (rec.days_of_stock <= kCriticalDays) {
		rec.level = Severity::Critical;
		rec.message = "Critical: Stock will last only " + formatDays(rec.days_of_stock) + " days. Order now!";
	} else if (rec.days_of_stock <= kWarningDays) {
		rec.level = Severity::Warning;
		rec.message =
		    "Warning: Stock will last " + formatDays(rec.days_of_stock) + " days. Consider ordering soon.";
	} else {
		rec.level = Severity::Ok;
		rec.display_days = std::min(rec.days_of_stock, kMaxDisplayDays);
		rec.message = "Good: Stock sufficient for " + formatDays(rec.display_days) + " days.";
	}
	return rec;
}

Recommendation RecommendationEngine::recommend(const std::vector<AdaptiveForecastPoint> &points,
                                               std::int64_t current_stock, std::int64_t reorder_level) const {
	double total = 0.0;
	for (const auto &point : points) {
		total += point.adjusted;
	}
	return recommend(total, current_stock, reorder_level);
}

} // namespace stockcast::forecast
