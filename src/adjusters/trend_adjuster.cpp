#include "stockcast/adjusters/trend_adjuster.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>

namespace stockcast::adjusters {

namespace {

double weekMean(const core::UsageHistory &window, std::size_t begin) {
	double sum = 0.0;
	for (std::size_t i = begin; i < begin + 7; ++i) {
		sum += window[i].quantity_used;
	}
	return sum / 7.0;
}

} // namespace

double TrendAdjuster::factor(core::EntityId entity_id, const core::UsageHistory &window) const {
	if (window.size() < kMinHistory) {
		STOCKCAST_DEBUG("Entity {} has {} usage records; trend factor is neutral.", entity_id, window.size());
		return 1.0;
	}

	const double recent = weekMean(window, 0);
	const double older = weekMean(window, 7);
	if (older == 0.0) {
		return 1.0;
	}

	const double ratio = std::clamp(recent / older, kMinRatio, kMaxRatio);
	return kSmoothing * ratio + (1.0 - kSmoothing);
}

} // namespace stockcast::adjusters
