#include "stockcast/adjusters/seasonal_adjuster.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <mutex>

namespace stockcast::adjusters {

// --- SeasonalCache ---

std::optional<double> SeasonalCache::get(const Key &key) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	const auto it = factors_.find(key);
	if (it == factors_.end()) {
		return std::nullopt;
	}
	return it->second;
}

void SeasonalCache::put(const Key &key, double factor) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	factors_[key] = factor;
}

void SeasonalCache::clear() {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	factors_.clear();
}

std::size_t SeasonalCache::size() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return factors_.size();
}

// --- SeasonalAdjuster ---

double SeasonalAdjuster::factor(core::EntityId entity_id, const core::Date &target, const core::UsageHistory &window) {
	const unsigned weekday = target.weekday();
	const SeasonalCache::Key key{entity_id, weekday};
	if (const auto cached = cache_.get(key)) {
		return *cached;
	}

	const std::size_t n = window.size();
	if (n < kMinHistory) {
		STOCKCAST_DEBUG("Entity {} has {} usage records; seasonal factor is neutral.", entity_id, n);
		return 1.0;
	}

	double total = 0.0;
	double weekday_total = 0.0;
	std::size_t samples = 0;
	for (std::size_t i = 0; i < n; ++i) {
		const double used = window[i].quantity_used;
		total += used;
		if ((n - 1 - i) % 7 == 6 - weekday) {
			weekday_total += used;
			++samples;
		}
	}

	const double overall = total / static_cast<double>(n);
	if (samples < kMinSamples || overall <= 0.0) {
		return 1.0;
	}

	const double ratio = (weekday_total / static_cast<double>(samples)) / overall;
	const double result = std::clamp(ratio, kMinFactor, kMaxFactor);
	cache_.put(key, result);
	return result;
}

} // namespace stockcast::adjusters
