#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"
#include "stockcast/core/usage_record.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace stockcast::adjusters {

/**
 * @class SeasonalCache
 * @brief Day-of-week factors keyed by (entity, weekday).
 *
 * Entries live for the lifetime of the cache. Nothing is evicted or
 * invalidated automatically, including on model reload; the key space is
 * bounded by entities x 7. clear() is the only way to drop entries.
 *
 * Concurrent put() calls for the same key race benignly: both writers
 * computed the factor from the same inputs and the last one wins.
 */
class SeasonalCache {
public:
	struct Key {
		core::EntityId entity_id;
		unsigned weekday;

		friend bool operator==(const Key &lhs, const Key &rhs) {
			return lhs.entity_id == rhs.entity_id && lhs.weekday == rhs.weekday;
		}
	};

	std::optional<double> get(const Key &key) const;
	void put(const Key &key, double factor);
	void clear();
	std::size_t size() const;

private:
	struct KeyHash {
		std::size_t operator()(const Key &key) const noexcept {
			return std::hash<core::EntityId>()(key.entity_id) * 7u + key.weekday;
		}
	};

	mutable std::shared_mutex mutex_;
	std::unordered_map<Key, double, KeyHash> factors_;
};

/**
 * @class SeasonalAdjuster
 * @brief Multiplicative correction for day-of-week demand patterns.
 *
 * The factor for a weekday is the mean usage of that weekday in the window
 * divided by the overall mean, clamped to [kMinFactor, kMaxFactor]. Computed
 * factors are memoised in a SeasonalCache shared by every request.
 */
class SeasonalAdjuster {
public:
	static constexpr int kWindowDays = 21;
	static constexpr std::size_t kMinHistory = 14;
	static constexpr std::size_t kMinSamples = 2;
	static constexpr double kMinFactor = 0.8;
	static constexpr double kMaxFactor = 1.2;

	/**
	 * @brief Seasonal factor for the weekday of @p target.
	 *
	 * Records are aligned to weekdays by stride 7 counting back from the
	 * oldest record: index i of n records falls on weekday `dow` when
	 * `(n - 1 - i) % 7 == 6 - dow`.
	 *
	 * @param window Usage records, most recent first.
	 * @return A cached factor if present, otherwise the computed factor.
	 *         Neutral results (1.0 from too little data) are not cached.
	 */
	double factor(core::EntityId entity_id, const core::Date &target, const core::UsageHistory &window);

	SeasonalCache &cache() {
		return cache_;
	}
	const SeasonalCache &cache() const {
		return cache_;
	}

private:
	SeasonalCache cache_;
};

} // namespace stockcast::adjusters
