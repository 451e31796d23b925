#pragma once

#include "stockcast/core/entity.hpp"
#include "stockcast/core/usage_record.hpp"

#include <cstddef>

namespace stockcast::adjusters {

/**
 * @class TrendAdjuster
 * @brief Multiplicative correction for short-term demand drift.
 *
 * Compares the most recent week of usage with the week before it. The raw
 * ratio is clamped and then smoothed toward 1.0 so a single unusual week
 * cannot swing the forecast far. Stateless.
 */
class TrendAdjuster {
public:
	static constexpr int kWindowDays = 30;
	static constexpr std::size_t kMinHistory = 14;
	static constexpr double kMinRatio = 0.5;
	static constexpr double kMaxRatio = 1.5;
	static constexpr double kSmoothing = 0.7;

	/**
	 * @brief Trend factor in [kMinRatio, kMaxRatio].
	 * @param entity_id Entity the window belongs to (diagnostics only).
	 * @param window Usage records, most recent first.
	 * @return 1.0 when fewer than kMinHistory records exist or the older
	 *         week had no usage.
	 */
	double factor(core::EntityId entity_id, const core::UsageHistory &window) const;
};

} // namespace stockcast::adjusters
