#include "stockcast/core/usage_record.hpp"

#include <algorithm>
#include <stdexcept>

namespace stockcast::core {

void sortMostRecentFirst(UsageHistory &records) {
	std::stable_sort(records.begin(), records.end(),
	                 [](const UsageRecord &lhs, const UsageRecord &rhs) { return lhs.date > rhs.date; });
}

std::vector<double> usageValues(const UsageHistory &records) {
	std::vector<double> values;
	values.reserve(records.size());
	for (const auto &record : records) {
		values.push_back(record.quantity_used);
	}
	return values;
}

UsageHistory trailingWindow(const UsageHistory &records, const Date &as_of, int days) {
	if (days < 0) {
		throw std::invalid_argument("Window length must be non-negative.");
	}
	const Date earliest = as_of.addDays(-days);
	UsageHistory window;
	window.reserve(std::min(records.size(), static_cast<std::size_t>(days)));
	for (const auto &record : records) {
		if (window.size() >= static_cast<std::size_t>(days)) {
			break;
		}
		if (record.date >= earliest) {
			window.push_back(record);
		}
	}
	return window;
}

} // namespace stockcast::core
