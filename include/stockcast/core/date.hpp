#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace stockcast::core {

/**
 * @class Date
 * @brief A calendar day in the proleptic Gregorian calendar (UTC).
 *
 * Stored as the number of days since 1970-01-01 so that day arithmetic and
 * ordering are integer operations. Civil fields are derived on demand.
 */
class Date {
public:
	using DayKey = std::int64_t;

	Date() = default;
	explicit Date(DayKey days_since_epoch) : day_key_(days_since_epoch) {
	}

	/**
	 * @brief Builds a date from civil fields.
	 * @throws std::invalid_argument If the month or day is out of range.
	 */
	static Date fromYmd(int year, unsigned month, unsigned day);

	/// Parses an ISO `YYYY-MM-DD` string.
	static Date parse(const std::string &iso);

	static Date fromTimePoint(std::chrono::system_clock::time_point tp);

	/// The current UTC day.
	static Date today();

	DayKey dayKey() const {
		return day_key_;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// Day of week with Monday = 0 ... Sunday = 6.
	unsigned weekday() const;
	std::string weekdayName() const;

	std::string toString() const;

	Date addDays(std::int64_t days) const {
		return Date(day_key_ + days);
	}

	std::int64_t daysUntil(const Date &other) const {
		return other.day_key_ - day_key_;
	}

	static unsigned daysInMonth(int year, unsigned month);

	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ == rhs.day_key_;
	}
	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ != rhs.day_key_;
	}
	friend bool operator<(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ < rhs.day_key_;
	}
	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ <= rhs.day_key_;
	}
	friend bool operator>(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ > rhs.day_key_;
	}
	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return lhs.day_key_ >= rhs.day_key_;
	}

private:
	struct Civil {
		int year;
		unsigned month;
		unsigned day;
	};

	Civil civil() const;

	DayKey day_key_ = 0;
};

/// ISO-8601 UTC timestamp with second precision, e.g. `2024-03-01T08:15:00Z`.
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

/// Supplies "today" to the forecasting components; replaceable in tests.
using DateProvider = std::function<Date()>;

} // namespace stockcast::core
