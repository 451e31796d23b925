#include "stockcast/core/date.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace stockcast::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Civil <-> serial day conversion over 400-year eras.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

int parseDigits(const std::string &text, std::size_t pos, std::size_t count) {
	int value = 0;
	for (std::size_t i = pos; i < pos + count; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw std::invalid_argument("Date must be formatted as YYYY-MM-DD: '" + text + "'.");
		}
		value = value * 10 + (text[i] - '0');
	}
	return value;
}

} // namespace

unsigned Date::daysInMonth(int year, unsigned month) {
	static constexpr std::array<unsigned, 12> kDays{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

Date Date::fromYmd(int year, unsigned month, unsigned day) {
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	return Date(daysFromCivil(year, month, day));
}

Date Date::parse(const std::string &iso) {
	if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
		throw std::invalid_argument("Date must be formatted as YYYY-MM-DD: '" + iso + "'.");
	}
	const int year = parseDigits(iso, 0, 4);
	const int month = parseDigits(iso, 5, 2);
	const int day = parseDigits(iso, 8, 2);
	return fromYmd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::fromTimePoint(std::chrono::system_clock::time_point tp) {
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t quotient = seconds / kSecondsPerDay;
	if (seconds % kSecondsPerDay < 0) {
		--quotient;
	}
	return Date(quotient);
}

Date Date::today() {
	return fromTimePoint(std::chrono::system_clock::now());
}

Date::Civil Date::civil() const {
	const std::int64_t z = day_key_ + 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	const auto y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
	return Civil{y, m, d};
}

int Date::year() const {
	return civil().year;
}

unsigned Date::month() const {
	return civil().month;
}

unsigned Date::day() const {
	return civil().day;
}

unsigned Date::weekday() const {
	// 1970-01-01 was a Thursday (index 3 when Monday = 0).
	std::int64_t idx = (day_key_ + 3) % 7;
	if (idx < 0) {
		idx += 7;
	}
	return static_cast<unsigned>(idx);
}

std::string Date::weekdayName() const {
	static const std::array<const char *, 7> kNames{"Monday", "Tuesday",  "Wednesday", "Thursday",
	                                                "Friday", "Saturday", "Sunday"};
	return kNames[weekday()];
}

std::string Date::toString() const {
	const auto c = civil();
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
	return std::string(buffer);
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
	const Date date = Date::fromTimePoint(tp);
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	const std::int64_t of_day = seconds - date.dayKey() * kSecondsPerDay;
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "T%02d:%02d:%02dZ", static_cast<int>(of_day / 3600),
	              static_cast<int>(of_day % 3600 / 60), static_cast<int>(of_day % 60));
	return date.toString() + buffer;
}

} // namespace stockcast::core
