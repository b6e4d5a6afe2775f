#include "wx-history/core/date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

// Days from 1970-01-01 to y-m-d using 400 year eras starting on March 1st.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

} // namespace

namespace wxhistory::core {

Date::Date(int year, unsigned month, unsigned day) : year_(year), month_(month), day_(day) {
	if (year < kMinYear || year > kMaxYear) {
		throw std::invalid_argument("Date year " + std::to_string(year) + " is out of range.");
	}
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Date month " + std::to_string(month) + " is out of range.");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Date day " + std::to_string(day) + " is out of range for " +
		                            std::to_string(year) + "-" + std::to_string(month) + ".");
	}
}

Date Date::fromDays(std::int64_t days) {
	days += 719468;
	const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const auto doe = static_cast<unsigned>(days - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d);
}

Date Date::parseCompact(const std::string &text) {
	if (text.size() != 8) {
		throw std::invalid_argument("Expected an YYYYMMDD date but found '" + text + "'.");
	}
	for (char c : text) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			throw std::invalid_argument("Expected an YYYYMMDD date but found '" + text + "'.");
		}
	}
	const int year = std::stoi(text.substr(0, 4));
	const auto month = static_cast<unsigned>(std::stoi(text.substr(4, 2)));
	const auto day = static_cast<unsigned>(std::stoi(text.substr(6, 2)));
	return Date(year, month, day);
}

bool Date::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned Date::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month " + std::to_string(month) + " is out of range.");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

std::int64_t Date::toDays() const {
	return daysFromCivil(year_, month_, day_);
}

Date Date::addDays(std::int64_t days) const {
	return fromDays(toDays() + days);
}

std::string Date::toString() const {
	std::ostringstream out;
	out << std::setfill('0') << std::setw(4) << year_ << '-' << std::setw(2) << month_ << '-' << std::setw(2)
	    << day_;
	return out.str();
}

std::string Date::toCompactString() const {
	std::ostringstream out;
	out << std::setfill('0') << std::setw(4) << year_ << std::setw(2) << month_ << std::setw(2) << day_;
	return out.str();
}

} // namespace wxhistory::core
