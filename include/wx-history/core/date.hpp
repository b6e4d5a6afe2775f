#pragma once

#include <cstdint>
#include <string>

namespace wxhistory::core {

/**
 * @class Date
 * @brief A proleptic Gregorian calendar date.
 *
 * Dates are validated at construction and are immutable. Years are limited to
 * 1..9999 so that every date has a four digit compact form (YYYYMMDD).
 */
class Date {
public:
	static constexpr int kMinYear = 1;
	static constexpr int kMaxYear = 9999;

	/**
	 * @brief Constructs the date 1970-01-01.
	 */
	Date() = default;

	/**
	 * @brief Constructs a calendar date.
	 * @throws std::invalid_argument If the year, month or day is out of range.
	 */
	Date(int year, unsigned month, unsigned day);

	/**
	 * @brief Builds a date from the number of days since 1970-01-01.
	 */
	static Date fromDays(std::int64_t days);

	/**
	 * @brief Parses a compact YYYYMMDD date.
	 * @throws std::invalid_argument If the text is not eight digits or is not a real date.
	 */
	static Date parseCompact(const std::string &text);

	static bool isLeapYear(int year);
	static unsigned daysInMonth(int year, unsigned month);

	int year() const {
		return year_;
	}

	unsigned month() const {
		return month_;
	}

	unsigned day() const {
		return day_;
	}

	/**
	 * @brief Number of days since 1970-01-01 (negative before it).
	 */
	std::int64_t toDays() const;

	Date addDays(std::int64_t days) const;

	/**
	 * @brief Signed day difference `other - *this`.
	 */
	std::int64_t daysUntil(const Date &other) const {
		return other.toDays() - toDays();
	}

	/**
	 * @brief ISO form, YYYY-MM-DD.
	 */
	std::string toString() const;

	/**
	 * @brief Compact form used in archive keys, YYYYMMDD.
	 */
	std::string toCompactString() const;

	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.year_ == rhs.year_ && lhs.month_ == rhs.month_ && lhs.day_ == rhs.day_;
	}

	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return !(lhs == rhs);
	}

	friend bool operator<(const Date &lhs, const Date &rhs) {
		if (lhs.year_ != rhs.year_) {
			return lhs.year_ < rhs.year_;
		}
		if (lhs.month_ != rhs.month_) {
			return lhs.month_ < rhs.month_;
		}
		return lhs.day_ < rhs.day_;
	}

	friend bool operator>(const Date &lhs, const Date &rhs) {
		return rhs < lhs;
	}

	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return !(rhs < lhs);
	}

	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return !(lhs < rhs);
	}

private:
	int year_ = 1970;
	unsigned month_ = 1;
	unsigned day_ = 1;
};

} // namespace wxhistory::core
