#pragma once

#include "wx-history/core/date.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wxhistory::core {

/**
 * @class DateRange
 * @brief An immutable, inclusive range of calendar dates.
 *
 * The low date is never after the high date. A range covering a single day
 * has equal low and high dates.
 */
class DateRange {
public:
	/**
	 * @brief Constructs a date range.
	 * @param low The first date of the range.
	 * @param high The last date of the range, defaults to low.
	 * @throws InvalidDateRange If high is before low.
	 */
	explicit DateRange(const Date &low, std::optional<Date> high = std::nullopt);

	const Date &low() const {
		return low_;
	}

	const Date &high() const {
		return high_;
	}

	bool equals(const DateRange &other) const {
		return low_ == other.low_ && high_ == other.high_;
	}

	/**
	 * @brief True when other lies completely inside this range.
	 */
	bool contains(const DateRange &other) const {
		return low_ <= other.low_ && high_ >= other.high_;
	}

	/**
	 * @brief Number of days between low and high (0 for a single day range).
	 */
	std::int64_t totalDays() const {
		return low_.daysUntil(high_);
	}

	bool spansYears() const {
		return low_.year() < high_.year();
	}

	/**
	 * @brief Every date from low to high inclusive, in ascending order.
	 */
	std::vector<Date> getDates() const;

	/**
	 * @brief The year agnostic form of this range used to compare seasons.
	 *
	 * Low is moved into the epoch year, high into the epoch year or the one
	 * after it when the range crosses a year boundary. February 29th becomes
	 * February 28th.
	 */
	DateRange asNeutralDateRange() const;

	std::string toString() const;

	friend bool operator==(const DateRange &lhs, const DateRange &rhs) {
		return lhs.equals(rhs);
	}

	friend bool operator!=(const DateRange &lhs, const DateRange &rhs) {
		return !lhs.equals(rhs);
	}

private:
	Date low_;
	Date high_;
};

} // namespace wxhistory::core
