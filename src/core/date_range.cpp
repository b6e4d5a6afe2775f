#include "wx-history/core/date_range.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/season/season_projector.hpp"

namespace wxhistory::core {

DateRange::DateRange(const Date &low, std::optional<Date> high) : low_(low), high_(high.value_or(low)) {
	if (high_ < low_) {
		throw InvalidDateRange("DateRange: high date (" + high_.toString() + ") cannot be less than low date (" +
		                       low_.toString() + ").");
	}
}

std::vector<Date> DateRange::getDates() const {
	std::vector<Date> dates;
	dates.reserve(static_cast<std::size_t>(totalDays()) + 1);
	const auto first = low_.toDays();
	const auto last = high_.toDays();
	for (auto day = first; day <= last; ++day) {
		dates.push_back(Date::fromDays(day));
	}
	return dates;
}

DateRange DateRange::asNeutralDateRange() const {
	return season::SeasonProjector::project(*this);
}

std::string DateRange::toString() const {
	return "DateRange(low=" + low_.toString() + ",high=" + high_.toString() + ")";
}

} // namespace wxhistory::core
