#include "wx-history/season/season_projector.hpp"

#include "wx-history/season/month_slot_map.hpp"

#include <stdexcept>
#include <string>

namespace wxhistory::season {

core::Date SeasonProjector::neutralDate(const core::Date& date, int year) {
    const bool leap_day = date.month() == 2 && date.day() == 29;
    return core::Date(year, date.month(), leap_day ? 28 : date.day());
}

core::DateRange SeasonProjector::project(const core::DateRange& range) {
    const auto low = neutralDate(range.low(), kEpochYear);
    const auto high = neutralDate(range.high(), range.spansYears() ? kEpochYear + 1 : kEpochYear);
    return core::DateRange(low, high);
}

int SeasonProjector::startSlot(const core::DateRange& range) {
    return static_cast<int>(project(range).low().month());
}

int SeasonProjector::endSlot(const core::DateRange& range) {
    const auto month = static_cast<int>(project(range).high().month());
    return range.spansYears() ? month + 12 : month;
}

core::Date SeasonProjector::slotDate(int year, int slot, bool last_day) {
    if (slot < MonthSlotMap::kFirstSlot || slot > MonthSlotMap::kLastSlot) {
        throw std::out_of_range("Month slot " + std::to_string(slot) + " is out of range.");
    }
    const int actual_year = year + MonthSlotMap::yearOffsetOf(slot);
    const auto month = static_cast<unsigned>(MonthSlotMap::monthOf(slot));
    const unsigned day = last_day ? core::Date::daysInMonth(actual_year, month) : 1U;
    return core::Date(actual_year, month, day);
}

} // namespace wxhistory::season
