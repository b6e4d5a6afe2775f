#pragma once

#include "wx-history/core/date.hpp"
#include "wx-history/core/date_range.hpp"

namespace wxhistory::season {

/**
 * @brief Maps date ranges onto a year agnostic timeline made of two synthetic years.
 *
 * The epoch year and the year after it are not leap years, which is why
 * February 29th is coerced to the 28th.
 */
class SeasonProjector {
public:
    static constexpr int kEpochYear = 1;

    static core::Date neutralDate(const core::Date& date, int year);

    static core::DateRange project(const core::DateRange& range);

    /**
     * @brief The month slot (1..12) where the neutral form of the range begins.
     */
    static int startSlot(const core::DateRange& range);

    /**
     * @brief The month slot (1..24) where the neutral form of the range ends.
     */
    static int endSlot(const core::DateRange& range);

    /**
     * @brief Converts a month slot to a date in the given base year.
     *
     * Slots 13..24 land in the year after the base year.
     * @param last_day When true the last day of the month is used, otherwise the first.
     * @throws std::out_of_range If the slot is not in 1..24.
     */
    static core::Date slotDate(int year, int slot, bool last_day);
};

} // namespace wxhistory::season
