#pragma once

#include "wx-history/core/date_range.hpp"
#include "wx-history/core/location.hpp"
#include "wx-history/season/month_slot_map.hpp"

#include <cstddef>
#include <vector>

namespace wxhistory::season {

/**
 * @brief One history selected for comparison: the location and the dates chosen for it.
 */
struct EntityDateRange {
    core::Location entity;
    core::DateRange range;
};

/**
 * @brief Where one selected history sits on the aligned season timeline.
 */
struct AlignedHistory {
    core::Location entity;
    core::DateRange range;
    MonthSlotMap slots;
    // Moved forward a year so that it lines up with the rest of the selection.
    bool shifted = false;
};

/**
 * @class SeasonAlignment
 * @brief Result of aligning several histories onto one season window.
 *
 * The span is the single run of months occupied by any of the histories, the
 * window the part of the span occupied by all of them.
 */
class SeasonAlignment {
public:
    const SlotRange &span() const {
        return span_;
    }

    const SlotRange &window() const {
        return window_;
    }

    const std::vector<AlignedHistory> &entries() const {
        return entries_;
    }

    /**
     * @brief True when more than one distinct location takes part in the alignment.
     */
    bool multipleEntities() const;

    /**
     * @brief The neutral date range covering the window, first day of its first
     * month through the last day of its last month.
     */
    core::DateRange windowDateRange() const;

    /**
     * @brief The calendar dates of one history that fall inside the window.
     *
     * The window is laid over a single run of calendar months and clipped to
     * the history's own range. A history covering a whole calendar year under a
     * window that crosses new year yields the part from the window start to
     * December 31st.
     * @throws std::out_of_range If index is not a valid entry.
     * @throws NoCommonSeasonWindow If none of the history's dates fall inside that run.
     */
    core::DateRange dateRangeFor(std::size_t index) const;

private:
    friend class SeasonAligner;

    SeasonAlignment(SlotRange span, SlotRange window, std::vector<AlignedHistory> entries);

    SlotRange span_;
    SlotRange window_;
    std::vector<AlignedHistory> entries_;
};

/**
 * @class SeasonAligner
 * @brief Finds the contiguous month window shared by histories from different years or locations.
 *
 * Ambiguous selections are reported, never guessed.
 */
class SeasonAligner {
public:
    /**
     * @throws std::invalid_argument If histories is empty.
     * @throws NoCommonSeasonWindow If the histories share no months.
     * @throws AmbiguousSeasonWindow If the months fall into more than one run.
     */
    SeasonAlignment align(const std::vector<EntityDateRange> &histories) const;
};

} // namespace wxhistory::season
