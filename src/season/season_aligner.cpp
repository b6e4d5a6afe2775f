#include "wx-history/season/season_aligner.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/season/season_projector.hpp"
#include "wx-history/utils/logging.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using wxhistory::season::MonthSlotMap;
using wxhistory::season::SlotRange;

using SlotMembers = std::array<std::vector<std::size_t>, MonthSlotMap::kSize>;

std::string slotName(int slot) {
    static const char *kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::string name(kMonths[MonthSlotMap::monthOf(slot) - 1]);
    if (MonthSlotMap::yearOffsetOf(slot) > 0) {
        name += "+1";
    }
    return name;
}

std::string describe(const SlotRange &range) {
    return "[" + slotName(range.first) + ".." + slotName(range.last) + "]";
}

std::string describe(const std::vector<SlotRange> &runs) {
    std::string text;
    for (const auto &run : runs) {
        if (!text.empty()) {
            text += ", ";
        }
        text += describe(run);
    }
    return text;
}

bool isMember(const std::vector<std::size_t> &members, std::size_t index) {
    return std::find(members.begin(), members.end(), index) != members.end();
}

std::vector<SlotRange> occupiedRuns(const SlotMembers &slots) {
    std::vector<SlotRange> runs;
    bool in_run = false;
    for (int slot = MonthSlotMap::kFirstSlot; slot <= MonthSlotMap::kLastSlot; ++slot) {
        if (!slots[static_cast<std::size_t>(slot)].empty()) {
            if (in_run) {
                runs.back().last = slot;
            } else {
                runs.push_back(SlotRange{slot, slot});
                in_run = true;
            }
        } else {
            in_run = false;
        }
    }
    return runs;
}

} // namespace

namespace wxhistory::season {

SeasonAlignment::SeasonAlignment(SlotRange span, SlotRange window, std::vector<AlignedHistory> entries)
    : span_(span), window_(window), entries_(std::move(entries)) {}

bool SeasonAlignment::multipleEntities() const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [this](const AlignedHistory &entry) { return entry.entity != entries_.front().entity; });
}

core::DateRange SeasonAlignment::windowDateRange() const {
    const int year = SeasonProjector::kEpochYear;
    return core::DateRange(SeasonProjector::slotDate(year, window_.first, false),
                           SeasonProjector::slotDate(year, window_.last, true));
}

core::DateRange SeasonAlignment::dateRangeFor(std::size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("Season alignment entry " + std::to_string(index) + " does not exist.");
    }
    const auto &entry = entries_[index];
    // One base year for the whole window. A history that does not cross a year
    // boundary can only sit in a window starting in the second synthetic year by
    // having been moved there, so such a window maps to its own calendar year.
    const bool moved = !entry.range.spansYears() && MonthSlotMap::yearOffsetOf(window_.first) > 0;
    const int base_year = entry.range.low().year() - (moved ? 1 : 0);
    const auto slot_date = [base_year](int slot, bool last_day) {
        return SeasonProjector::slotDate(base_year, slot, last_day);
    };
    const auto low = std::max(slot_date(window_.first, false), entry.range.low());
    const auto high = std::min(slot_date(window_.last, true), entry.range.high());
    if (high < low) {
        throw NoCommonSeasonWindow(entry.range.toString() + " of " + entry.entity.name +
                                   " has no dates inside the season window.");
    }
    return core::DateRange(low, high);
}

SeasonAlignment SeasonAligner::align(const std::vector<EntityDateRange> &histories) const {
    if (histories.empty()) {
        throw std::invalid_argument("Season alignment requires at least one history.");
    }
    const std::size_t total = histories.size();

    SlotMembers slots;
    for (std::size_t i = 0; i < total; ++i) {
        const auto &range = histories[i].range;
        const int first = SeasonProjector::startSlot(range);
        const int last = SeasonProjector::endSlot(range);
        for (int slot = first; slot <= last; ++slot) {
            slots[static_cast<std::size_t>(slot)].push_back(i);
        }
    }

    // Histories that do not cross a year boundary may belong to the second
    // synthetic year when the rest of the selection already occupies it.
    std::vector<bool> shifted(total, false);
    for (int slot = MonthSlotMap::kFirstSlot; slot <= 12; ++slot) {
        auto &members = slots[static_cast<std::size_t>(slot)];
        if (members.empty() || members.size() == total) {
            continue;
        }
        auto &next_year = slots[static_cast<std::size_t>(slot + 12)];
        if (next_year.empty()) {
            continue;
        }
        std::vector<std::size_t> staying;
        for (auto index : members) {
            if (histories[index].range.spansYears()) {
                staying.push_back(index);
            } else {
                next_year.push_back(index);
                shifted[index] = true;
            }
        }
        members = std::move(staying);
    }

    const auto runs = occupiedRuns(slots);
    if (runs.empty()) {
        throw NoCommonSeasonWindow("The selected histories do not occupy any months.");
    }
    if (runs.size() > 1) {
        throw AmbiguousSeasonWindow("The selected histories fall into " + std::to_string(runs.size()) +
                                    " separate month groups " + describe(runs) + ".");
    }
    const SlotRange span = runs.front();

    std::vector<AlignedHistory> entries;
    entries.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        MonthSlotMap history_slots;
        for (int slot = span.first; slot <= span.last; ++slot) {
            if (isMember(slots[static_cast<std::size_t>(slot)], i)) {
                history_slots.set(slot);
            }
        }
        entries.push_back(AlignedHistory{histories[i].entity, histories[i].range, history_slots, shifted[i]});
    }

    std::vector<int> shared;
    for (int slot = span.first; slot <= span.last; ++slot) {
        if (slots[static_cast<std::size_t>(slot)].size() == total) {
            shared.push_back(slot);
        }
    }
    if (shared.empty()) {
        throw NoCommonSeasonWindow("No month in " + describe(span) + " is shared by all selected histories.");
    }
    const SlotRange window{shared.front(), shared.back()};
    if (static_cast<std::size_t>(window.length()) != shared.size()) {
        throw AmbiguousSeasonWindow("The months shared by all selected histories in " + describe(span) +
                                    " are not contiguous.");
    }

    WXHISTORY_DEBUG("Season alignment of {} histories: span {}, window {}", total, describe(span), describe(window));
    return SeasonAlignment(span, window, std::move(entries));
}

} // namespace wxhistory::season
