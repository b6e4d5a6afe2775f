#include "wx-history/season/month_slot_map.hpp"

#include <algorithm>
#include <stdexcept>

namespace wxhistory::season {

void MonthSlotMap::checkSlot(int slot) {
    if (slot < kFirstSlot || slot > kLastSlot) {
        throw std::out_of_range("Month slot " + std::to_string(slot) + " is out of range.");
    }
}

void MonthSlotMap::set(int slot, bool value) {
    checkSlot(slot);
    slots_[static_cast<std::size_t>(slot)] = value;
}

void MonthSlotMap::set(const SlotRange& range) {
    for (int slot = range.first; slot <= range.last; ++slot) {
        set(slot);
    }
}

bool MonthSlotMap::test(int slot) const {
    checkSlot(slot);
    return slots_[static_cast<std::size_t>(slot)];
}

std::size_t MonthSlotMap::count() const {
    return static_cast<std::size_t>(std::count(slots_.begin(), slots_.end(), true));
}

std::optional<SlotRange> MonthSlotMap::occupied() const {
    std::optional<SlotRange> range;
    for (int slot = kFirstSlot; slot <= kLastSlot; ++slot) {
        if (!slots_[static_cast<std::size_t>(slot)]) {
            continue;
        }
        if (!range) {
            range = SlotRange{slot, slot};
        } else {
            range->last = slot;
        }
    }
    return range;
}

std::string MonthSlotMap::toString() const {
    std::string text;
    text.reserve(kSize - 1);
    for (int slot = kFirstSlot; slot <= kLastSlot; ++slot) {
        text.push_back(slots_[static_cast<std::size_t>(slot)] ? 'X' : '.');
    }
    return text;
}

} // namespace wxhistory::season
