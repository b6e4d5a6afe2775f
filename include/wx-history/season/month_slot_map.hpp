#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace wxhistory::season {

/**
 * @brief Inclusive range of month slots.
 */
struct SlotRange {
    int first = 0;
    int last = 0;

    int length() const {
        return last - first + 1;
    }

    bool contains(int slot) const {
        return first <= slot && slot <= last;
    }

    bool operator==(const SlotRange& other) const {
        return first == other.first && last == other.last;
    }

    bool operator!=(const SlotRange& other) const {
        return !(*this == other);
    }
};

/**
 * @class MonthSlotMap
 * @brief Month occupancy over two synthetic years.
 *
 * Position 0 is unused, positions 1..12 are the months of the epoch year and
 * 13..24 the months of the year after it.
 */
class MonthSlotMap {
public:
    static constexpr std::size_t kSize = 25;
    static constexpr int kFirstSlot = 1;
    static constexpr int kLastSlot = 24;

    static int monthOf(int slot) {
        return slot > 12 ? slot - 12 : slot;
    }

    static int yearOffsetOf(int slot) {
        return slot > 12 ? 1 : 0;
    }

    void set(int slot, bool value = true);
    void set(const SlotRange& range);
    bool test(int slot) const;

    std::size_t count() const;
    bool empty() const {
        return count() == 0;
    }

    /**
     * @brief First to last occupied slot, if any slot is occupied.
     */
    std::optional<SlotRange> occupied() const;

    std::string toString() const;

    bool operator==(const MonthSlotMap& other) const {
        return slots_ == other.slots_;
    }

    bool operator!=(const MonthSlotMap& other) const {
        return !(*this == other);
    }

private:
    static void checkSlot(int slot);

    std::array<bool, kSize> slots_{};
};

} // namespace wxhistory::season
