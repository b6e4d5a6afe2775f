#include <catch2/catch_test_macros.hpp>

#include "common/history_fixtures.hpp"
#include "wx-history/errors.hpp"
#include "wx-history/season/season_aligner.hpp"

#include <stdexcept>
#include <vector>

using tests::fixtures::range;
using wxhistory::AmbiguousSeasonWindow;
using wxhistory::NoCommonSeasonWindow;
using wxhistory::SeasonAlignmentError;
using wxhistory::core::Date;
using wxhistory::core::DateRange;
using wxhistory::season::EntityDateRange;
using wxhistory::season::MonthSlotMap;
using wxhistory::season::SeasonAligner;
using wxhistory::season::SlotRange;

namespace {

MonthSlotMap slotsOver(int first, int last) {
	MonthSlotMap slots;
	slots.set(SlotRange{first, last});
	return slots;
}

} // namespace

TEST_CASE("SeasonAligner aligns the same winter of different years", "[season][aligner]") {
	const auto mesa = tests::fixtures::mesa();
	const std::vector<EntityDateRange> histories{
	    {mesa, range(2019, 10, 1, 2020, 4, 30)},
	    {mesa, range(2020, 10, 1, 2021, 4, 30)},
	    {tests::fixtures::tucson(), range(2021, 10, 1, 2022, 4, 30)},
	};

	const auto alignment = SeasonAligner{}.align(histories);
	REQUIRE(alignment.span() == SlotRange{10, 16});
	REQUIRE(alignment.window() == SlotRange{10, 16});
	REQUIRE(MonthSlotMap::monthOf(alignment.window().first) == 10);
	REQUIRE(MonthSlotMap::monthOf(alignment.window().last) == 4);
	REQUIRE(alignment.multipleEntities());

	REQUIRE(alignment.entries().size() == 3);
	for (const auto &entry : alignment.entries()) {
		REQUIRE(entry.slots == slotsOver(10, 16));
		REQUIRE_FALSE(entry.shifted);
	}
	REQUIRE(alignment.entries()[1].range == histories[1].range);

	REQUIRE(alignment.windowDateRange() == range(1, 10, 1, 2, 4, 30));
	REQUIRE(alignment.dateRangeFor(0) == histories[0].range);
	REQUIRE(alignment.dateRangeFor(2) == histories[2].range);
}

TEST_CASE("SeasonAligner narrows the window to a shorter season", "[season][aligner]") {
	const auto mesa = tests::fixtures::mesa();
	const std::vector<EntityDateRange> histories{
	    {mesa, range(2019, 10, 1, 2020, 4, 30)},
	    {tests::fixtures::tucson(), range(2020, 10, 1, 2021, 4, 30)},
	    {tests::fixtures::flagstaff(), range(2021, 1, 1, 2021, 3, 31)},
	};

	const auto alignment = SeasonAligner{}.align(histories);
	REQUIRE(alignment.span() == SlotRange{10, 16});
	REQUIRE(alignment.window() == SlotRange{13, 15});
	REQUIRE(MonthSlotMap::monthOf(alignment.window().first) == 1);
	REQUIRE(MonthSlotMap::monthOf(alignment.window().last) == 3);

	const auto &entries = alignment.entries();
	REQUIRE(entries[0].slots == slotsOver(10, 16));
	REQUIRE(entries[1].slots == slotsOver(10, 16));
	REQUIRE(entries[2].slots == slotsOver(13, 15));
	REQUIRE(entries[2].shifted);
	REQUIRE_FALSE(entries[0].shifted);

	REQUIRE(alignment.windowDateRange() == range(2, 1, 1, 2, 3, 31));
	REQUIRE(alignment.dateRangeFor(0) == range(2020, 1, 1, 2020, 3, 31));
	REQUIRE(alignment.dateRangeFor(1) == range(2021, 1, 1, 2021, 3, 31));
	REQUIRE(alignment.dateRangeFor(2) == range(2021, 1, 1, 2021, 3, 31));
	REQUIRE_THROWS_AS(alignment.dateRangeFor(3), std::out_of_range);
}

TEST_CASE("SeasonAligner maps a partly moved calendar year onto the window", "[season][aligner]") {
	const std::vector<EntityDateRange> histories{
	    {tests::fixtures::mesa(), range(2019, 10, 1, 2020, 4, 30)},
	    {tests::fixtures::tucson(), range(2021, 1, 1, 2021, 12, 31)},
	};

	const auto alignment = SeasonAligner{}.align(histories);
	REQUIRE(alignment.window() == SlotRange{10, 16});
	REQUIRE(alignment.entries()[1].shifted);
	REQUIRE(alignment.entries()[1].slots.test(13));
	REQUIRE(alignment.entries()[1].slots.test(10));

	REQUIRE(alignment.dateRangeFor(0) == histories[0].range);
	REQUIRE(alignment.dateRangeFor(1) == range(2021, 10, 1, 2021, 12, 31));
}

TEST_CASE("SeasonAligner refuses to guess between disjoint seasons", "[season][aligner]") {
	const std::vector<EntityDateRange> histories{
	    {tests::fixtures::mesa(), range(2020, 1, 1, 2020, 3, 31)},
	    {tests::fixtures::tucson(), range(2020, 7, 1, 2020, 9, 30)},
	};
	REQUIRE_THROWS_AS(SeasonAligner{}.align(histories), AmbiguousSeasonWindow);
	REQUIRE_THROWS_AS(SeasonAligner{}.align(histories), SeasonAlignmentError);
}

TEST_CASE("SeasonAligner reports adjacent seasons without shared months", "[season][aligner]") {
	const std::vector<EntityDateRange> histories{
	    {tests::fixtures::mesa(), range(2020, 1, 1, 2020, 3, 31)},
	    {tests::fixtures::tucson(), range(2020, 4, 1, 2020, 6, 30)},
	};
	REQUIRE_THROWS_AS(SeasonAligner{}.align(histories), NoCommonSeasonWindow);
}

TEST_CASE("SeasonAligner accepts a single history", "[season][aligner]") {
	const std::vector<EntityDateRange> histories{
	    {tests::fixtures::mesa(), range(2021, 3, 15, 2021, 5, 10)},
	};
	const auto alignment = SeasonAligner{}.align(histories);
	REQUIRE(alignment.span() == SlotRange{3, 5});
	REQUIRE(alignment.window() == SlotRange{3, 5});
	REQUIRE_FALSE(alignment.multipleEntities());
	REQUIRE(alignment.dateRangeFor(0) == histories[0].range);
	REQUIRE(alignment.windowDateRange() == range(1, 3, 1, 1, 5, 31));
}

TEST_CASE("SeasonAligner places a single day in one slot", "[season][aligner]") {
	const std::vector<EntityDateRange> histories{
	    {tests::fixtures::mesa(), DateRange(Date(2021, 6, 15))},
	    {tests::fixtures::tucson(), range(2020, 5, 1, 2020, 7, 31)},
	};
	const auto alignment = SeasonAligner{}.align(histories);
	REQUIRE(alignment.entries()[0].slots.count() == 1);
	REQUIRE(alignment.entries()[0].slots.test(6));
	REQUIRE(alignment.span() == SlotRange{5, 7});
	REQUIRE(alignment.window() == SlotRange{6, 6});
	REQUIRE(alignment.dateRangeFor(0) == DateRange(Date(2021, 6, 15)));
	REQUIRE(alignment.dateRangeFor(1) == range(2020, 6, 1, 2020, 6, 30));
}

TEST_CASE("SeasonAligner needs at least one history", "[season][aligner]") {
	REQUIRE_THROWS_AS(SeasonAligner{}.align({}), std::invalid_argument);
}
