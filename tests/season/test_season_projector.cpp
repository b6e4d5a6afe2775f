#include <catch2/catch_test_macros.hpp>

#include "common/history_fixtures.hpp"
#include "wx-history/season/season_projector.hpp"

#include <stdexcept>

using tests::fixtures::range;
using wxhistory::core::Date;
using wxhistory::core::DateRange;
using wxhistory::season::SeasonProjector;

TEST_CASE("SeasonProjector slots of ranges within one year", "[season][projector]") {
	const auto spring = range(2021, 3, 15, 2021, 5, 10);
	REQUIRE(SeasonProjector::startSlot(spring) == 3);
	REQUIRE(SeasonProjector::endSlot(spring) == 5);

	const DateRange day(Date(2021, 6, 15));
	REQUIRE(SeasonProjector::startSlot(day) == 6);
	REQUIRE(SeasonProjector::endSlot(day) == 6);
}

TEST_CASE("SeasonProjector moves the end of a winter into the second year", "[season][projector]") {
	const auto winter = range(2019, 10, 1, 2020, 4, 30);
	REQUIRE(SeasonProjector::startSlot(winter) == 10);
	REQUIRE(SeasonProjector::endSlot(winter) == 16);

	const auto neutral = SeasonProjector::project(winter);
	REQUIRE(neutral.low() == Date(SeasonProjector::kEpochYear, 10, 1));
	REQUIRE(neutral.high() == Date(SeasonProjector::kEpochYear + 1, 4, 30));
}

TEST_CASE("SeasonProjector coerces leap days", "[season][projector]") {
	REQUIRE(SeasonProjector::neutralDate(Date(2020, 2, 29), 1) == Date(1, 2, 28));
	REQUIRE(SeasonProjector::neutralDate(Date(2020, 3, 1), 7) == Date(7, 3, 1));
}

TEST_CASE("SeasonProjector converts slots back to dates", "[season][projector]") {
	REQUIRE(SeasonProjector::slotDate(2020, 2, false) == Date(2020, 2, 1));
	REQUIRE(SeasonProjector::slotDate(2020, 2, true) == Date(2020, 2, 29));
	REQUIRE(SeasonProjector::slotDate(2020, 14, true) == Date(2021, 2, 28));
	REQUIRE(SeasonProjector::slotDate(2020, 24, true) == Date(2021, 12, 31));
	REQUIRE_THROWS_AS(SeasonProjector::slotDate(2020, 0, false), std::out_of_range);
	REQUIRE_THROWS_AS(SeasonProjector::slotDate(2020, 25, false), std::out_of_range);
}
