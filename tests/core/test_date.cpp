#include <catch2/catch_test_macros.hpp>

#include "wx-history/core/date.hpp"

#include <stdexcept>

using wxhistory::core::Date;

TEST_CASE("Date validates its calendar fields", "[core][date]") {
	REQUIRE_NOTHROW(Date(2020, 2, 29));
	REQUIRE_THROWS_AS(Date(2021, 2, 29), std::invalid_argument);
	REQUIRE_THROWS_AS(Date(2021, 13, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(Date(2021, 4, 31), std::invalid_argument);
	REQUIRE_THROWS_AS(Date(0, 1, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(Date(10000, 1, 1), std::invalid_argument);
}

TEST_CASE("Date leap years follow the Gregorian rules", "[core][date]") {
	REQUIRE(Date::isLeapYear(2020));
	REQUIRE(Date::isLeapYear(2000));
	REQUIRE_FALSE(Date::isLeapYear(1900));
	REQUIRE_FALSE(Date::isLeapYear(1));
	REQUIRE(Date::daysInMonth(2020, 2) == 29);
	REQUIRE(Date::daysInMonth(2021, 2) == 28);
	REQUIRE(Date::daysInMonth(2021, 12) == 31);
}

TEST_CASE("Date day arithmetic crosses months and years", "[core][date]") {
	REQUIRE(Date(1970, 1, 1).toDays() == 0);
	REQUIRE(Date(2000, 3, 1).toDays() == 11017);
	REQUIRE(Date::fromDays(11017) == Date(2000, 3, 1));
	REQUIRE(Date::fromDays(-1) == Date(1969, 12, 31));

	REQUIRE(Date(2020, 12, 31).addDays(1) == Date(2021, 1, 1));
	REQUIRE(Date(2020, 2, 28).addDays(1) == Date(2020, 2, 29));
	REQUIRE(Date(2021, 3, 1).addDays(-1) == Date(2021, 2, 28));
	REQUIRE(Date(2020, 1, 1).daysUntil(Date(2021, 1, 1)) == 366);
	REQUIRE(Date(1, 1, 1).addDays(365) == Date(2, 1, 1));
}

TEST_CASE("Date formats and parses compact keys", "[core][date]") {
	const Date date(2021, 7, 4);
	REQUIRE(date.toString() == "2021-07-04");
	REQUIRE(date.toCompactString() == "20210704");
	REQUIRE(Date::parseCompact("20210704") == date);
	REQUIRE(Date(1, 2, 3).toString() == "0001-02-03");

	REQUIRE_THROWS_AS(Date::parseCompact("2021074"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parseCompact("2021O704"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parseCompact("20210231"), std::invalid_argument);
}

TEST_CASE("Date ordering is chronological", "[core][date]") {
	REQUIRE(Date(2020, 12, 31) < Date(2021, 1, 1));
	REQUIRE(Date(2021, 1, 2) > Date(2021, 1, 1));
	REQUIRE(Date(2021, 1, 1) <= Date(2021, 1, 1));
	REQUIRE(Date(2021, 2, 1) != Date(2021, 1, 2));
}
