#include <catch2/catch_test_macros.hpp>

#include "wx-history/storage/data_path.hpp"

using wxhistory::core::Date;
using wxhistory::storage::DataPath;

TEST_CASE("DataPath builds keys from the folded alias", "[storage][data_path]") {
	REQUIRE(DataPath::make("MESA", Date(2021, 7, 4)) == "mesa/mesa-20210704.json");
	REQUIRE(DataPath::make("tucson", Date(2020, 12, 31), "bin") == "tucson/tucson-20201231.bin");
}

TEST_CASE("DataPath parses the alias date and extension back", "[storage][data_path]") {
	const auto path = DataPath::parse("san-tan/san-tan-20210704.json");
	REQUIRE(path.has_value());
	REQUIRE(path->alias == "san-tan");
	REQUIRE(path->date == Date(2021, 7, 4));
	REQUIRE(path->extension == "json");
	REQUIRE(path->toString() == "san-tan/san-tan-20210704.json");
}

TEST_CASE("DataPath rejects keys that do not name a date", "[storage][data_path]") {
	REQUIRE_FALSE(DataPath::parse("mesa/readme.txt").has_value());
	REQUIRE_FALSE(DataPath::parse("mesa/mesa-2021070.json").has_value());
	REQUIRE_FALSE(DataPath::parse("mesa/mesa-20210230.json").has_value());
	REQUIRE_FALSE(DataPath::parse("-20210704.json").has_value());
}
