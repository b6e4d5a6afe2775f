#include "wx-history/core/date_range.hpp"
#include "wx-history/errors.hpp"
#include "wx-history/season/season_aligner.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace wxhistory;

namespace {

core::Location makeLocation(const std::string &name, const std::string &alias) {
	core::Location location;
	location.name = name;
	location.alias = alias;
	return location;
}

core::DateRange span(int y1, unsigned m1, unsigned d1, int y2, unsigned m2, unsigned d2) {
	return core::DateRange(core::Date(y1, m1, d1), core::Date(y2, m2, d2));
}

void printHeader(const std::string &title) {
	std::cout << "\n" << title << "\n";
	std::cout << std::string(title.length(), '-') << "\n";
}

void printAlignment(const season::SeasonAlignment &alignment) {
	std::cout << "Window: " << alignment.windowDateRange().toString() << "\n";
	for (std::size_t i = 0; i < alignment.entries().size(); ++i) {
		const auto &entry = alignment.entries()[i];
		std::cout << std::left << std::setw(10) << entry.entity.name << " " << entry.slots.toString()
		          << (entry.shifted ? " (shifted)" : "           ") << " -> " << alignment.dateRangeFor(i).toString()
		          << "\n";
	}
}

void align(const std::string &title, const std::vector<season::EntityDateRange> &histories) {
	printHeader(title);
	try {
		printAlignment(season::SeasonAligner{}.align(histories));
	} catch (const SeasonAlignmentError &error) {
		std::cout << "No alignment: " << error.what() << "\n";
	}
}

} // namespace

int main() {
	const auto mesa = makeLocation("Mesa", "mesa");
	const auto tucson = makeLocation("Tucson", "tucson");
	const auto flagstaff = makeLocation("Flagstaff", "flag");

	align("Three winters", {
	                           {mesa, span(2019, 10, 1, 2020, 4, 30)},
	                           {mesa, span(2020, 10, 1, 2021, 4, 30)},
	                           {tucson, span(2021, 10, 1, 2022, 4, 30)},
	                       });

	align("Winters against a first quarter", {
	                                             {mesa, span(2019, 10, 1, 2020, 4, 30)},
	                                             {tucson, span(2020, 10, 1, 2021, 4, 30)},
	                                             {flagstaff, span(2021, 1, 1, 2021, 3, 31)},
	                                         });

	align("Disjoint seasons", {
	                              {mesa, span(2020, 1, 1, 2020, 3, 31)},
	                              {tucson, span(2020, 7, 1, 2020, 9, 30)},
	                          });

	return 0;
}
