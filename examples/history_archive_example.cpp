#include "wx-history/errors.hpp"
#include "wx-history/history/history_library.hpp"
#include "wx-history/utils/logging.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace wxhistory;

namespace {

// Stands in for a weather service that allows a limited number of requests.
class LimitedProvider : public history::HistoryProvider {
public:
	explicit LimitedProvider(std::size_t limit) : remaining_(limit) {}

	history::FetchResult fetch(const core::Location &location, const core::Date &date) override {
		if (remaining_ == 0) {
			return history::FetchResult::stop("daily request limit reached");
		}
		--remaining_;
		const std::string payload = "{\"location\":\"" + location.name + "\",\"date\":\"" + date.toString() +
		                            "\",\"hourly\":[]}";
		return remaining_ == 0 ? history::FetchResult::recordedFinal(payload, "daily request limit reached")
		                       : history::FetchResult::recorded(payload);
	}

private:
	std::size_t remaining_;
};

} // namespace

int main(int argc, char **argv) {
	utils::Logging::init(spdlog::level::info);

	const std::filesystem::path data_directory =
	    argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::temp_directory_path() / "wx-history-example";

	try {
		auto library = history::HistoryLibrary::builder().dataDirectory(data_directory).build();

		core::Location mesa;
		mesa.name = "Mesa";
		mesa.alias = "mesa";
		mesa.latitude = "33.4152";
		mesa.longitude = "-111.8315";
		mesa.tz = "America/Phoenix";

		const core::DateRange wanted(core::Date(2021, 1, 1), core::Date(2021, 1, 31));
		LimitedProvider provider(20);
		const auto summary = library.addHistory(mesa, wanted.getDates(), [&](const core::Date &date) {
			return provider.fetch(mesa, date);
		});
		std::cout << "Added " << summary.added << " dates, skipped " << summary.skipped << "\n";
		if (summary.stopped) {
			std::cout << "Stopped early: " << summary.reason << "\n";
		}

		auto &catalog = library.catalog(mesa);
		std::cout << "\nStored ranges\n";
		for (const auto &range : catalog.historyDateRanges()) {
			std::cout << "  " << range.toString() << " (" << range.totalDays() + 1 << " days)\n";
		}

		const auto first = catalog.dates().front();
		std::cout << "\n" << catalog.dataPath(first) << ": " << catalog.history(first) << "\n";

		for (const auto &entry : library.allHistoryProperties({mesa})) {
			const auto &properties = entry.second;
			std::cout << "\n" << entry.first.name << ": " << properties.entries << " entries, "
			          << properties.entries_size << " bytes, " << properties.compressed_size << " compressed, "
			          << properties.size << " on disk\n";
		}
	} catch (const std::exception &error) {
		std::cerr << "Error: " << error.what() << "\n";
		return 1;
	}
	return 0;
}
