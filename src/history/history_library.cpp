#include "wx-history/history/history_library.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace wxhistory::history {

HistoryLibrary::Builder &HistoryLibrary::Builder::dataDirectory(std::filesystem::path value) {
	data_directory_ = std::move(value);
	return *this;
}

HistoryLibrary::Builder &HistoryLibrary::Builder::archiveExtension(std::string value) {
	archive_extension_ = std::move(value);
	return *this;
}

HistoryLibrary::Builder &HistoryLibrary::Builder::entryExtension(std::string value) {
	entry_extension_ = std::move(value);
	return *this;
}

HistoryLibrary::Builder &HistoryLibrary::Builder::storeConfig(storage::StoreConfig value) {
	store_config_ = std::move(value);
	return *this;
}

HistoryLibrary HistoryLibrary::Builder::build() const {
	if (data_directory_.empty()) {
		throw std::invalid_argument("HistoryLibrary requires a data directory.");
	}
	if (std::filesystem::exists(data_directory_)) {
		if (!std::filesystem::is_directory(data_directory_)) {
			throw std::invalid_argument("HistoryLibrary: '" + data_directory_.string() + "' is not a directory.");
		}
	} else {
		WXHISTORY_INFO("Creating history directory '{}'", data_directory_.string());
		std::filesystem::create_directories(data_directory_);
	}
	return HistoryLibrary(data_directory_, archive_extension_, entry_extension_, store_config_);
}

HistoryLibrary::Builder HistoryLibrary::builder() {
	return Builder();
}

HistoryLibrary::HistoryLibrary(std::filesystem::path data_directory, std::string archive_extension,
                               std::string entry_extension, storage::StoreConfig store_config)
    : data_directory_(std::move(data_directory)), archive_extension_(std::move(archive_extension)),
      entry_extension_(std::move(entry_extension)), store_config_(std::move(store_config)) {}

std::filesystem::path HistoryLibrary::archivePath(const core::Location &location) const {
	return data_directory_ / (location.foldedAlias() + archive_extension_);
}

bool HistoryLibrary::historyExists(const core::Location &location) const {
	return std::filesystem::is_regular_file(archivePath(location));
}

HistoryCatalog &HistoryLibrary::openCatalog(const core::Location &location) {
	auto it = catalogs_.find(location);
	if (it == catalogs_.end()) {
		auto catalog = std::make_unique<HistoryCatalog>(archivePath(location), location, store_config_,
		                                                entry_extension_);
		it = catalogs_.emplace(location, std::move(catalog)).first;
	}
	return *it->second;
}

HistoryCatalog &HistoryLibrary::catalog(const core::Location &location) {
	if (catalogs_.find(location) == catalogs_.end() && !historyExists(location)) {
		throw NotFoundError("Yikes... history for '" + location.name + "' was not found in " +
		                    data_directory_.string());
	}
	return openCatalog(location);
}

AddSummary HistoryLibrary::addHistory(const core::Location &location, const std::vector<core::Date> &dates,
                                      const HistoryCatalog::FetchFunction &on_each) {
	if (dates.empty()) {
		WXHISTORY_WARN("No dates to add to the {} history", location.name);
		return AddSummary{};
	}
	return openCatalog(location).add(dates, on_each);
}

std::vector<core::Date> HistoryLibrary::historyDates(const core::Location &location, std::optional<core::Date> from,
                                                     std::optional<core::Date> to) {
	if (!historyExists(location)) {
		return {};
	}
	return openCatalog(location).dates(from, to);
}

std::vector<core::DateRange> HistoryLibrary::historyDateRanges(const core::Location &location) {
	if (!historyExists(location)) {
		return {};
	}
	return openCatalog(location).historyDateRanges();
}

storage::ArchiveProperties HistoryLibrary::historyProperties(const core::Location &location) {
	if (!historyExists(location)) {
		return storage::ArchiveProperties{};
	}
	return openCatalog(location).properties();
}

std::vector<std::pair<core::Location, storage::ArchiveProperties>>
HistoryLibrary::allHistoryProperties(const std::vector<core::Location> &locations) {
	std::vector<std::pair<core::Location, storage::ArchiveProperties>> result;
	result.reserve(locations.size());
	for (const auto &location : locations) {
		result.emplace_back(location, historyProperties(location));
	}
	std::sort(result.begin(), result.end(),
	          [](const auto &lhs, const auto &rhs) { return lhs.first.name < rhs.first.name; });
	return result;
}

bool HistoryLibrary::removeHistory(const core::Location &location) {
	catalogs_.erase(location);
	const auto path = archivePath(location);
	if (!std::filesystem::exists(path)) {
		WXHISTORY_WARN("There is no {} history to remove", location.name);
		return false;
	}
	std::filesystem::remove(path);
	WXHISTORY_INFO("Removed {} history '{}'", location.name, path.string());
	return true;
}

void HistoryLibrary::preload(const std::vector<core::Location> &locations) {
	for (const auto &location : locations) {
		if (!historyExists(location)) {
			continue;
		}
		auto &catalog = openCatalog(location);
		const auto dates = catalog.dates();
		for (const auto &date : dates) {
			catalog.history(date);
		}
		WXHISTORY_DEBUG("Preloaded {} {} history dates", dates.size(), location.name);
	}
}

void HistoryLibrary::close() {
	for (auto &entry : catalogs_) {
		entry.second->clearCache();
	}
	catalogs_.clear();
}

} // namespace wxhistory::history
