#pragma once

#include "wx-history/core/date.hpp"
#include "wx-history/core/date_range.hpp"
#include "wx-history/core/location.hpp"
#include "wx-history/history/history_catalog.hpp"
#include "wx-history/storage/blob_store.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wxhistory::history {

/**
 * @class HistoryLibrary
 * @brief A data directory holding one history archive per location.
 *
 * Catalogs are opened lazily and cached. A reference returned by catalog()
 * stays valid across addHistory() and is invalidated by removeHistory() for
 * that location and by close().
 */
class HistoryLibrary {
public:
	class Builder {
	public:
		Builder &dataDirectory(std::filesystem::path value);
		Builder &archiveExtension(std::string value);
		Builder &entryExtension(std::string value);
		Builder &storeConfig(storage::StoreConfig value);

		/**
		 * @throws std::invalid_argument If the data directory is unset or is not a directory.
		 */
		HistoryLibrary build() const;

	private:
		std::filesystem::path data_directory_;
		std::string archive_extension_ = ".zip";
		std::string entry_extension_ = "json";
		storage::StoreConfig store_config_;
	};

	static Builder builder();

	HistoryLibrary(HistoryLibrary &&) = default;
	HistoryLibrary &operator=(HistoryLibrary &&) = default;

	const std::filesystem::path &dataDirectory() const {
		return data_directory_;
	}

	std::filesystem::path archivePath(const core::Location &location) const;

	bool historyExists(const core::Location &location) const;

	/**
	 * @throws NotFoundError If the location has no history archive.
	 */
	HistoryCatalog &catalog(const core::Location &location);

	/**
	 * @brief Adds history for the location, creating its archive when needed.
	 *
	 * Goes through the cached catalog, so its date list reflects the new dates.
	 */
	AddSummary addHistory(const core::Location &location, const std::vector<core::Date> &dates,
	                      const HistoryCatalog::FetchFunction &on_each);

	std::vector<core::Date> historyDates(const core::Location &location, std::optional<core::Date> from = std::nullopt,
	                                     std::optional<core::Date> to = std::nullopt);

	std::vector<core::DateRange> historyDateRanges(const core::Location &location);

	storage::ArchiveProperties historyProperties(const core::Location &location);

	std::vector<std::pair<core::Location, storage::ArchiveProperties>>
	allHistoryProperties(const std::vector<core::Location> &locations);

	/**
	 * @brief Deletes the location's archive and drops its cached catalog.
	 * @return false if there was nothing to remove.
	 */
	bool removeHistory(const core::Location &location);

	/**
	 * @brief Reads every stored date of the locations into the read caches.
	 */
	void preload(const std::vector<core::Location> &locations);

	/**
	 * @brief Drops every cached catalog, invalidating references from catalog().
	 */
	void close();

private:
	HistoryLibrary(std::filesystem::path data_directory, std::string archive_extension, std::string entry_extension,
	               storage::StoreConfig store_config);

	HistoryCatalog &openCatalog(const core::Location &location);

	std::filesystem::path data_directory_;
	std::string archive_extension_;
	std::string entry_extension_;
	storage::StoreConfig store_config_;
	std::unordered_map<core::Location, std::unique_ptr<HistoryCatalog>, core::LocationHash> catalogs_;
};

} // namespace wxhistory::history
