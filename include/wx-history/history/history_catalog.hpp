#pragma once

#include "wx-history/core/date.hpp"
#include "wx-history/core/date_range.hpp"
#include "wx-history/core/location.hpp"
#include "wx-history/storage/blob_store.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wxhistory::history {

/**
 * @brief What the history provider returned for one date.
 */
struct FetchResult {
	enum class Status {
		Recorded,      // payload is persisted
		RecordedFinal, // payload is persisted, then the batch stops
		Stop,          // nothing to persist, the batch stops without error
		Error          // nothing to persist, the batch fails
	};

	Status status = Status::Stop;
	storage::Bytes payload;
	std::string reason;

	static FetchResult recorded(storage::Bytes payload) {
		return FetchResult{Status::Recorded, std::move(payload), {}};
	}

	static FetchResult recordedFinal(storage::Bytes payload, std::string reason = {}) {
		return FetchResult{Status::RecordedFinal, std::move(payload), std::move(reason)};
	}

	static FetchResult stop(std::string reason) {
		return FetchResult{Status::Stop, {}, std::move(reason)};
	}

	static FetchResult error(std::string reason) {
		return FetchResult{Status::Error, {}, std::move(reason)};
	}
};

/**
 * @class HistoryProvider
 * @brief Source of weather history payloads, typically a remote weather service client.
 */
class HistoryProvider {
public:
	virtual ~HistoryProvider() = default;

	virtual FetchResult fetch(const core::Location &location, const core::Date &date) = 0;
};

/**
 * @brief Outcome of adding a batch of dates.
 */
struct AddSummary {
	std::size_t added = 0;
	std::size_t skipped = 0;
	bool stopped = false;
	std::string reason;
};

/**
 * @class HistoryCatalog
 * @brief One location's weather history as a set of dates stored in a blob store.
 */
class HistoryCatalog {
public:
	using FetchFunction = std::function<FetchResult(const core::Date &)>;
	using ProgressFunction = std::function<void(const core::Date &)>;

	/**
	 * @brief Opens (or creates) the location's archive.
	 */
	HistoryCatalog(const std::filesystem::path &archive_path, core::Location location,
	               storage::StoreConfig config = {}, std::string entry_extension = "json");

	const core::Location &location() const {
		return location_;
	}

	/**
	 * @brief The archive key for a date.
	 */
	std::string dataPath(const core::Date &date) const;

	/**
	 * @brief Sorted history dates, optionally limited to [from, to].
	 */
	std::vector<core::Date> dates(std::optional<core::Date> from = std::nullopt,
	                              std::optional<core::Date> to = std::nullopt);

	bool hasDate(const core::Date &date) const;

	/**
	 * @brief Fetches and stores the dates that are not in the archive yet.
	 *
	 * Dates are handled in ascending order, each one committed in its own write
	 * transaction, so dates stored before a failure remain stored. Dates that
	 * already exist are skipped without calling on_each.
	 * @throws ProviderError If on_each reports an error.
	 */
	AddSummary add(const std::vector<core::Date> &dates, const FetchFunction &on_each);

	AddSummary add(const std::vector<core::Date> &dates, HistoryProvider &provider,
	               const ProgressFunction &progress = {});

	/**
	 * @brief The stored payload for a date.
	 * @throws NotFoundError If the date is not in the archive.
	 */
	storage::Bytes history(const core::Date &date);

	/**
	 * @brief The stored dates merged into runs of consecutive days.
	 */
	std::vector<core::DateRange> historyDateRanges();

	storage::ArchiveProperties properties() const {
		return store_.properties();
	}

	void clearCache() {
		store_.clearCache();
	}

	storage::BlobStore &store() {
		return store_;
	}

private:
	const std::vector<core::Date> &cachedDates();

	core::Location location_;
	std::string entry_extension_;
	storage::BlobStore store_;
	std::optional<std::vector<core::Date>> dates_;
};

/**
 * @brief Merges sorted dates into maximal ranges of consecutive days.
 */
std::vector<core::DateRange> mergeDateRanges(const std::vector<core::Date> &sorted_dates);

} // namespace wxhistory::history
