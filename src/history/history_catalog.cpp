#include "wx-history/history/history_catalog.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/storage/data_path.hpp"
#include "wx-history/utils/logging.hpp"

#include <algorithm>
#include <utility>

namespace wxhistory::history {

HistoryCatalog::HistoryCatalog(const std::filesystem::path &archive_path, core::Location location,
                               storage::StoreConfig config, std::string entry_extension)
    : location_(std::move(location)), entry_extension_(std::move(entry_extension)),
      store_(archive_path, std::move(config)) {}

std::string HistoryCatalog::dataPath(const core::Date &date) const {
	return storage::DataPath::make(location_.alias, date, entry_extension_);
}

const std::vector<core::Date> &HistoryCatalog::cachedDates() {
	if (!dates_) {
		const auto alias = location_.foldedAlias();
		std::vector<core::Date> found;
		for (const auto &key : store_.keys()) {
			const auto path = storage::DataPath::parse(key);
			if (!path || path->alias != alias || path->extension != entry_extension_) {
				WXHISTORY_WARN("Ignoring '{}' in '{}', it is not a history of '{}'", key, store_.path().string(),
				               alias);
				continue;
			}
			found.push_back(path->date);
		}
		std::sort(found.begin(), found.end());
		dates_ = std::move(found);
	}
	return *dates_;
}

std::vector<core::Date> HistoryCatalog::dates(std::optional<core::Date> from, std::optional<core::Date> to) {
	const auto &all = cachedDates();
	auto first = all.begin();
	auto last = all.end();
	if (from) {
		first = std::lower_bound(all.begin(), all.end(), *from);
	}
	if (to) {
		last = std::upper_bound(all.begin(), all.end(), *to);
	}
	if (first >= last) {
		return {};
	}
	return std::vector<core::Date>(first, last);
}

bool HistoryCatalog::hasDate(const core::Date &date) const {
	return store_.exists(dataPath(date));
}

AddSummary HistoryCatalog::add(const std::vector<core::Date> &dates, const FetchFunction &on_each) {
	std::vector<core::Date> ordered(dates);
	std::sort(ordered.begin(), ordered.end());
	ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

	AddSummary summary;
	try {
		for (const auto &date : ordered) {
			const auto key = dataPath(date);
			if (store_.exists(key)) {
				WXHISTORY_WARN("{} history for {} already exists, skipping", location_.name, date.toString());
				++summary.skipped;
				continue;
			}

			const auto result = on_each(date);
			if (result.status == FetchResult::Status::Error) {
				WXHISTORY_ERROR("{} history for {} failed: {}", location_.name, date.toString(), result.reason);
				throw ProviderError(result.reason.empty() ? "The history provider reported an error." : result.reason,
				                    summary.added);
			}
			if (result.status == FetchResult::Status::Stop) {
				WXHISTORY_WARN("Stopped adding {} history at {}: {}", location_.name, date.toString(), result.reason);
				summary.stopped = true;
				summary.reason = result.reason;
				break;
			}

			store_.transact([&](storage::WriteTransaction &transaction) { transaction.write(key, result.payload); });
			++summary.added;

			if (result.status == FetchResult::Status::RecordedFinal) {
				WXHISTORY_WARN("Stopped adding {} history after {}: {}", location_.name, date.toString(),
				               result.reason);
				summary.stopped = true;
				summary.reason = result.reason;
				break;
			}
		}
	} catch (...) {
		if (summary.added > 0) {
			dates_.reset();
		}
		throw;
	}

	if (summary.added > 0) {
		dates_.reset();
	}
	WXHISTORY_INFO("Added {} of {} {} history dates ({} already present)", summary.added, ordered.size(),
	               location_.name, summary.skipped);
	return summary;
}

AddSummary HistoryCatalog::add(const std::vector<core::Date> &dates, HistoryProvider &provider,
                               const ProgressFunction &progress) {
	return add(dates, [this, &provider, &progress](const core::Date &date) {
		if (progress) {
			progress(date);
		}
		return provider.fetch(location_, date);
	});
}

storage::Bytes HistoryCatalog::history(const core::Date &date) {
	return store_.read(dataPath(date));
}

std::vector<core::DateRange> HistoryCatalog::historyDateRanges() {
	return mergeDateRanges(cachedDates());
}

std::vector<core::DateRange> mergeDateRanges(const std::vector<core::Date> &sorted_dates) {
	std::vector<core::DateRange> ranges;
	if (sorted_dates.empty()) {
		return ranges;
	}
	auto first = sorted_dates.front();
	auto last = first;
	for (std::size_t i = 1; i < sorted_dates.size(); ++i) {
		const auto &current = sorted_dates[i];
		if (last.daysUntil(current) > 1) {
			ranges.emplace_back(first, last);
			first = current;
		}
		last = current;
	}
	ranges.emplace_back(first, last);
	return ranges;
}

} // namespace wxhistory::history
