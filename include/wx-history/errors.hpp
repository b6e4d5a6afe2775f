#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace wxhistory {

/**
 * @brief Raised when a date range is constructed with its high date before its low date.
 */
class InvalidDateRange : public std::invalid_argument {
public:
	explicit InvalidDateRange(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Base class for archive and blob store failures.
 *
 * Thrown directly for I/O failures (the archive could not be created, copied,
 * renamed or written).
 */
class StorageError : public std::runtime_error {
public:
	explicit StorageError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief A key was written that already exists in the archive.
 */
class DuplicateEntryError : public StorageError {
public:
	explicit DuplicateEntryError(const std::string &message) : StorageError(message) {}
};

/**
 * @brief The archive is structurally invalid or contains duplicate member names.
 */
class CorruptArchiveError : public StorageError {
public:
	explicit CorruptArchiveError(const std::string &message) : StorageError(message) {}
};

/**
 * @brief A key or archive that was asked for does not exist.
 */
class NotFoundError : public StorageError {
public:
	explicit NotFoundError(const std::string &message) : StorageError(message) {}
};

/**
 * @brief Base class for failures to align histories onto one season window.
 */
class SeasonAlignmentError : public std::runtime_error {
public:
	explicit SeasonAlignmentError(const std::string &message) : std::runtime_error(message) {}
};

class NoCommonSeasonWindow : public SeasonAlignmentError {
public:
	explicit NoCommonSeasonWindow(const std::string &message) : SeasonAlignmentError(message) {}
};

class AmbiguousSeasonWindow : public SeasonAlignmentError {
public:
	explicit AmbiguousSeasonWindow(const std::string &message) : SeasonAlignmentError(message) {}
};

/**
 * @brief The history provider reported an error while a batch of dates was being added.
 *
 * Dates fetched before the failing one are already committed; datesAdded() tells how many.
 */
class ProviderError : public std::runtime_error {
public:
	ProviderError(const std::string &message, std::size_t dates_added)
	    : std::runtime_error(message), dates_added_(dates_added) {}

	std::size_t datesAdded() const noexcept {
		return dates_added_;
	}

private:
	std::size_t dates_added_;
};

} // namespace wxhistory
