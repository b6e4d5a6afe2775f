#pragma once

#include "wx-history/core/date.hpp"

#include <optional>
#include <string>

namespace wxhistory::storage {

/**
 * @brief The parts of a history key, `{alias}/{alias}-{YYYYMMDD}.{ext}`.
 */
struct DataPath {
	std::string alias;
	core::Date date;
	std::string extension;

	/**
	 * @brief Builds the archive key for an alias and date. The alias is folded to lower case.
	 */
	static std::string make(const std::string &alias, const core::Date &date, const std::string &extension = "json");

	/**
	 * @brief Splits a key back into its parts.
	 * @return std::nullopt when the key does not follow the history naming convention.
	 */
	static std::optional<DataPath> parse(const std::string &key);

	std::string toString() const {
		return make(alias, date, extension);
	}
};

} // namespace wxhistory::storage
