#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace wxhistory::core {

/**
 * @brief A named place whose weather history is stored and compared.
 *
 * Weather data identifies a location by name and alias, so equality and
 * hashing only consider those two fields.
 */
struct Location {
	std::string name;
	std::string alias;
	std::string longitude;
	std::string latitude;
	std::string tz;

	bool isName(const std::string &value, bool case_sensitive = false) const;
	bool isAlias(const std::string &value, bool case_sensitive = false) const;

	/**
	 * @brief True when value matches either the name or the alias, ignoring case.
	 */
	bool isConsidered(const std::string &value) const {
		return isName(value) || isAlias(value);
	}

	/**
	 * @brief The alias in the lower case form used for archive names and keys.
	 */
	std::string foldedAlias() const;

	std::string toString() const;

	friend bool operator==(const Location &lhs, const Location &rhs) {
		return lhs.name == rhs.name && lhs.alias == rhs.alias;
	}

	friend bool operator!=(const Location &lhs, const Location &rhs) {
		return !(lhs == rhs);
	}
};

struct LocationHash {
	std::size_t operator()(const Location &location) const {
		const auto h1 = std::hash<std::string>{}(location.name);
		const auto h2 = std::hash<std::string>{}(location.alias);
		return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
	}
};

} // namespace wxhistory::core
