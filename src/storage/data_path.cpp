#include "wx-history/storage/data_path.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wxhistory::storage {

std::string DataPath::make(const std::string &alias, const core::Date &date, const std::string &extension) {
	std::string prefix(alias);
	std::transform(prefix.begin(), prefix.end(), prefix.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return prefix + "/" + prefix + "-" + date.toCompactString() + "." + extension;
}

std::optional<DataPath> DataPath::parse(const std::string &key) {
	const auto slash = key.rfind('/');
	const std::string filename = slash == std::string::npos ? key : key.substr(slash + 1);
	const auto dot = filename.rfind('.');
	const std::string stem = dot == std::string::npos ? filename : filename.substr(0, dot);
	const auto dash = stem.rfind('-');
	if (dash == std::string::npos || dash == 0) {
		return std::nullopt;
	}

	DataPath path;
	path.alias = stem.substr(0, dash);
	path.extension = dot == std::string::npos ? std::string() : filename.substr(dot + 1);
	try {
		path.date = core::Date::parseCompact(stem.substr(dash + 1));
	} catch (const std::invalid_argument &) {
		return std::nullopt;
	}
	return path;
}

} // namespace wxhistory::storage
