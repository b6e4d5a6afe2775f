#include "wx-history/core/location.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string fold(const std::string &value) {
	std::string folded(value);
	std::transform(folded.begin(), folded.end(), folded.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return folded;
}

} // namespace

namespace wxhistory::core {

bool Location::isName(const std::string &value, bool case_sensitive) const {
	return case_sensitive ? value == name : fold(value) == fold(name);
}

bool Location::isAlias(const std::string &value, bool case_sensitive) const {
	return case_sensitive ? value == alias : fold(value) == fold(alias);
}

std::string Location::foldedAlias() const {
	return fold(alias);
}

std::string Location::toString() const {
	return "(name='" + name + "', alias=" + alias + ", longitude=" + longitude + ", latitude=" + latitude +
	       ", tz=" + tz + ")";
}

} // namespace wxhistory::core
