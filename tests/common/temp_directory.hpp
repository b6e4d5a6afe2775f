#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace tests::fixtures {

/**
 * @brief Scratch directory removed with everything in it when the fixture goes out of scope.
 */
class TempDirectory {
public:
	TempDirectory() {
		std::random_device device;
		std::mt19937_64 rng(device());
		const auto base = std::filesystem::temp_directory_path();
		do {
			path_ = base / ("wx-history-test-" + std::to_string(rng()));
		} while (std::filesystem::exists(path_));
		std::filesystem::create_directories(path_);
	}

	~TempDirectory() {
		std::error_code ignored;
		std::filesystem::remove_all(path_, ignored);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &path() const {
		return path_;
	}

	std::filesystem::path operator/(const std::string &name) const {
		return path_ / name;
	}

private:
	std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path &path) {
	std::ifstream input(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path &path, const std::string &content) {
	std::ofstream output(path, std::ios::binary | std::ios::trunc);
	output.write(content.data(), static_cast<std::streamsize>(content.size()));
}

} // namespace tests::fixtures
