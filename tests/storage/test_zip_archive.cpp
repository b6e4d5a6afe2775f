#include <catch2/catch_test_macros.hpp>

#include "common/temp_directory.hpp"
#include "wx-history/errors.hpp"
#include "wx-history/storage/zip_archive.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using tests::fixtures::TempDirectory;
using wxhistory::CorruptArchiveError;
using wxhistory::storage::Compression;
using wxhistory::storage::ZipAppender;
using wxhistory::storage::ZipArchive;
using wxhistory::storage::ZipDirectory;

namespace {

ZipDirectory readDirectory(const std::filesystem::path &path) {
	std::ifstream input(path, std::ios::binary);
	return ZipArchive::readDirectory(input, path.string());
}

std::string readEntry(const std::filesystem::path &path, std::size_t index) {
	std::ifstream input(path, std::ios::binary);
	const auto directory = ZipArchive::readDirectory(input, path.string());
	return ZipArchive::readEntry(input, directory.entries.at(index), path.string());
}

} // namespace

TEST_CASE("ZipArchive creates an empty archive", "[storage][zip]") {
	TempDirectory dir;
	const auto path = dir / "empty.zip";
	ZipArchive::createEmpty(path);

	REQUIRE(std::filesystem::file_size(path) == 22);
	const auto directory = readDirectory(path);
	REQUIRE(directory.entries.empty());
	REQUIRE(directory.directory_offset == 0);
}

TEST_CASE("ZipAppender adds members that read back intact", "[storage][zip]") {
	TempDirectory dir;
	const auto path = dir / "members.zip";
	ZipArchive::createEmpty(path);
	const std::string repeated(4096, 'x');

	for (const auto compression : {Compression::Store, Compression::Deflate}) {
		std::filesystem::remove(path);
		ZipArchive::createEmpty(path);

		ZipAppender appender(path, readDirectory(path), compression, -1);
		appender.append("mesa/mesa-20210101.json", "{\"temp\":12.5}");
		appender.append("mesa/mesa-20210102.json", repeated);
		appender.append("mesa/mesa-20210103.json", "");
		const auto offset = appender.finish();

		const auto directory = readDirectory(path);
		REQUIRE(directory.directory_offset == offset);
		REQUIRE(directory.entries.size() == 3);
		REQUIRE(directory.entries[0].name == "mesa/mesa-20210101.json");
		REQUIRE(directory.entries[1].uncompressed_size == repeated.size());
		if (compression == Compression::Deflate) {
			REQUIRE(directory.entries[1].compressed_size < repeated.size());
		}
		REQUIRE(readEntry(path, 0) == "{\"temp\":12.5}");
		REQUIRE(readEntry(path, 1) == repeated);
		REQUIRE(readEntry(path, 2).empty());
	}
}

TEST_CASE("ZipAppender appends to an archive that already has members", "[storage][zip]") {
	TempDirectory dir;
	const auto path = dir / "grow.zip";
	ZipArchive::createEmpty(path);
	{
		ZipAppender appender(path, readDirectory(path), Compression::Deflate, 6);
		appender.append("a", "first");
		appender.finish();
	}
	{
		ZipAppender appender(path, readDirectory(path), Compression::Deflate, 6);
		appender.append("b", "second");
		REQUIRE(appender.entries().size() == 2);
		appender.finish();
	}
	REQUIRE(readDirectory(path).entries.size() == 2);
	REQUIRE(readEntry(path, 0) == "first");
	REQUIRE(readEntry(path, 1) == "second");
}

TEST_CASE("ZipArchive detects corrupted member data", "[storage][zip]") {
	TempDirectory dir;
	const auto path = dir / "corrupt.zip";
	ZipArchive::createEmpty(path);
	{
		ZipAppender appender(path, readDirectory(path), Compression::Store, 0);
		appender.append("payload", "the quick brown fox");
		appender.finish();
	}

	auto bytes = tests::fixtures::readFile(path);
	const auto at = bytes.find("quick");
	REQUIRE(at != std::string::npos);
	bytes[at] = 'Q';
	tests::fixtures::writeFile(path, bytes);

	REQUIRE(readDirectory(path).entries.size() == 1);
	REQUIRE_THROWS_AS(readEntry(path, 0), CorruptArchiveError);
}

TEST_CASE("ZipArchive rejects files that are not archives", "[storage][zip]") {
	TempDirectory dir;
	const auto tiny = dir / "tiny.zip";
	tests::fixtures::writeFile(tiny, "PK");
	REQUIRE_THROWS_AS(readDirectory(tiny), CorruptArchiveError);

	const auto text = dir / "text.zip";
	tests::fixtures::writeFile(text, std::string(100, 'a'));
	REQUIRE_THROWS_AS(readDirectory(text), CorruptArchiveError);
}
