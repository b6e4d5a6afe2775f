#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <string>
#include <vector>

namespace wxhistory::storage {

enum class Compression {
	Store,
	Deflate
};

/**
 * @brief A member of a zip archive as recorded in its central directory.
 */
struct ZipEntry {
	std::string name;
	std::uint16_t method = 0;
	std::uint16_t flags = 0;
	std::uint16_t mod_time = 0;
	std::uint16_t mod_date = 0;
	std::uint32_t crc32 = 0;
	std::uint32_t compressed_size = 0;
	std::uint32_t uncompressed_size = 0;
	std::uint32_t local_header_offset = 0;
};

/**
 * @brief The central directory of an archive and the offset it starts at.
 *
 * New members are written at directory_offset, replacing the old directory.
 */
struct ZipDirectory {
	std::vector<ZipEntry> entries;
	std::uint32_t directory_offset = 0;
};

/**
 * @brief Reader for the zip subset the blob store writes and standard tools produce.
 *
 * Supports stored and deflated members. ZIP64, encryption and multi-disk
 * archives are reported as corrupt.
 */
class ZipArchive {
public:
	static constexpr std::size_t kMaxEntries = 0xFFFF;

	/**
	 * @brief Writes an archive without members.
	 * @throws StorageError If the file cannot be written.
	 */
	static void createEmpty(const std::filesystem::path &path);

	/**
	 * @brief Parses the end record and central directory.
	 * @throws CorruptArchiveError If the structure is invalid or unsupported.
	 */
	static ZipDirectory readDirectory(std::istream &input, const std::string &archive_name);

	/**
	 * @brief Reads and decodes one member, verifying its CRC-32.
	 * @throws CorruptArchiveError If the member cannot be decoded or its checksum does not match.
	 */
	static std::string readEntry(std::istream &input, const ZipEntry &entry, const std::string &archive_name);
};

/**
 * @class ZipAppender
 * @brief Adds members to an existing archive.
 *
 * Members are written over the old central directory. The archive is only a
 * valid zip again once finish() has rewritten the directory and end record.
 */
class ZipAppender {
public:
	ZipAppender(const std::filesystem::path &path, ZipDirectory directory, Compression compression,
	            int compression_level);

	ZipAppender(const ZipAppender &) = delete;
	ZipAppender &operator=(const ZipAppender &) = delete;

	/**
	 * @brief Compresses and writes one member.
	 * @return The central directory record of the new member.
	 * @throws StorageError On I/O or compression failure.
	 */
	ZipEntry append(const std::string &name, const std::string &content);

	/**
	 * @brief Writes the central directory and end record, then closes the file.
	 * @return The offset of the new central directory.
	 */
	std::uint32_t finish();

	const std::vector<ZipEntry> &entries() const {
		return directory_.entries;
	}

private:
	std::filesystem::path path_;
	std::fstream file_;
	ZipDirectory directory_;
	Compression compression_;
	int compression_level_;
};

} // namespace wxhistory::storage
