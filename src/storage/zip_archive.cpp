#include "wx-history/storage/zip_archive.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/utils/logging.hpp"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <istream>
#include <limits>
#include <utility>

namespace {

using wxhistory::CorruptArchiveError;
using wxhistory::StorageError;
using wxhistory::storage::ZipEntry;

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndRecordSignature = 0x06054b50;

constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndRecordSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kVersionNeeded = 20;
// Unix host, zip specification 2.0
constexpr std::uint16_t kVersionMadeBy = (3 << 8) | 20;
// -rw-r--r-- regular file
constexpr std::uint32_t kExternalAttributes = 0100644u << 16;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

void putU16(std::string &out, std::uint16_t value) {
	out.push_back(static_cast<char>(value & 0xFF));
	out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

void putU32(std::string &out, std::uint32_t value) {
	putU16(out, static_cast<std::uint16_t>(value & 0xFFFF));
	putU16(out, static_cast<std::uint16_t>((value >> 16) & 0xFFFF));
}

std::uint16_t getU16(const std::string &in, std::size_t offset) {
	return static_cast<std::uint16_t>(static_cast<unsigned char>(in[offset]) |
	                                  (static_cast<unsigned char>(in[offset + 1]) << 8));
}

std::uint32_t getU32(const std::string &in, std::size_t offset) {
	return static_cast<std::uint32_t>(getU16(in, offset)) |
	       (static_cast<std::uint32_t>(getU16(in, offset + 2)) << 16);
}

std::string readBytes(std::istream &input, std::uint64_t offset, std::size_t count, const std::string &archive_name,
                      const char *what) {
	std::string buffer(count, '\0');
	input.clear();
	input.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
	if (count > 0) {
		input.read(&buffer[0], static_cast<std::streamsize>(count));
	}
	if (!input || (count > 0 && static_cast<std::size_t>(input.gcount()) != count)) {
		throw CorruptArchiveError("Truncated " + std::string(what) + " in '" + archive_name + "'.");
	}
	return buffer;
}

bool safeLocalTime(std::time_t time_value, std::tm &out) {
#if defined(_WIN32)
	return localtime_s(&out, &time_value) == 0;
#else
	return localtime_r(&time_value, &out) != nullptr;
#endif
}

// MS-DOS date and time, the resolution zip records modification stamps in.
std::pair<std::uint16_t, std::uint16_t> dosTimestamp() {
	std::tm tm{};
	if (!safeLocalTime(std::time(nullptr), tm) || tm.tm_year < 80) {
		// 1980-01-01 00:00:00, the earliest DOS date
		return {0, static_cast<std::uint16_t>((1 << 5) | 1)};
	}
	const auto time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
	const auto date = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
	return {time, date};
}

std::uint32_t checksum(const std::string &content) {
	return static_cast<std::uint32_t>(
	    crc32(0L, reinterpret_cast<const Bytef *>(content.data()), static_cast<uInt>(content.size())));
}

std::string deflateRaw(const std::string &content, int level) {
	z_stream stream{};
	if (deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
		throw StorageError("Unable to initialize deflate compression.");
	}
	std::string compressed(deflateBound(&stream, static_cast<uLong>(content.size())), '\0');
	stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(content.data()));
	stream.avail_in = static_cast<uInt>(content.size());
	stream.next_out = reinterpret_cast<Bytef *>(&compressed[0]);
	stream.avail_out = static_cast<uInt>(compressed.size());
	const int status = deflate(&stream, Z_FINISH);
	const auto produced = stream.total_out;
	deflateEnd(&stream);
	if (status != Z_STREAM_END) {
		throw StorageError("Deflate compression failed with status " + std::to_string(status) + ".");
	}
	compressed.resize(produced);
	return compressed;
}

std::string inflateRaw(const std::string &compressed, std::size_t expected_size, const std::string &entry_name) {
	z_stream stream{};
	if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
		throw StorageError("Unable to initialize deflate decompression.");
	}
	std::string content(expected_size, '\0');
	// zlib wants a writable output buffer even for empty members
	char empty_output = 0;
	stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	stream.avail_in = static_cast<uInt>(compressed.size());
	stream.next_out = reinterpret_cast<Bytef *>(expected_size > 0 ? &content[0] : &empty_output);
	stream.avail_out = static_cast<uInt>(expected_size > 0 ? expected_size : 1);
	const int status = inflate(&stream, Z_FINISH);
	const auto produced = stream.total_out;
	inflateEnd(&stream);
	if (status != Z_STREAM_END || produced != expected_size) {
		throw CorruptArchiveError("Unable to inflate '" + entry_name + "' (zlib status " + std::to_string(status) +
		                          ").");
	}
	return content;
}

std::string localHeader(const ZipEntry &entry) {
	std::string header;
	header.reserve(kLocalHeaderSize + entry.name.size());
	putU32(header, kLocalHeaderSignature);
	putU16(header, kVersionNeeded);
	putU16(header, entry.flags);
	putU16(header, entry.method);
	putU16(header, entry.mod_time);
	putU16(header, entry.mod_date);
	putU32(header, entry.crc32);
	putU32(header, entry.compressed_size);
	putU32(header, entry.uncompressed_size);
	putU16(header, static_cast<std::uint16_t>(entry.name.size()));
	putU16(header, 0);
	header += entry.name;
	return header;
}

std::string centralHeader(const ZipEntry &entry) {
	std::string header;
	header.reserve(kCentralHeaderSize + entry.name.size());
	putU32(header, kCentralHeaderSignature);
	putU16(header, kVersionMadeBy);
	putU16(header, kVersionNeeded);
	putU16(header, entry.flags);
	putU16(header, entry.method);
	putU16(header, entry.mod_time);
	putU16(header, entry.mod_date);
	putU32(header, entry.crc32);
	putU32(header, entry.compressed_size);
	putU32(header, entry.uncompressed_size);
	putU16(header, static_cast<std::uint16_t>(entry.name.size()));
	putU16(header, 0); // extra field
	putU16(header, 0); // comment
	putU16(header, 0); // disk number
	putU16(header, 0); // internal attributes
	putU32(header, kExternalAttributes);
	putU32(header, entry.local_header_offset);
	header += entry.name;
	return header;
}

std::string endRecord(std::size_t entries, std::uint32_t directory_size, std::uint32_t directory_offset) {
	std::string record;
	record.reserve(kEndRecordSize);
	putU32(record, kEndRecordSignature);
	putU16(record, 0);
	putU16(record, 0);
	putU16(record, static_cast<std::uint16_t>(entries));
	putU16(record, static_cast<std::uint16_t>(entries));
	putU32(record, directory_size);
	putU32(record, directory_offset);
	putU16(record, 0);
	return record;
}

} // namespace

namespace wxhistory::storage {

void ZipArchive::createEmpty(const std::filesystem::path &path) {
	std::ofstream output(path, std::ios::binary | std::ios::trunc);
	if (!output) {
		throw StorageError("Unable to create archive '" + path.string() + "'.");
	}
	const auto record = endRecord(0, 0, 0);
	output.write(record.data(), static_cast<std::streamsize>(record.size()));
	output.close();
	if (!output) {
		throw StorageError("Unable to write archive '" + path.string() + "'.");
	}
}

ZipDirectory ZipArchive::readDirectory(std::istream &input, const std::string &archive_name) {
	input.clear();
	input.seekg(0, std::ios::end);
	const auto end_position = input.tellg();
	if (end_position < 0) {
		throw CorruptArchiveError("Unable to determine the size of '" + archive_name + "'.");
	}
	const auto file_size = static_cast<std::uint64_t>(end_position);
	if (file_size < kEndRecordSize) {
		throw CorruptArchiveError("'" + archive_name + "' is too small to be a zip archive.");
	}

	// The end record sits at the very end, followed only by an optional comment.
	const auto tail_size = static_cast<std::size_t>(
	    std::min<std::uint64_t>(file_size, kEndRecordSize + kMaxCommentSize));
	const auto tail = readBytes(input, file_size - tail_size, tail_size, archive_name, "end record");
	std::size_t record_at = std::string::npos;
	for (std::size_t pos = tail_size - kEndRecordSize + 1; pos-- > 0;) {
		if (getU32(tail, pos) == kEndRecordSignature &&
		    pos + kEndRecordSize + getU16(tail, pos + 20) == tail_size) {
			record_at = pos;
			break;
		}
	}
	if (record_at == std::string::npos) {
		throw CorruptArchiveError("'" + archive_name + "' has no zip end of central directory record.");
	}

	const auto disk = getU16(tail, record_at + 4);
	const auto directory_disk = getU16(tail, record_at + 6);
	const auto disk_entries = getU16(tail, record_at + 8);
	const auto total_entries = getU16(tail, record_at + 10);
	const auto directory_size = getU32(tail, record_at + 12);
	const auto directory_offset = getU32(tail, record_at + 16);
	if (disk != 0 || directory_disk != 0 || disk_entries != total_entries) {
		throw CorruptArchiveError("'" + archive_name + "' is a multi-disk archive, which is not supported.");
	}
	if (total_entries == 0xFFFF || directory_size == 0xFFFFFFFF || directory_offset == 0xFFFFFFFF) {
		throw CorruptArchiveError("'" + archive_name + "' is a ZIP64 archive, which is not supported.");
	}
	const std::uint64_t record_offset = file_size - tail_size + record_at;
	if (static_cast<std::uint64_t>(directory_offset) + directory_size > record_offset) {
		throw CorruptArchiveError("'" + archive_name + "' has a central directory outside of the file.");
	}

	ZipDirectory directory;
	directory.directory_offset = directory_offset;
	directory.entries.reserve(total_entries);
	const auto records = readBytes(input, directory_offset, directory_size, archive_name, "central directory");
	std::size_t pos = 0;
	for (std::size_t i = 0; i < total_entries; ++i) {
		if (pos + kCentralHeaderSize > records.size() || getU32(records, pos) != kCentralHeaderSignature) {
			throw CorruptArchiveError("'" + archive_name + "' has an invalid central directory record " +
			                          std::to_string(i) + ".");
		}
		ZipEntry entry;
		entry.flags = getU16(records, pos + 8);
		entry.method = getU16(records, pos + 10);
		entry.mod_time = getU16(records, pos + 12);
		entry.mod_date = getU16(records, pos + 14);
		entry.crc32 = getU32(records, pos + 16);
		entry.compressed_size = getU32(records, pos + 20);
		entry.uncompressed_size = getU32(records, pos + 24);
		const auto name_length = getU16(records, pos + 28);
		const auto extra_length = getU16(records, pos + 30);
		const auto comment_length = getU16(records, pos + 32);
		entry.local_header_offset = getU32(records, pos + 42);
		const std::size_t record_size = kCentralHeaderSize + name_length + extra_length + comment_length;
		if (pos + record_size > records.size()) {
			throw CorruptArchiveError("'" + archive_name + "' has a truncated central directory record " +
			                          std::to_string(i) + ".");
		}
		entry.name = records.substr(pos + kCentralHeaderSize, name_length);
		directory.entries.push_back(std::move(entry));
		pos += record_size;
	}
	return directory;
}

std::string ZipArchive::readEntry(std::istream &input, const ZipEntry &entry, const std::string &archive_name) {
	if (entry.flags & kFlagEncrypted) {
		throw CorruptArchiveError("'" + entry.name + "' in '" + archive_name + "' is encrypted.");
	}
	const auto header = readBytes(input, entry.local_header_offset, kLocalHeaderSize, archive_name, "local header");
	if (getU32(header, 0) != kLocalHeaderSignature) {
		throw CorruptArchiveError("'" + entry.name + "' in '" + archive_name + "' has an invalid local header.");
	}
	const std::uint64_t data_offset = static_cast<std::uint64_t>(entry.local_header_offset) + kLocalHeaderSize +
	                                  getU16(header, 26) + getU16(header, 28);
	const auto data = readBytes(input, data_offset, entry.compressed_size, archive_name, "member data");

	std::string content;
	switch (entry.method) {
	case kMethodStored:
		content = data;
		break;
	case kMethodDeflated:
		content = inflateRaw(data, entry.uncompressed_size, entry.name);
		break;
	default:
		throw CorruptArchiveError("'" + entry.name + "' in '" + archive_name + "' uses unsupported compression " +
		                          std::to_string(entry.method) + ".");
	}
	if (content.size() != entry.uncompressed_size || checksum(content) != entry.crc32) {
		throw CorruptArchiveError("CRC-32 mismatch reading '" + entry.name + "' from '" + archive_name + "'.");
	}
	return content;
}

ZipAppender::ZipAppender(const std::filesystem::path &path, ZipDirectory directory, Compression compression,
                         int compression_level)
    : path_(path), directory_(std::move(directory)), compression_(compression),
      compression_level_(compression_level) {
	file_.open(path_, std::ios::binary | std::ios::in | std::ios::out);
	if (!file_) {
		throw StorageError("Unable to open archive '" + path_.string() + "' for writing.");
	}
}

ZipEntry ZipAppender::append(const std::string &name, const std::string &content) {
	if (!file_.is_open()) {
		throw StorageError("Archive '" + path_.string() + "' is already finished.");
	}
	if (directory_.entries.size() >= ZipArchive::kMaxEntries) {
		throw StorageError("Archive '" + path_.string() + "' cannot hold more than " +
		                   std::to_string(ZipArchive::kMaxEntries) + " members.");
	}
	if (name.empty() || name.size() > std::numeric_limits<std::uint16_t>::max()) {
		throw StorageError("Invalid archive member name '" + name + "'.");
	}
	if (content.size() > std::numeric_limits<std::uint32_t>::max()) {
		throw StorageError("Archive member '" + name + "' is too large.");
	}

	ZipEntry entry;
	entry.name = name;
	const auto stamp = dosTimestamp();
	entry.mod_time = stamp.first;
	entry.mod_date = stamp.second;
	entry.crc32 = checksum(content);
	entry.uncompressed_size = static_cast<std::uint32_t>(content.size());

	std::string data;
	if (compression_ == Compression::Deflate) {
		entry.method = kMethodDeflated;
		data = deflateRaw(content, compression_level_);
	} else {
		entry.method = kMethodStored;
		data = content;
	}
	entry.compressed_size = static_cast<std::uint32_t>(data.size());
	entry.local_header_offset = directory_.directory_offset;

	const auto header = localHeader(entry);
	const std::uint64_t next_offset =
	    static_cast<std::uint64_t>(entry.local_header_offset) + header.size() + data.size();
	if (next_offset >= std::numeric_limits<std::uint32_t>::max()) {
		throw StorageError("Archive '" + path_.string() + "' would exceed the 4GB zip limit.");
	}

	file_.seekp(static_cast<std::streamoff>(entry.local_header_offset), std::ios::beg);
	file_.write(header.data(), static_cast<std::streamsize>(header.size()));
	file_.write(data.data(), static_cast<std::streamsize>(data.size()));
	file_.flush();
	if (!file_) {
		throw StorageError("Unable to write '" + name + "' to archive '" + path_.string() + "'.");
	}

	directory_.directory_offset = static_cast<std::uint32_t>(next_offset);
	directory_.entries.push_back(entry);
	return entry;
}

std::uint32_t ZipAppender::finish() {
	if (!file_.is_open()) {
		throw StorageError("Archive '" + path_.string() + "' is already finished.");
	}
	std::string directory;
	for (const auto &entry : directory_.entries) {
		directory += centralHeader(entry);
	}
	const auto record =
	    endRecord(directory_.entries.size(), static_cast<std::uint32_t>(directory.size()), directory_.directory_offset);

	file_.seekp(static_cast<std::streamoff>(directory_.directory_offset), std::ios::beg);
	file_.write(directory.data(), static_cast<std::streamsize>(directory.size()));
	file_.write(record.data(), static_cast<std::streamsize>(record.size()));
	file_.flush();
	const bool written = static_cast<bool>(file_);
	file_.close();
	if (!written || file_.fail()) {
		throw StorageError("Unable to write the central directory of '" + path_.string() + "'.");
	}

	// Appending never shrinks an archive, this only guards against stale bytes.
	const std::uint64_t final_size =
	    static_cast<std::uint64_t>(directory_.directory_offset) + directory.size() + record.size();
	std::error_code error;
	if (std::filesystem::file_size(path_, error) != final_size && !error) {
		std::filesystem::resize_file(path_, final_size, error);
	}
	if (error) {
		throw StorageError("Unable to size archive '" + path_.string() + "': " + error.message());
	}
	WXHISTORY_TRACE("'{}' central directory written with {} members", path_.string(), directory_.entries.size());
	return directory_.directory_offset;
}

} // namespace wxhistory::storage
