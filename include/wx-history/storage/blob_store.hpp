#pragma once

#include "wx-history/storage/zip_archive.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace wxhistory::storage {

using Bytes = std::string;

/**
 * @brief Blob store options.
 */
struct StoreConfig {
	Compression compression = Compression::Deflate;
	int compression_level = -1;          // zlib default
	std::string backup_suffix = ".bck";  // appended to the archive path
	bool cache_reads = true;
};

/**
 * @brief Aggregate sizes of an archive.
 */
struct ArchiveProperties {
	std::size_t entries = 0;
	std::uint64_t entries_size = 0;
	std::uint64_t compressed_size = 0;
	std::uint64_t size = 0;
};

class BlobStore;

/**
 * @class WriteTransaction
 * @brief Exclusive, all-or-nothing sequence of writes to one archive.
 *
 * The archive is copied to its backup path when the transaction begins.
 * commit() finalizes the archive and deletes the backup; a transaction that
 * is rolled back, or destroyed without being committed, restores the archive
 * from the backup. The backup never outlives the transaction.
 */
class WriteTransaction {
public:
	WriteTransaction(WriteTransaction &&other) noexcept;
	WriteTransaction &operator=(WriteTransaction &&) = delete;
	WriteTransaction(const WriteTransaction &) = delete;
	WriteTransaction &operator=(const WriteTransaction &) = delete;

	~WriteTransaction();

	/**
	 * @brief Appends a new entry.
	 * @throws DuplicateEntryError If the key exists in the archive or was written earlier in this transaction.
	 * @throws StorageError On I/O failure.
	 */
	void write(const std::string &key, const Bytes &content);

	void commit();
	void rollback();

	bool active() const {
		return store_ != nullptr;
	}

	const std::vector<std::string> &written() const {
		return written_;
	}

private:
	friend class BlobStore;

	explicit WriteTransaction(BlobStore &store);

	void release() noexcept;

	BlobStore *store_;
	std::unique_ptr<ZipAppender> appender_;
	ZipDirectory snapshot_;
	std::vector<std::string> written_;
};

/**
 * @class BlobStore
 * @brief Append-only key to bytes storage inside a single zip archive.
 *
 * Entries are immutable once written, which is what makes the unbounded read
 * cache safe. One write transaction at a time per archive path.
 */
class BlobStore {
public:
	/**
	 * @brief Opens an archive, creating an empty one when it does not exist.
	 * @throws CorruptArchiveError If the archive is unreadable or holds duplicate names.
	 * @throws StorageError If the archive cannot be created.
	 */
	explicit BlobStore(std::filesystem::path path, StoreConfig config = {});

	BlobStore(const BlobStore &) = delete;
	BlobStore &operator=(const BlobStore &) = delete;

	const std::filesystem::path &path() const {
		return path_;
	}

	std::filesystem::path backupPath() const;

	const StoreConfig &config() const {
		return config_;
	}

	bool exists(const std::string &key) const {
		return index_.find(key) != index_.end();
	}

	/**
	 * @throws NotFoundError If the key is not in the archive.
	 */
	Bytes read(const std::string &key);

	/**
	 * @brief Every key in archive order.
	 */
	std::vector<std::string> keys() const;

	std::size_t size() const {
		return directory_.entries.size();
	}

	/**
	 * @brief Starts a write transaction from the archive as it is on disk.
	 *
	 * Members committed by other instances on the same path since this one was
	 * opened become visible before anything is written.
	 * @throws std::logic_error If a write transaction is already active on this archive.
	 * @throws StorageError If the backup cannot be made.
	 * @throws CorruptArchiveError If the archive on disk holds duplicate names.
	 */
	WriteTransaction beginWriteTransaction();

	/**
	 * @brief Runs body inside a write transaction.
	 *
	 * Commits when body returns, rolls back and rethrows when it throws.
	 */
	void transact(const std::function<void(WriteTransaction &)> &body);

	/**
	 * @brief Scans the central directory on disk.
	 * @throws std::logic_error While a write transaction is active.
	 */
	ArchiveProperties properties() const;

	void clearCache() {
		cache_.clear();
	}

	std::size_t cachedEntries() const {
		return cache_.size();
	}

private:
	friend class WriteTransaction;

	void load();
	// Re-reads the central directory from disk.
	void rescan();
	void reindex();

	std::filesystem::path path_;
	StoreConfig config_;
	ZipDirectory directory_;
	std::unordered_map<std::string, std::size_t> index_;
	std::unordered_map<std::string, Bytes> cache_;
	bool writing_ = false;
};

} // namespace wxhistory::storage
