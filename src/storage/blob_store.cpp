#include "wx-history/storage/blob_store.hpp"

#include "wx-history/errors.hpp"
#include "wx-history/utils/logging.hpp"

#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace {

// Archive paths with an active write transaction anywhere in the process.
std::mutex &writerMutex() {
	static std::mutex mutex;
	return mutex;
}

std::set<std::string> &activeWriters() {
	static std::set<std::string> writers;
	return writers;
}

bool acquireWriter(const std::string &key) {
	std::lock_guard<std::mutex> lock(writerMutex());
	return activeWriters().insert(key).second;
}

void releaseWriter(const std::string &key) noexcept {
	std::lock_guard<std::mutex> lock(writerMutex());
	activeWriters().erase(key);
}

std::string writerKey(const std::filesystem::path &path) {
	std::error_code error;
	auto canonical = std::filesystem::weakly_canonical(path, error);
	if (error) {
		canonical = std::filesystem::absolute(path, error).lexically_normal();
	}
	return error ? path.lexically_normal().string() : canonical.string();
}

} // namespace

namespace wxhistory::storage {

// ---------------------------------------------------------------------------
// WriteTransaction
// ---------------------------------------------------------------------------

WriteTransaction::WriteTransaction(BlobStore &store) : store_(nullptr) {
	const auto key = writerKey(store.path());
	if (store.writing_ || !acquireWriter(key)) {
		throw std::logic_error("A write transaction is already active on '" + store.path().string() + "'.");
	}

	const auto backup = store.backupPath();
	try {
		std::error_code error;
		std::filesystem::copy_file(store.path(), backup, std::filesystem::copy_options::overwrite_existing, error);
		if (error) {
			throw StorageError("Unable to back up '" + store.path().string() + "' to '" + backup.string() +
			                   "': " + error.message());
		}
		// Another instance on the same path may have committed since this one was loaded.
		store.rescan();
		snapshot_ = store.directory_;
		appender_ = std::make_unique<ZipAppender>(store.path(), store.directory_, store.config().compression,
		                                          store.config().compression_level);
	} catch (...) {
		std::error_code ignored;
		std::filesystem::remove(backup, ignored);
		releaseWriter(key);
		throw;
	}

	store_ = &store;
	store_->writing_ = true;
	WXHISTORY_DEBUG("Write transaction started on '{}'", store.path().string());
}

WriteTransaction::WriteTransaction(WriteTransaction &&other) noexcept
    : store_(other.store_), appender_(std::move(other.appender_)), snapshot_(std::move(other.snapshot_)),
      written_(std::move(other.written_)) {
	other.store_ = nullptr;
}

WriteTransaction::~WriteTransaction() {
	if (!active()) {
		return;
	}
	const auto path = store_->path().string();
	try {
		rollback();
		WXHISTORY_WARN("Uncommitted write transaction on '{}' was rolled back", path);
	} catch (const std::exception &error) {
		WXHISTORY_CRITICAL("Yikes... unable to roll back '{}': {}", path, error.what());
		release();
	}
}

void WriteTransaction::write(const std::string &key, const Bytes &content) {
	if (!active()) {
		throw std::logic_error("The write transaction is no longer active.");
	}
	if (store_->exists(key)) {
		throw DuplicateEntryError("'" + key + "' already exists in '" + store_->path().string() + "'.");
	}
	const auto entry = appender_->append(key, content);
	store_->directory_.entries.push_back(entry);
	store_->index_.emplace(key, store_->directory_.entries.size() - 1);
	written_.push_back(key);
}

void WriteTransaction::commit() {
	if (!active()) {
		throw std::logic_error("The write transaction is no longer active.");
	}
	const auto backup = store_->backupPath();
	try {
		store_->directory_.directory_offset = appender_->finish();
		appender_.reset();
		std::error_code error;
		std::filesystem::remove(backup, error);
		if (error) {
			throw StorageError("Unable to remove backup '" + backup.string() + "': " + error.message());
		}
	} catch (...) {
		rollback();
		throw;
	}
	WXHISTORY_DEBUG("Committed {} entries to '{}'", written_.size(), store_->path().string());
	release();
}

void WriteTransaction::rollback() {
	if (!active()) {
		return;
	}
	appender_.reset();

	auto &store = *store_;
	const auto backup = store.backupPath();
	// The rename replaces the modified archive in one step, both live in the same directory.
	std::error_code error;
	std::filesystem::rename(backup, store.path(), error);

	store.directory_ = std::move(snapshot_);
	store.reindex();
	for (const auto &key : written_) {
		store.cache_.erase(key);
	}
	WXHISTORY_WARN("Rolled back {} entries written to '{}'", written_.size(), store.path().string());
	release();

	if (error) {
		throw StorageError("Unable to restore '" + store.path().string() + "' from '" + backup.string() +
		                   "': " + error.message());
	}
}

void WriteTransaction::release() noexcept {
	if (store_ == nullptr) {
		return;
	}
	store_->writing_ = false;
	releaseWriter(writerKey(store_->path()));
	store_ = nullptr;
}

// ---------------------------------------------------------------------------
// BlobStore
// ---------------------------------------------------------------------------

BlobStore::BlobStore(std::filesystem::path path, StoreConfig config)
    : path_(std::move(path)), config_(std::move(config)) {
	load();
}

std::filesystem::path BlobStore::backupPath() const {
	auto backup = path_;
	backup += config_.backup_suffix;
	return backup;
}

void BlobStore::load() {
	std::error_code error;
	if (!std::filesystem::exists(path_, error)) {
		WXHISTORY_WARN("'{}' not found, creating...", path_.string());
		ZipArchive::createEmpty(path_);
	} else if (!std::filesystem::is_regular_file(path_, error)) {
		throw StorageError("'" + path_.string() + "' is not an archive file.");
	} else if (std::filesystem::exists(backupPath(), error)) {
		WXHISTORY_WARN("Found stale backup '{}', the next write transaction replaces it", backupPath().string());
	}

	rescan();
	WXHISTORY_DEBUG("Opened '{}' with {} entries", path_.string(), directory_.entries.size());
}

void BlobStore::rescan() {
	std::ifstream input(path_, std::ios::binary);
	if (!input) {
		throw StorageError("Unable to open archive '" + path_.string() + "'.");
	}
	auto directory = ZipArchive::readDirectory(input, path_.string());

	std::unordered_map<std::string, std::size_t> index;
	for (std::size_t i = 0; i < directory.entries.size(); ++i) {
		const auto &name = directory.entries[i].name;
		if (!index.emplace(name, i).second) {
			throw CorruptArchiveError("Yikes... Found duplicate weather history '" + name + "' in '" +
			                          path_.string() + "'.");
		}
	}
	directory_ = std::move(directory);
	index_ = std::move(index);
}

void BlobStore::reindex() {
	index_.clear();
	for (std::size_t i = 0; i < directory_.entries.size(); ++i) {
		index_.emplace(directory_.entries[i].name, i);
	}
}

Bytes BlobStore::read(const std::string &key) {
	if (config_.cache_reads) {
		const auto cached = cache_.find(key);
		if (cached != cache_.end()) {
			return cached->second;
		}
	}
	const auto found = index_.find(key);
	if (found == index_.end()) {
		throw NotFoundError("Yikes... '" + key + "' was not found in '" + path_.string() + "'.");
	}

	std::ifstream input(path_, std::ios::binary);
	if (!input) {
		throw StorageError("Unable to open archive '" + path_.string() + "'.");
	}
	auto content = ZipArchive::readEntry(input, directory_.entries[found->second], path_.string());
	if (config_.cache_reads) {
		cache_.emplace(key, content);
	}
	return content;
}

std::vector<std::string> BlobStore::keys() const {
	std::vector<std::string> names;
	names.reserve(directory_.entries.size());
	for (const auto &entry : directory_.entries) {
		names.push_back(entry.name);
	}
	return names;
}

WriteTransaction BlobStore::beginWriteTransaction() {
	return WriteTransaction(*this);
}

void BlobStore::transact(const std::function<void(WriteTransaction &)> &body) {
	auto transaction = beginWriteTransaction();
	try {
		body(transaction);
	} catch (...) {
		try {
			transaction.rollback();
		} catch (const std::exception &error) {
			WXHISTORY_CRITICAL("Yikes... unable to roll back '{}': {}", path_.string(), error.what());
		}
		throw;
	}
	if (transaction.active()) {
		transaction.commit();
	}
}

ArchiveProperties BlobStore::properties() const {
	if (writing_) {
		throw std::logic_error("Archive properties are not available during a write transaction.");
	}
	std::ifstream input(path_, std::ios::binary);
	if (!input) {
		throw StorageError("Unable to open archive '" + path_.string() + "'.");
	}
	const auto directory = ZipArchive::readDirectory(input, path_.string());

	ArchiveProperties properties;
	for (const auto &entry : directory.entries) {
		properties.entries += 1;
		properties.entries_size += entry.uncompressed_size;
		properties.compressed_size += entry.compressed_size;
	}
	std::error_code error;
	properties.size = std::filesystem::file_size(path_, error);
	if (error) {
		throw StorageError("Unable to size archive '" + path_.string() + "': " + error.message());
	}
	return properties;
}

} // namespace wxhistory::storage
