// PRICEFEED - Database Implementation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/db/database.h"
#include "pricefeed/db/leveldb.h"
#include "pricefeed/util/logging.h"

namespace pricefeed {
namespace db {

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key,
                           std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key,
                           const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// Database Factory Functions
// ============================================================================

#ifdef PRICEFEED_USE_LEVELDB

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

#endif

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef PRICEFEED_USE_LEVELDB
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    lo.compression = options.compression ?
        leveldb::kSnappyCompression : leveldb::kNoCompression;

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(db, cache.release(), filter.release(), path)};
#else
    (void)options;
    return {Status::NotSupported("built without LevelDB, cannot open " + path.string()),
            nullptr};
#endif
}

std::unique_ptr<Database> NewMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef PRICEFEED_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
#else
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace pricefeed
