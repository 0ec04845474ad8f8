// PRICEFEED - LevelDB Wrapper
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef PRICEFEED_DB_LEVELDB_H
#define PRICEFEED_DB_LEVELDB_H

#include "pricefeed/db/database.h"
#include <map>
#include <mutex>

#ifdef PRICEFEED_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>
#endif

namespace pricefeed {
namespace db {

#ifdef PRICEFEED_USE_LEVELDB

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    // Declaration order matters: db_ is destroyed before the cache and filter
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : cache_(cache), filter_policy_(filter), db_(db), path_(path) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return FromLevelDBStatus(db_->Get(MakeReadOptions(options),
                                          leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return FromLevelDBStatus(db_->Put(MakeWriteOptions(options),
                                          leveldb::Slice(key.data(), key.size()),
                                          leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options),
                                             leveldb::Slice(key.data(), key.size())));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }

    void Compact() override {
        db_->CompactRange(nullptr, nullptr);
    }

    std::string GetName() const override { return "leveldb:" + path_.string(); }

    std::string GetStats() const override {
        std::string stats;
        db_->GetProperty("leveldb.stats", &stats);
        return stats;
    }
};

#endif // PRICEFEED_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * In-memory database used by tests and the db=memory backend.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetName() const override { return "memory"; }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

/**
 * Iterator over a MemoryDatabase snapshot.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace pricefeed

#endif // PRICEFEED_DB_LEVELDB_H
