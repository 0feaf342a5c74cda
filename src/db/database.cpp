// VELEDGER - Database Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/db/database.h"
#include "veledger/db/leveldb.h"
#include "veledger/util/logging.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace veledger {
namespace db {

// ============================================================================
// Status / Slice
// ============================================================================

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: name = "NotFound"; break;
        case CORRUPTION: name = "Corruption"; break;
        case NOT_SUPPORTED: name = "NotSupported"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR: name = "IOError"; break;
    }
    return message_.empty() ? std::string(name) : std::string(name) + ": " + message_;
}

int Slice::compare(const Slice& b) const {
    const size_t min_len = std::min(size_, b.size_);
    int r = min_len == 0 ? 0 : std::memcmp(data_, b.data_, min_len);
    if (r == 0) {
        if (size_ < b.size_) r = -1;
        else if (size_ > b.size_) r = +1;
    }
    return r;
}

// ============================================================================
// Backend selection
// ============================================================================

const char* BackendToString(Backend backend) {
    switch (backend) {
        case Backend::Memory: return "memory";
        case Backend::LevelDB: return "leveldb";
    }
    return "unknown";
}

std::optional<Backend> ParseBackend(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "memory") return Backend::Memory;
    if (lower == "leveldb") return Backend::LevelDB;
    return std::nullopt;
}

bool IsBackendAvailable(Backend backend) {
    if (backend == Backend::Memory) return true;
#ifdef VELEDGER_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
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

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

#ifdef VELEDGER_USE_LEVELDB

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // namespace

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDB(db_->Get(MakeReadOptions(options), leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDB(db_->Put(MakeWriteOptions(options),
                                leveldb::Slice(key.data(), key.size()),
                                leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDB(db_->Delete(MakeWriteOptions(options), leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDB(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

uint64_t LevelDBDatabase::GetDiskUsage() const {
    uint64_t size = 0;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(path_, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            size += it->file_size(ec);
        }
    }
    return size;
}

#endif // VELEDGER_USE_LEVELDB

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options,
    Backend backend)
{
    if (backend == Backend::Memory) {
        return {Status::Ok(), std::make_unique<MemoryDatabase>()};
    }

#ifdef VELEDGER_USE_LEVELDB
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    const leveldb::FilterPolicy* filter = leveldb::NewBloomFilterPolicy(10);
    lo.filter_policy = filter;

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string() << ": " << s.ToString();
        return {FromLevelDB(s), nullptr};
    }
    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter, path)};
#else
    (void)path;
    (void)options;
    return {Status::NotSupported("this build has no LevelDB support"), nullptr};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path, Backend backend) {
    if (backend == Backend::Memory) {
        return Status::Ok();
    }
#ifdef VELEDGER_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    return s.ok() ? Status::Ok() : Status::IOError(s.ToString());
#else
    (void)path;
    return Status::NotSupported("this build has no LevelDB support");
#endif
}

} // namespace db
} // namespace veledger
