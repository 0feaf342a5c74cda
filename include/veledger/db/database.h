// VELEDGER - Database Abstraction Layer
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Abstract key-value store used to persist the ledger. Backends: an
// in-memory map (always available) and LevelDB (when found at build time).

#ifndef VELEDGER_DB_DATABASE_H
#define VELEDGER_DB_DATABASE_H

#include "veledger/core/serialize.h"
#include "veledger/core/types.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace veledger {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsNotSupported() const { return code_ == NOT_SUPPORTED; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * Non-owning view of a contiguous byte range; the underlying buffer must
 * outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const;

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

/// Storage engine behind a Database
enum class Backend {
    Memory,
    LevelDB,
};

const char* BackendToString(Backend backend);

/// "memory" or "leveldb"
std::optional<Backend> ParseBackend(const std::string& name);

/// True if this build can open the given backend
bool IsBackendAvailable(Backend backend);

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Fail if the database already exists
    bool error_if_exists = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// Maximum number of open files
    int max_open_files = 64;

    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }

    size_t Count() const { return operations_.size(); }

    bool Empty() const { return operations_.empty(); }

    /// Visit operations in insertion order; a missing value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& op : operations_) {
            func(op.first, op.second);
        }
    }

    size_t ApproximateSize() const {
        size_t size = 0;
        for (const auto& op : operations_) {
            size += op.first.size();
            if (op.second) size += op.second->size();
        }
        return size;
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    virtual Backend GetBackend() const = 0;

    /// Approximate on-disk size (0 for memory)
    virtual uint64_t GetDiskUsage() const { return 0; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a database.
 * @param path     Database directory (ignored by the memory backend)
 * @param options  Open options
 * @param backend  Storage engine; NotSupported if not compiled in
 * @return Pair of (status, database pointer)
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options(),
    Backend backend = Backend::LevelDB);

/// Delete all data of an on-disk database
Status DestroyDatabase(const std::filesystem::path& path, Backend backend = Backend::LevelDB);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

/// Decode `data` into `obj`; false on truncated or trailing data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream ss(data);
    try {
        Unserialize(ss, obj);
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    // Position ledger
    constexpr char POSITION = 'p';        // id -> locked balance
    constexpr char GLOBAL_POINT = 'g';    // epoch -> point
    constexpr char SLOPE_CHANGE = 's';    // timestamp -> slope delta
    constexpr char USER_POINT = 'u';      // (id, user epoch) -> point

    // Delegation
    constexpr char DELEGATION = 'd';      // (delegate, index) -> checkpoint
    constexpr char DELEGATE = 'D';        // account -> delegatee
    constexpr char NONCE = 'N';           // signer -> next nonce

    // Position ownership
    constexpr char OWNER = 'o';           // id -> owner
    constexpr char APPROVAL = 'a';        // id -> approved address
    constexpr char OPERATOR = 'O';        // (owner, operator) -> flag
    constexpr char CREATED = 'c';         // id -> creation time
    constexpr char NON_VOTING = 'n';      // id -> flag

    // Rewards
    constexpr char CLAIM = 'r';           // id -> last claim midnight
    constexpr char EMISSION = 'e';        // (series, timestamp) -> value

    // Ledger-wide values
    constexpr char META = 'M';            // -> counters and governance settings
}

/// Prefix byte followed by raw key bytes
inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

/// Prefix byte followed by a big-endian number (keys sort numerically)
inline std::string MakeKey(char prefix, uint64_t number) {
    DataStream ss;
    ser_writebe64(ss, number);
    return MakeKey(prefix, Slice(ss.str()));
}

} // namespace db
} // namespace veledger

#endif // VELEDGER_DB_DATABASE_H
