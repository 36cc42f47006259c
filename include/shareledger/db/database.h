// SHARELEDGER - Database Abstraction Layer
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Abstract key-value store used to persist ledger tables. The LevelDB
// backend is compiled in when SHARELEDGER_USE_LEVELDB is defined; otherwise
// OpenDatabase() hands out an in-memory store.

#ifndef SHARELEDGER_DB_DATABASE_H
#define SHARELEDGER_DB_DATABASE_H

#include "shareledger/core/serialize.h"
#include "shareledger/core/types.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shareledger {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Status returned by database operations.
 */
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
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning reference to a byte range. The buffer must outlive the Slice.
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
        return size_ >= prefix.size_ &&
               std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t minLen = std::min(size_, b.size_);
        int r = minLen == 0 ? 0 : std::memcmp(data_, b.data_, minLen);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }
    bool operator<(const Slice& b) const { return compare(b) < 0; }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

/// Options for opening a database
struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    int max_open_files = 256;

    /// LRU block cache size (default 8MB, 0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 disables)
    int bloom_filter_bits = 10;
};

/// Options for read operations
struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

/// Options for write operations
struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * Ordered list of puts and deletes applied atomically by Database::Write().
 * Later operations on the same key win.
 */
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        ops_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { ops_.clear(); }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : ops_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Ordered cursor over database contents
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Abstract ordered key-value database.
 */
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

    virtual void Compact() {}
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open a database at the specified path.
 * @return Pair of (status, database); the database is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data stored at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return ss.ToString();
}

/// Decode a value; false if the bytes are truncated or malformed
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        ss >> obj;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char ASSET = 'a';       // asset id -> Asset
    constexpr char BALANCE = 'b';     // asset id, holder -> share count
    constexpr char COMPLIANCE = 'k';  // account -> ComplianceRecord
    constexpr char PROPOSAL = 'p';    // proposal id -> Proposal
    constexpr char VOTE = 'v';        // proposal id, voter -> VoteRecord
    constexpr char CLAIM = 'd';       // asset id, holder -> DividendClaim
    constexpr char PRICE = 'm';       // asset id -> MarketPrice
    constexpr char PAYOUT = 'w';      // account -> harvested revenue
    constexpr char ORACLE = 'o';      // account -> authorized flag
    constexpr char META = 'N';        // -> id counters

    /// All prefixes owned by the ledger tables
    constexpr char ALL[] = {ASSET, BALANCE, COMPLIANCE, PROPOSAL, VOTE,
                            CLAIM, PRICE, PAYOUT, ORACLE, META};
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

/// Prefix byte followed by the serialized key parts
template<typename... Parts>
std::string MakeKey(char prefix, const Parts&... parts) {
    DataStream ss;
    (ss << ... << parts);
    std::string result(1, prefix);
    result.append(ss.ToString());
    return result;
}

} // namespace db
} // namespace shareledger

#endif // SHARELEDGER_DB_DATABASE_H
