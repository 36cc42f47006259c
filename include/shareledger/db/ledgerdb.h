// SHARELEDGER - Ledger Database
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Persists the ledger tables in a key-value database, one key per table
// row, under the prefixes in db::prefix.

#ifndef SHARELEDGER_DB_LEDGERDB_H
#define SHARELEDGER_DB_LEDGERDB_H

#include "shareledger/db/database.h"
#include "shareledger/ledger/state.h"

#include <atomic>
#include <filesystem>
#include <memory>

namespace shareledger {
namespace db {

/// Version of the on-disk layout, stored in the meta row
constexpr uint32_t LEDGER_DB_VERSION = 2;

/**
 * Ledger state backed by a database.
 *
 * Flush() replaces the stored tables with an in-memory state in a single
 * atomic batch; Load() reads them back and checks the stored state root.
 */
class LedgerDB {
public:
    /**
     * Open or create the ledger database.
     * @throws std::runtime_error if the database cannot be opened
     */
    explicit LedgerDB(const std::filesystem::path& dbPath,
                      const Options& options = Options(),
                      bool wipe = false);

    /// Use an already open database
    explicit LedgerDB(std::unique_ptr<Database> db);

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /// Write the whole state, removing rows that no longer exist
    Status Flush(const ledger::LedgerState& state);

    /**
     * Read the stored state into an empty LedgerState.
     * @return NotFound if nothing was ever flushed, Corruption if a row
     *         fails to decode or the state root does not match
     */
    Status Load(ledger::LedgerState& state) const;

    /// True if a state has been flushed
    bool HasState() const;

    /// State root recorded by the last Flush()
    std::optional<Hash256> GetStoredStateRoot() const;

    uint64_t GetFlushCount() const { return nFlushes_.load(); }

    Database* GetDatabase() { return db_.get(); }

private:
    std::unique_ptr<Database> db_;
    std::atomic<uint64_t> nFlushes_{0};
};

} // namespace db
} // namespace shareledger

#endif // SHARELEDGER_DB_LEDGERDB_H
