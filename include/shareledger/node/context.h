// SHARELEDGER - Ledger Context
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Holds the components of a running ledger instance and wires them
// together: configuration, logging, the ledger database and the Ledger.

#ifndef SHARELEDGER_NODE_CONTEXT_H
#define SHARELEDGER_NODE_CONTEXT_H

#include "shareledger/db/ledgerdb.h"
#include "shareledger/ledger/ledger.h"
#include "shareledger/ledger/params.h"
#include "shareledger/util/logging.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace shareledger {

namespace util {
class ConfigManager;
}

// ============================================================================
// Initialization Options
// ============================================================================

/**
 * Options for bringing up a ledger instance.
 * Populated from the config file and command line.
 */
struct LedgerInitOptions {
    /// Data directory; the database lives in dataDir/ledger
    std::filesystem::path dataDir;

    /// Keep the database in memory instead of on disk
    bool inMemory{false};

    /// Delete any stored state before opening
    bool wipe{false};

    util::LogLevel logLevel{util::LogLevel::Info};

    /// Log file path; empty disables file logging
    std::string logFile;

    /// Per-category overrides, "category=level,..."
    std::string logCategories;

    bool printToConsole{true};
};

/// Read initialization options from configuration
LedgerInitOptions LedgerInitOptionsFromConfig(const util::ConfigManager& config);

/// Declare every key the ledger reads so Validate() reports unknown ones
void RegisterLedgerConfigKeys(util::ConfigManager& config);

// ============================================================================
// Ledger Context
// ============================================================================

struct LedgerContext {
    std::unique_ptr<ledger::LedgerParams> params;
    std::unique_ptr<db::LedgerDB> ledgerDB;
    std::unique_ptr<ledger::Ledger> ledger;

    std::filesystem::path dataDir;
    std::filesystem::path dbDir;

    std::atomic<bool> initialized{false};

    LedgerContext() = default;
    ~LedgerContext() = default;

    LedgerContext(const LedgerContext&) = delete;
    LedgerContext& operator=(const LedgerContext&) = delete;

    bool IsReady() const {
        return initialized.load() && ledger != nullptr;
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

/**
 * Configure the process logger: level, per-category levels, console and
 * file sinks.
 *
 * @return false if logCategories is malformed; the other settings are
 *         still applied
 */
bool InitLogging(const LedgerInitOptions& options);

/**
 * Bring up a ledger instance.
 *
 * 1. Validates ledger parameters from config
 * 2. Opens the ledger database (on disk or in memory)
 * 3. Creates the Ledger and loads previously flushed state
 *
 * Logging is expected to be configured already (see InitLogging).
 * Problems reported by config.Validate() are logged as warnings.
 *
 * @return false if parameters are invalid or stored state cannot be read
 */
bool InitializeLedger(LedgerContext& context, const util::ConfigManager& config,
                      const LedgerInitOptions& options);

/// Write the current ledger state to the database
bool FlushLedgerState(LedgerContext& context);

/// Flush state and release every component
void ShutdownLedger(LedgerContext& context);

} // namespace shareledger

#endif // SHARELEDGER_NODE_CONTEXT_H
