// SHARELEDGER - Ledger Context Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/node/context.h"
#include "shareledger/db/leveldb.h"
#include "shareledger/util/config.h"

#include <map>
#include <stdexcept>

namespace shareledger {

LedgerInitOptions LedgerInitOptionsFromConfig(const util::ConfigManager& config) {
    LedgerInitOptions options;
    options.dataDir = config.GetPath(util::ConfigKeys::DATADIR, ".shareledger");
    options.inMemory = config.GetBool(util::ConfigKeys::INMEMORY, false);
    options.logLevel = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    options.logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    options.logCategories = config.GetString(util::ConfigKeys::LOGCATEGORIES, "");
    options.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    return options;
}

void RegisterLedgerConfigKeys(util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    config.RequireKey(REGISTRAR);
    for (const char* key : {DATADIR, LOGLEVEL, LOGFILE, LOGCATEGORIES, PRINTTOCONSOLE,
                            INMEMORY}) {
        config.AllowKey(key);
    }
    for (const char* key : {COMPLIANCE_ENABLED, COMPLIANCE_PROPOSE_LEVEL,
                            COMPLIANCE_VOTE_LEVEL, COMPLIANCE_HARVEST_LEVEL,
                            COMPLIANCE_TRANSFER_LEVEL}) {
        config.AllowKey(key, COMPLIANCE_SECTION);
    }
    config.AllowKey(MARKET_MAX_STALENESS, MARKET_SECTION);
}

bool InitLogging(const LedgerInitOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.ClearCategoryLevels();
    logger.SetLevel(options.logLevel);

    std::map<std::string, util::LogLevel> categoryLevels;
    std::string error;
    bool categoriesOk = util::ParseCategoryLevels(options.logCategories, categoryLevels, error);
    for (const auto& [category, level] : categoryLevels) {
        logger.SetCategoryLevel(category, level);
    }

    if (options.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = util::LogLevel::Trace;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!options.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = options.logFile;
        fileConfig.level = util::LogLevel::Trace;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_WARN(util::LogCategory::DEFAULT) << "Cannot open log file " << options.logFile;
        }
    }

    if (!categoriesOk) {
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring logcategories: " << error;
    }
    return categoriesOk;
}

bool InitializeLedger(LedgerContext& context, const util::ConfigManager& config,
                      const LedgerInitOptions& options) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing ledger...";

    for (const auto& problem : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << problem;
    }

    // ========================================================================
    // Step 1: Parameters
    // ========================================================================

    auto params = std::make_unique<ledger::LedgerParams>();
    std::string error;
    if (!ledger::LoadLedgerParams(config, *params, error)) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid configuration: " << error;
        return false;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Registrar: " << params->registrar.ToHex()
        << ", compliance gating " << (params->complianceEnabled ? "enabled" : "disabled");

    // ========================================================================
    // Step 2: Database
    // ========================================================================

    context.dataDir = options.dataDir;
    context.dbDir = options.dataDir / "ledger";

    try {
        if (options.inMemory) {
            LOG_INFO(util::LogCategory::DEFAULT) << "Using in-memory ledger database";
            context.ledgerDB = std::make_unique<db::LedgerDB>(
                std::make_unique<db::MemoryDatabase>());
        } else {
            LOG_INFO(util::LogCategory::DEFAULT) << "Opening ledger database in "
                << context.dbDir.string();
            db::Options dbOptions;
            dbOptions.create_if_missing = true;
            context.ledgerDB = std::make_unique<db::LedgerDB>(context.dbDir, dbOptions,
                                                              options.wipe);
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << e.what();
        return false;
    }

    // ========================================================================
    // Step 3: Ledger
    // ========================================================================

    context.ledger = std::make_unique<ledger::Ledger>(*params);
    context.params = std::move(params);

    if (context.ledgerDB->HasState()) {
        db::Status s = context.ledger->Load(*context.ledgerDB);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to load ledger state: "
                << s.ToString();
            context.ledger.reset();
            context.ledgerDB.reset();
            return false;
        }
    } else {
        LOG_INFO(util::LogCategory::DEFAULT) << "No stored ledger state, starting empty";
    }

    context.initialized = true;
    LOG_INFO(util::LogCategory::DEFAULT) << "Ledger ready, state root "
        << context.ledger->GetStateRoot().ToHex();
    return true;
}

bool FlushLedgerState(LedgerContext& context) {
    if (!context.ledger || !context.ledgerDB) {
        return false;
    }
    db::Status s = context.ledger->Flush(*context.ledgerDB);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to flush ledger state: "
            << s.ToString();
        return false;
    }
    return true;
}

void ShutdownLedger(LedgerContext& context) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down ledger...";

    if (context.initialized.load()) {
        FlushLedgerState(context);
    }
    context.initialized = false;

    context.ledger.reset();
    context.ledgerDB.reset();
    context.params.reset();

    util::Logger::Instance().Flush();
}

} // namespace shareledger
