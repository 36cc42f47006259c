// SHARELEDGER - Ledger Parameters Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/ledger/params.h"
#include "shareledger/util/config.h"

namespace shareledger {
namespace ledger {

namespace {

bool LoadLevel(const util::ConfigManager& config, const char* key,
               uint8_t& level, std::string& error) {
    if (!config.HasKey(key, util::ConfigKeys::COMPLIANCE_SECTION)) {
        return true;
    }
    auto value = config.TryGetUInt(key, util::ConfigKeys::COMPLIANCE_SECTION);
    if (!value || *value > MAX_KYC_LEVEL) {
        error = std::string("compliance.") + key + " must be between 0 and " +
                std::to_string(MAX_KYC_LEVEL);
        return false;
    }
    level = static_cast<uint8_t>(*value);
    return true;
}

} // namespace

bool LoadLedgerParams(const util::ConfigManager& config, LedgerParams& params,
                      std::string& error) {
    using util::ConfigKeys::COMPLIANCE_SECTION;
    using util::ConfigKeys::MARKET_SECTION;

    LedgerParams loaded;

    auto registrar = config.TryGetString(util::ConfigKeys::REGISTRAR);
    if (!registrar) {
        error = "registrar is not set";
        return false;
    }
    if (!ParseAddress(*registrar, loaded.registrar) || loaded.registrar.IsNull()) {
        error = "registrar is not a valid address: " + *registrar;
        return false;
    }

    if (config.HasKey(util::ConfigKeys::COMPLIANCE_ENABLED, COMPLIANCE_SECTION)) {
        auto enabled = config.TryGetBool(util::ConfigKeys::COMPLIANCE_ENABLED,
                                         COMPLIANCE_SECTION);
        if (!enabled) {
            error = "compliance.enabled must be a boolean";
            return false;
        }
        loaded.complianceEnabled = *enabled;
    }

    if (!LoadLevel(config, util::ConfigKeys::COMPLIANCE_PROPOSE_LEVEL, loaded.proposeLevel, error) ||
        !LoadLevel(config, util::ConfigKeys::COMPLIANCE_VOTE_LEVEL, loaded.voteLevel, error) ||
        !LoadLevel(config, util::ConfigKeys::COMPLIANCE_HARVEST_LEVEL, loaded.harvestLevel, error) ||
        !LoadLevel(config, util::ConfigKeys::COMPLIANCE_TRANSFER_LEVEL, loaded.transferLevel, error)) {
        return false;
    }

    if (config.HasKey(util::ConfigKeys::MARKET_MAX_STALENESS, MARKET_SECTION)) {
        auto staleness = config.TryGetUInt(util::ConfigKeys::MARKET_MAX_STALENESS,
                                           MARKET_SECTION);
        if (!staleness) {
            error = "market.maxstaleness must be a non-negative integer";
            return false;
        }
        loaded.maxStaleness = *staleness;
    }

    params = loaded;
    return true;
}

} // namespace ledger
} // namespace shareledger
