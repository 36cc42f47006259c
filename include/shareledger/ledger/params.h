// SHARELEDGER - Ledger Parameters Header
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Fixed protocol constants and the configurable parameters a ledger
// instance runs with.

#ifndef SHARELEDGER_LEDGER_PARAMS_H
#define SHARELEDGER_LEDGER_PARAMS_H

#include "shareledger/core/types.h"

#include <cstdint>
#include <string>

namespace shareledger {

namespace util {
class ConfigManager;
}

namespace ledger {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Shares minted for every tokenized asset; never changes afterwards
constexpr Amount SUPPLY_PER_ASSET = 100000;

/// Bounds on the declared value of an asset
constexpr Amount MIN_VALUE = 1000;
constexpr Amount MAX_VALUE = 1000000000000ULL;

/// Proposal voting window, in blocks
constexpr BlockHeight MIN_DURATION = 12;
constexpr BlockHeight MAX_DURATION = 144;

/// Highest compliance level
constexpr uint8_t MAX_KYC_LEVEL = 5;

/// Longest compliance validity window (~1 year of 10-minute blocks)
constexpr BlockHeight MAX_EXPIRY_BLOCKS = 52560;

constexpr size_t MAX_URI_LENGTH = 256;
constexpr size_t MAX_TITLE_LENGTH = 256;

/// Highest decimal exponent accepted for an oracle price
constexpr uint8_t MAX_PRICE_DECIMALS = 18;

/// A proposer must hold at least SUPPLY_PER_ASSET / this many shares (10%)
constexpr Amount PROPOSAL_OWNERSHIP_DIVISOR = 10;

/// Default freshness window for validated prices
constexpr BlockHeight DEFAULT_MAX_STALENESS = 6;

// ============================================================================
// Ledger Parameters
// ============================================================================

/// Per-instance settings, loaded from configuration
struct LedgerParams {
    /// Account allowed to tokenize assets, attest compliance and
    /// authorize oracles
    Address registrar;

    /// Whether gated operations check compliance at all
    bool complianceEnabled{true};

    /// Minimum compliance level per gated operation
    uint8_t proposeLevel{1};
    uint8_t voteLevel{1};
    uint8_t harvestLevel{1};
    uint8_t transferLevel{1};

    /// Staleness window used when a caller does not pass one
    BlockHeight maxStaleness{DEFAULT_MAX_STALENESS};

    /// Minimum balance needed to open a proposal
    static constexpr Amount ProposalThreshold() {
        return SUPPLY_PER_ASSET / PROPOSAL_OWNERSHIP_DIVISOR;
    }
};

/**
 * Read ledger parameters from configuration.
 *
 * Keys: registrar (required, 40 hex chars), [compliance] enabled,
 * proposelevel, votelevel, harvestlevel, transferlevel, [market] maxstaleness.
 *
 * @param error Set to a description of the first invalid key on failure
 * @return false if a key is missing or out of range
 */
bool LoadLedgerParams(const util::ConfigManager& config, LedgerParams& params,
                      std::string& error);

} // namespace ledger
} // namespace shareledger

#endif // SHARELEDGER_LEDGER_PARAMS_H
