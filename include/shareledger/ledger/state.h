// SHARELEDGER - Ledger State Header
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Records and keyed tables shared by the ledger engines. All tables are
// ordered maps so iteration, serialization and the state root are
// deterministic across replicas.

#ifndef SHARELEDGER_LEDGER_STATE_H
#define SHARELEDGER_LEDGER_STATE_H

#include "shareledger/core/serialize.h"
#include "shareledger/core/types.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace shareledger {
namespace ledger {

// ============================================================================
// Call Context
// ============================================================================

/// Identity and block height of the call being executed, supplied by the
/// execution environment
struct CallContext {
    Address caller;
    BlockHeight height{0};

    CallContext() = default;
    CallContext(const Address& callerIn, BlockHeight heightIn)
        : caller(callerIn), height(heightIn) {}
};

// ============================================================================
// Records
// ============================================================================

/// A tokenized asset
struct Asset {
    AssetId id{0};
    Address owner;
    std::string metadataURI;
    Amount value{0};
    bool locked{false};
    BlockHeight createdAt{0};

    /// Height of the last oracle price (0 = never priced)
    BlockHeight lastPriceUpdateAt{0};

    /// Total revenue ever deposited; never decreases
    Amount accruedRevenue{0};

    /// Total revenue paid out to holders; never exceeds accruedRevenue
    Amount distributedRevenue{0};

    bool operator==(const Asset& other) const;
    bool operator!=(const Asset& other) const { return !(*this == other); }
};

/// Attestation for one account
struct ComplianceRecord {
    bool approved{false};
    uint8_t level{0};

    /// First height at which the record is no longer valid
    BlockHeight expiresAt{0};
    BlockHeight attestedAt{0};

    bool operator==(const ComplianceRecord& other) const;
};

/// Governance proposal against one asset
struct Proposal {
    ProposalId id{0};
    AssetId assetId{0};
    Address proposer;
    std::string title;
    BlockHeight startHeight{0};
    BlockHeight endHeight{0};
    bool executed{false};

    /// Outcome; meaningful only once executed
    bool passed{false};

    Amount votesFor{0};
    Amount votesAgainst{0};
    Amount minimumThreshold{0};

    bool operator==(const Proposal& other) const;
};

/// A cast vote; created once, never updated
struct VoteRecord {
    Amount weight{0};
    bool support{false};
    BlockHeight castAt{0};

    bool operator==(const VoteRecord& other) const;
};

/// Dividend high-water mark of one holder for one asset
struct DividendClaim {
    /// Asset accrual already accounted for this holder
    Amount lastClaimedAccrual{0};

    /// Entitlement settled by share transfers, paid by the next harvest
    Amount owed{0};

    Amount totalClaimed{0};
    BlockHeight lastClaimHeight{0};

    bool operator==(const DividendClaim& other) const;
};

/// Oracle-reported price of an asset (price * 10^-decimals)
struct MarketPrice {
    uint64_t price{0};
    uint8_t decimals{0};
    BlockHeight lastUpdatedAt{0};
    Address oracle;

    bool operator==(const MarketPrice& other) const;
};

// ============================================================================
// Record Serialization
// ============================================================================

void Serialize(DataStream& s, const Asset& asset);
void Unserialize(DataStream& s, Asset& asset);
void Serialize(DataStream& s, const ComplianceRecord& record);
void Unserialize(DataStream& s, ComplianceRecord& record);
void Serialize(DataStream& s, const Proposal& proposal);
void Unserialize(DataStream& s, Proposal& proposal);
void Serialize(DataStream& s, const VoteRecord& vote);
void Unserialize(DataStream& s, VoteRecord& vote);
void Serialize(DataStream& s, const DividendClaim& claim);
void Unserialize(DataStream& s, DividendClaim& claim);
void Serialize(DataStream& s, const MarketPrice& price);
void Unserialize(DataStream& s, MarketPrice& price);

// ============================================================================
// Ledger State
// ============================================================================

/// (asset, holder) key for balances and dividend claims
using HolderKey = std::pair<AssetId, Address>;

/// (proposal, voter) key for vote records
using VoteKey = std::pair<ProposalId, Address>;

/**
 * Every persisted table of the ledger. Engines read and write it directly;
 * the Ledger facade serializes access.
 */
struct LedgerState {
    std::map<AssetId, Asset> assets;
    std::map<HolderKey, Amount> balances;
    std::map<Address, ComplianceRecord> compliance;
    std::map<ProposalId, Proposal> proposals;
    std::map<VoteKey, VoteRecord> votes;
    std::map<HolderKey, DividendClaim> claims;
    std::map<AssetId, MarketPrice> prices;
    std::map<Address, Amount> payouts;
    std::set<Address> oracles;

    /// Last allocated ids (0 at genesis, first allocation is 1)
    uint64_t nextAssetId{0};
    uint64_t nextProposalId{0};

    void Clear();

    bool operator==(const LedgerState& other) const;
    bool operator!=(const LedgerState& other) const { return !(*this == other); }
};

/// Canonical encoding of every table in key order
void Serialize(DataStream& s, const LedgerState& state);

/// SHA-256 of the canonical encoding
Hash256 ComputeStateRoot(const LedgerState& state);

} // namespace ledger
} // namespace shareledger

#endif // SHARELEDGER_LEDGER_STATE_H
