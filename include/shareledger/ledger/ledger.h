// SHARELEDGER - Ledger
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Entry point for every ledger call. Owns the state tables and the engines
// that operate on them, serializes calls, and persists and commits to the
// state.
//
// Every mutating call validates all of its preconditions before its first
// write: it either commits all of its effects or returns an error and
// leaves the state untouched.

#ifndef SHARELEDGER_LEDGER_LEDGER_H
#define SHARELEDGER_LEDGER_LEDGER_H

#include "shareledger/compliance/compliance.h"
#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/db/database.h"
#include "shareledger/dividend/dividends.h"
#include "shareledger/governance/governance.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"
#include "shareledger/market/market_data.h"
#include "shareledger/registry/token_ledger.h"

#include <mutex>
#include <string>
#include <vector>

namespace shareledger {

namespace db {
class LedgerDB;
}

namespace ledger {

class Ledger {
public:
    explicit Ledger(const LedgerParams& params);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    const LedgerParams& GetParams() const { return params_; }

    // ========================================================================
    // Token Ledger & Asset Registry
    // ========================================================================

    Result<AssetId> TokenizeAsset(const CallContext& ctx, const std::string& metadataURI,
                                  Amount value);
    Result<Asset> GetAssetDetails(AssetId assetId) const;
    Amount GetShareBalance(const Address& holder, AssetId assetId) const;
    std::vector<registry::Holding> GetHolders(AssetId assetId) const;
    Amount TotalSupply(AssetId assetId) const;
    uint64_t GetAssetCount() const;

    /**
     * Move shares from the caller to another holder. Both parties'
     * pending dividends are settled first so entitlement to revenue that
     * accrued before the transfer stays with the previous holder.
     */
    VoidResult TransferShares(const CallContext& ctx, const Address& to, AssetId assetId,
                              Amount amount);

    VoidResult DepositRevenue(const CallContext& ctx, AssetId assetId, Amount amount);
    VoidResult SetAssetLocked(const CallContext& ctx, AssetId assetId, bool locked);

    // ========================================================================
    // Compliance Gate
    // ========================================================================

    VoidResult SetCompliance(const CallContext& ctx, const Address& account, bool approved,
                             uint8_t level, BlockHeight expiresAt);
    VoidResult RevokeCompliance(const CallContext& ctx, const Address& account);
    bool IsCompliant(const Address& account, uint8_t requiredLevel, BlockHeight atHeight) const;
    VoidResult RequireCompliant(const Address& account, uint8_t requiredLevel,
                                BlockHeight atHeight) const;
    std::optional<ComplianceRecord> GetComplianceRecord(const Address& account) const;

    // ========================================================================
    // Governance
    // ========================================================================

    Result<ProposalId> InitiateProposal(const CallContext& ctx, AssetId assetId,
                                        const std::string& title, BlockHeight duration,
                                        Amount minimumThreshold);
    VoidResult CastVote(const CallContext& ctx, ProposalId proposalId, bool support,
                        Amount weight);
    Result<bool> Finalize(const CallContext& ctx, ProposalId proposalId);
    Result<Proposal> GetProposalDetails(ProposalId proposalId) const;
    Result<VoteRecord> GetVoteRecord(ProposalId proposalId, const Address& voter) const;
    Result<governance::ProposalState> GetProposalState(ProposalId proposalId,
                                                       BlockHeight height) const;
    uint64_t GetProposalCount() const;

    // ========================================================================
    // Dividends
    // ========================================================================

    Result<Amount> HarvestDividends(const CallContext& ctx, AssetId assetId);
    Amount PendingDividends(const Address& holder, AssetId assetId) const;
    DividendClaim GetLastClaim(AssetId assetId, const Address& beneficiary) const;
    Amount GetPayoutBalance(const Address& account) const;

    // ========================================================================
    // Market Data
    // ========================================================================

    VoidResult AuthorizeOracle(const CallContext& ctx, const Address& oracle);
    VoidResult SetPrice(const CallContext& ctx, AssetId assetId, uint64_t price,
                        uint8_t decimals);
    Result<MarketPrice> GetMarketPrice(AssetId assetId) const;
    Result<MarketPrice> GetValidatedPrice(AssetId assetId, BlockHeight maxStalenessBlocks,
                                          BlockHeight height) const;
    Result<uint64_t> GetHoldingValuation(const Address& holder, AssetId assetId,
                                         BlockHeight maxStalenessBlocks,
                                         BlockHeight height) const;

    // ========================================================================
    // State
    // ========================================================================

    /// SHA-256 commitment to every table
    Hash256 GetStateRoot() const;

    /// Copy of the current tables
    LedgerState GetStateSnapshot() const;

    /// Write the current state to the database
    db::Status Flush(db::LedgerDB& ledgerDB) const;

    /// Replace the current state with the stored one; on failure the
    /// current state is kept
    db::Status Load(const db::LedgerDB& ledgerDB);

private:
    const LedgerParams params_;
    LedgerState state_;

    compliance::ComplianceGate compliance_;
    registry::TokenLedger tokens_;
    dividend::DividendEngine dividends_;
    market::MarketDataCache market_;
    governance::GovernanceEngine governance_;

    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace shareledger

#endif // SHARELEDGER_LEDGER_LEDGER_H
