// SHARELEDGER - Ledger Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/ledger/ledger.h"
#include "shareledger/db/ledgerdb.h"
#include "shareledger/util/logging.h"

namespace shareledger {
namespace ledger {

Ledger::Ledger(const LedgerParams& params)
    : params_(params)
    , compliance_(state_, params_)
    , tokens_(state_, params_, compliance_)
    , dividends_(state_, params_, tokens_, compliance_)
    , market_(state_, params_, tokens_)
    , governance_(state_, params_, tokens_, compliance_) {}

// ============================================================================
// Token Ledger & Asset Registry
// ============================================================================

Result<AssetId> Ledger::TokenizeAsset(const CallContext& ctx, const std::string& metadataURI,
                                      Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return tokens_.TokenizeAsset(ctx, metadataURI, value);
}

Result<Asset> Ledger::GetAssetDetails(AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.GetAssetDetails(assetId);
}

Amount Ledger::GetShareBalance(const Address& holder, AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.GetShareBalance(holder, assetId);
}

std::vector<registry::Holding> Ledger::GetHolders(AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.GetHolders(assetId);
}

Amount Ledger::TotalSupply(AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.TotalSupply(assetId);
}

uint64_t Ledger::GetAssetCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.GetAssetCount();
}

VoidResult Ledger::TransferShares(const CallContext& ctx, const Address& to, AssetId assetId,
                                  Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);

    auto valid = tokens_.CheckTransfer(ctx, to, assetId, amount);
    if (!valid) {
        return valid;
    }
    for (const Address& party : {ctx.caller, to}) {
        auto settle = dividends_.CheckSettle(assetId, party);
        if (!settle) {
            return settle;
        }
    }

    // Settlement only records entitlement; paying it out is gated by harvest
    dividends_.Settle(assetId, ctx.caller);
    dividends_.Settle(assetId, to);
    tokens_.ApplyTransfer(ctx.caller, to, assetId, amount);
    return VoidResult::Success({});
}

VoidResult Ledger::DepositRevenue(const CallContext& ctx, AssetId assetId, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return tokens_.DepositRevenue(ctx, assetId, amount);
}

VoidResult Ledger::SetAssetLocked(const CallContext& ctx, AssetId assetId, bool locked) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return tokens_.SetAssetLocked(ctx, assetId, locked);
}

// ============================================================================
// Compliance Gate
// ============================================================================

VoidResult Ledger::SetCompliance(const CallContext& ctx, const Address& account, bool approved,
                                 uint8_t level, BlockHeight expiresAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return compliance_.SetCompliance(ctx, account, approved, level, expiresAt);
}

VoidResult Ledger::RevokeCompliance(const CallContext& ctx, const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return compliance_.RevokeCompliance(ctx, account);
}

bool Ledger::IsCompliant(const Address& account, uint8_t requiredLevel,
                         BlockHeight atHeight) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compliance_.IsCompliant(account, requiredLevel, atHeight);
}

VoidResult Ledger::RequireCompliant(const Address& account, uint8_t requiredLevel,
                                    BlockHeight atHeight) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compliance_.RequireCompliant(account, requiredLevel, atHeight);
}

std::optional<ComplianceRecord> Ledger::GetComplianceRecord(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compliance_.GetRecord(account);
}

// ============================================================================
// Governance
// ============================================================================

Result<ProposalId> Ledger::InitiateProposal(const CallContext& ctx, AssetId assetId,
                                            const std::string& title, BlockHeight duration,
                                            Amount minimumThreshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return governance_.InitiateProposal(ctx, assetId, title, duration, minimumThreshold);
}

VoidResult Ledger::CastVote(const CallContext& ctx, ProposalId proposalId, bool support,
                            Amount weight) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return governance_.CastVote(ctx, proposalId, support, weight);
}

Result<bool> Ledger::Finalize(const CallContext& ctx, ProposalId proposalId) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return governance_.Finalize(ctx, proposalId);
}

Result<Proposal> Ledger::GetProposalDetails(ProposalId proposalId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governance_.GetProposalDetails(proposalId);
}

Result<VoteRecord> Ledger::GetVoteRecord(ProposalId proposalId, const Address& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governance_.GetVoteRecord(proposalId, voter);
}

Result<governance::ProposalState> Ledger::GetProposalState(ProposalId proposalId,
                                                           BlockHeight height) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governance_.GetProposalState(proposalId, height);
}

uint64_t Ledger::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governance_.GetProposalCount();
}

// ============================================================================
// Dividends
// ============================================================================

Result<Amount> Ledger::HarvestDividends(const CallContext& ctx, AssetId assetId) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return dividends_.HarvestDividends(ctx, assetId);
}

Amount Ledger::PendingDividends(const Address& holder, AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dividends_.PendingDividends(holder, assetId);
}

DividendClaim Ledger::GetLastClaim(AssetId assetId, const Address& beneficiary) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dividends_.GetLastClaim(assetId, beneficiary);
}

Amount Ledger::GetPayoutBalance(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dividends_.GetPayoutBalance(account);
}

// ============================================================================
// Market Data
// ============================================================================

VoidResult Ledger::AuthorizeOracle(const CallContext& ctx, const Address& oracle) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return market_.AuthorizeOracle(ctx, oracle);
}

VoidResult Ledger::SetPrice(const CallContext& ctx, AssetId assetId, uint64_t price,
                            uint8_t decimals) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::ScopedLogHeight logHeight(ctx.height);
    return market_.SetPrice(ctx, assetId, price, decimals);
}

Result<MarketPrice> Ledger::GetMarketPrice(AssetId assetId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return market_.GetMarketPrice(assetId);
}

Result<MarketPrice> Ledger::GetValidatedPrice(AssetId assetId, BlockHeight maxStalenessBlocks,
                                              BlockHeight height) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return market_.GetValidatedPrice(assetId, maxStalenessBlocks, height);
}

Result<uint64_t> Ledger::GetHoldingValuation(const Address& holder, AssetId assetId,
                                             BlockHeight maxStalenessBlocks,
                                             BlockHeight height) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return market_.GetHoldingValuation(holder, assetId, maxStalenessBlocks, height);
}

// ============================================================================
// State
// ============================================================================

Hash256 Ledger::GetStateRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ComputeStateRoot(state_);
}

LedgerState Ledger::GetStateSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

db::Status Ledger::Flush(db::LedgerDB& ledgerDB) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledgerDB.Flush(state_);
}

db::Status Ledger::Load(const db::LedgerDB& ledgerDB) {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerState loaded;
    db::Status s = ledgerDB.Load(loaded);
    if (!s.ok()) {
        return s;
    }
    state_ = std::move(loaded);
    return s;
}

} // namespace ledger
} // namespace shareledger
