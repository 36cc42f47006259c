// SHARELEDGER - Ledger State Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/ledger/state.h"
#include "shareledger/crypto/sha256.h"

namespace shareledger {
namespace ledger {

// ============================================================================
// Record Comparison
// ============================================================================

bool Asset::operator==(const Asset& other) const {
    return id == other.id &&
           owner == other.owner &&
           metadataURI == other.metadataURI &&
           value == other.value &&
           locked == other.locked &&
           createdAt == other.createdAt &&
           lastPriceUpdateAt == other.lastPriceUpdateAt &&
           accruedRevenue == other.accruedRevenue &&
           distributedRevenue == other.distributedRevenue;
}

bool ComplianceRecord::operator==(const ComplianceRecord& other) const {
    return approved == other.approved && level == other.level &&
           expiresAt == other.expiresAt && attestedAt == other.attestedAt;
}

bool Proposal::operator==(const Proposal& other) const {
    return id == other.id &&
           assetId == other.assetId &&
           proposer == other.proposer &&
           title == other.title &&
           startHeight == other.startHeight &&
           endHeight == other.endHeight &&
           executed == other.executed &&
           passed == other.passed &&
           votesFor == other.votesFor &&
           votesAgainst == other.votesAgainst &&
           minimumThreshold == other.minimumThreshold;
}

bool VoteRecord::operator==(const VoteRecord& other) const {
    return weight == other.weight && support == other.support && castAt == other.castAt;
}

bool DividendClaim::operator==(const DividendClaim& other) const {
    return lastClaimedAccrual == other.lastClaimedAccrual && owed == other.owed &&
           totalClaimed == other.totalClaimed &&
           lastClaimHeight == other.lastClaimHeight;
}

bool MarketPrice::operator==(const MarketPrice& other) const {
    return price == other.price && decimals == other.decimals &&
           lastUpdatedAt == other.lastUpdatedAt && oracle == other.oracle;
}

// ============================================================================
// Record Serialization
// ============================================================================

void Serialize(DataStream& s, const Asset& asset) {
    s << asset.id << asset.owner << asset.metadataURI << asset.value << asset.locked
      << asset.createdAt << asset.lastPriceUpdateAt << asset.accruedRevenue
      << asset.distributedRevenue;
}

void Unserialize(DataStream& s, Asset& asset) {
    s >> asset.id >> asset.owner >> asset.metadataURI >> asset.value >> asset.locked
      >> asset.createdAt >> asset.lastPriceUpdateAt >> asset.accruedRevenue
      >> asset.distributedRevenue;
}

void Serialize(DataStream& s, const ComplianceRecord& record) {
    s << record.approved << record.level << record.expiresAt << record.attestedAt;
}

void Unserialize(DataStream& s, ComplianceRecord& record) {
    s >> record.approved >> record.level >> record.expiresAt >> record.attestedAt;
}

void Serialize(DataStream& s, const Proposal& proposal) {
    s << proposal.id << proposal.assetId << proposal.proposer << proposal.title
      << proposal.startHeight << proposal.endHeight << proposal.executed << proposal.passed
      << proposal.votesFor << proposal.votesAgainst << proposal.minimumThreshold;
}

void Unserialize(DataStream& s, Proposal& proposal) {
    s >> proposal.id >> proposal.assetId >> proposal.proposer >> proposal.title
      >> proposal.startHeight >> proposal.endHeight >> proposal.executed >> proposal.passed
      >> proposal.votesFor >> proposal.votesAgainst >> proposal.minimumThreshold;
}

void Serialize(DataStream& s, const VoteRecord& vote) {
    s << vote.weight << vote.support << vote.castAt;
}

void Unserialize(DataStream& s, VoteRecord& vote) {
    s >> vote.weight >> vote.support >> vote.castAt;
}

void Serialize(DataStream& s, const DividendClaim& claim) {
    s << claim.lastClaimedAccrual << claim.owed << claim.totalClaimed << claim.lastClaimHeight;
}

void Unserialize(DataStream& s, DividendClaim& claim) {
    s >> claim.lastClaimedAccrual >> claim.owed >> claim.totalClaimed >> claim.lastClaimHeight;
}

void Serialize(DataStream& s, const MarketPrice& price) {
    s << price.price << price.decimals << price.lastUpdatedAt << price.oracle;
}

void Unserialize(DataStream& s, MarketPrice& price) {
    s >> price.price >> price.decimals >> price.lastUpdatedAt >> price.oracle;
}

// ============================================================================
// Ledger State
// ============================================================================

void LedgerState::Clear() {
    assets.clear();
    balances.clear();
    compliance.clear();
    proposals.clear();
    votes.clear();
    claims.clear();
    prices.clear();
    payouts.clear();
    oracles.clear();
    nextAssetId = 0;
    nextProposalId = 0;
}

bool LedgerState::operator==(const LedgerState& other) const {
    return assets == other.assets &&
           balances == other.balances &&
           compliance == other.compliance &&
           proposals == other.proposals &&
           votes == other.votes &&
           claims == other.claims &&
           prices == other.prices &&
           payouts == other.payouts &&
           oracles == other.oracles &&
           nextAssetId == other.nextAssetId &&
           nextProposalId == other.nextProposalId;
}

void Serialize(DataStream& s, const LedgerState& state) {
    s << state.nextAssetId << state.nextProposalId;

    WriteCompactSize(s, state.assets.size());
    for (const auto& [id, asset] : state.assets) {
        s << id << asset;
    }

    WriteCompactSize(s, state.balances.size());
    for (const auto& [key, amount] : state.balances) {
        s << key.first << key.second << amount;
    }

    WriteCompactSize(s, state.compliance.size());
    for (const auto& [account, record] : state.compliance) {
        s << account << record;
    }

    WriteCompactSize(s, state.proposals.size());
    for (const auto& [id, proposal] : state.proposals) {
        s << id << proposal;
    }

    WriteCompactSize(s, state.votes.size());
    for (const auto& [key, vote] : state.votes) {
        s << key.first << key.second << vote;
    }

    WriteCompactSize(s, state.claims.size());
    for (const auto& [key, claim] : state.claims) {
        s << key.first << key.second << claim;
    }

    WriteCompactSize(s, state.prices.size());
    for (const auto& [id, price] : state.prices) {
        s << id << price;
    }

    WriteCompactSize(s, state.payouts.size());
    for (const auto& [account, amount] : state.payouts) {
        s << account << amount;
    }

    WriteCompactSize(s, state.oracles.size());
    for (const auto& oracle : state.oracles) {
        s << oracle;
    }
}

Hash256 ComputeStateRoot(const LedgerState& state) {
    DataStream ss;
    Serialize(ss, state);
    return SHA256Hash(ss.Data());
}

} // namespace ledger
} // namespace shareledger
