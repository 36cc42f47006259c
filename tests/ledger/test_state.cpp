// SHARELEDGER - Ledger State Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "shareledger/ledger/state.h"

namespace shareledger {
namespace ledger {
namespace test {

namespace {

Address CreateTestAddress(uint8_t id) {
    Address addr;
    addr[0] = id;
    addr[19] = id;
    return addr;
}

LedgerState CreateSampleState() {
    LedgerState state;
    Asset asset;
    asset.id = 1;
    asset.owner = CreateTestAddress(1);
    asset.metadataURI = "ipfs://x";
    asset.value = 5000;
    state.assets.emplace(1, asset);
    state.balances[{1, CreateTestAddress(1)}] = 100000;
    state.nextAssetId = 1;
    return state;
}

} // namespace

// ============================================================================
// Record Serialization
// ============================================================================

TEST(LedgerRecordTest, AssetRoundTrip) {
    Asset asset;
    asset.id = 3;
    asset.owner = CreateTestAddress(4);
    asset.metadataURI = "ipfs://QmHash";
    asset.value = 123456;
    asset.locked = true;
    asset.createdAt = 10;
    asset.lastPriceUpdateAt = 11;
    asset.accruedRevenue = 500;
    asset.distributedRevenue = 200;

    DataStream ss;
    ss << asset;
    Asset out;
    ss >> out;
    EXPECT_EQ(out, asset);
    EXPECT_TRUE(ss.empty());
}

TEST(LedgerRecordTest, ProposalRoundTrip) {
    Proposal proposal;
    proposal.id = 9;
    proposal.assetId = 3;
    proposal.proposer = CreateTestAddress(5);
    proposal.title = "Sell the building";
    proposal.startHeight = 100;
    proposal.endHeight = 150;
    proposal.executed = true;
    proposal.passed = true;
    proposal.votesFor = 40000;
    proposal.votesAgainst = 100;
    proposal.minimumThreshold = 30000;

    DataStream ss;
    ss << proposal;
    Proposal out;
    ss >> out;
    EXPECT_EQ(out, proposal);
}

TEST(LedgerRecordTest, TruncatedRecordThrows) {
    ComplianceRecord record;
    record.approved = true;
    record.level = 2;
    record.expiresAt = 99;

    DataStream full;
    full << record;
    std::vector<uint8_t> bytes = full.Data();
    bytes.pop_back();

    DataStream truncated(bytes);
    ComplianceRecord out;
    EXPECT_THROW(truncated >> out, std::ios_base::failure);
}

// ============================================================================
// State Root
// ============================================================================

TEST(StateRootTest, EmptyStateHasFixedRoot) {
    LedgerState a;
    LedgerState b;
    EXPECT_EQ(ComputeStateRoot(a), ComputeStateRoot(b));
    EXPECT_FALSE(ComputeStateRoot(a).IsNull());
}

TEST(StateRootTest, IndependentOfInsertionOrder) {
    LedgerState a = CreateSampleState();
    LedgerState b = CreateSampleState();

    a.payouts[CreateTestAddress(2)] = 10;
    a.payouts[CreateTestAddress(3)] = 20;
    b.payouts[CreateTestAddress(3)] = 20;
    b.payouts[CreateTestAddress(2)] = 10;

    EXPECT_EQ(a, b);
    EXPECT_EQ(ComputeStateRoot(a), ComputeStateRoot(b));
}

TEST(StateRootTest, EveryTableContributes) {
    const LedgerState base = CreateSampleState();
    const Hash256 baseRoot = ComputeStateRoot(base);

    std::vector<LedgerState> variants(10, base);
    variants[0].assets[1].accruedRevenue = 1;
    variants[1].balances[{1, CreateTestAddress(1)}] = 99999;
    variants[2].compliance[CreateTestAddress(2)].level = 1;
    variants[3].proposals[1].title = "t";
    variants[4].votes[{1, CreateTestAddress(2)}].weight = 1;
    variants[5].claims[{1, CreateTestAddress(2)}].totalClaimed = 1;
    variants[6].prices[1].price = 1;
    variants[7].payouts[CreateTestAddress(2)] = 1;
    variants[8].oracles.insert(CreateTestAddress(2));
    variants[9].nextProposalId = 1;

    for (size_t i = 0; i < variants.size(); ++i) {
        EXPECT_NE(variants[i], base) << i;
        EXPECT_NE(ComputeStateRoot(variants[i]), baseRoot) << i;
    }
}

TEST(StateRootTest, ClearResetsEverything) {
    LedgerState state = CreateSampleState();
    state.Clear();
    EXPECT_EQ(state, LedgerState());
    EXPECT_EQ(ComputeStateRoot(state), ComputeStateRoot(LedgerState()));
}

} // namespace test
} // namespace ledger
} // namespace shareledger
