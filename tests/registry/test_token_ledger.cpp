// SHARELEDGER - Token Ledger Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <shareledger/registry/token_ledger.h>

#include <limits>
#include <memory>

using namespace shareledger;
using namespace shareledger::registry;

// ============================================================================
// Test Fixture
// ============================================================================

class TokenLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registrar_ = CreateTestAddress(0xAA);
        params_.registrar = registrar_;
        compliance_ = std::make_unique<compliance::ComplianceGate>(state_, params_);
        tokens_ = std::make_unique<TokenLedger>(state_, params_, *compliance_);
    }

    Address CreateTestAddress(uint8_t id) {
        Address addr;
        addr[0] = id;
        addr[19] = id;
        return addr;
    }

    AssetId Tokenize(BlockHeight height = 1) {
        auto id = tokens_->TokenizeAsset(CallContext(registrar_, height), "ipfs://x", 5000);
        EXPECT_TRUE(id) << id.ToString();
        return *id;
    }

    void Approve(const Address& account, uint8_t level = 1) {
        ASSERT_TRUE(compliance_->SetCompliance(CallContext(registrar_, 0), account, true,
                                               level, 10000));
    }

    /// Validate and apply a transfer the way the ledger does
    VoidResult Transfer(const Address& from, const Address& to, AssetId id, Amount amount,
                        BlockHeight height = 5) {
        CallContext ctx(from, height);
        auto check = tokens_->CheckTransfer(ctx, to, id, amount);
        if (check) {
            tokens_->ApplyTransfer(from, to, id, amount);
        }
        return check;
    }

    Address registrar_;
    ledger::LedgerParams params_;
    ledger::LedgerState state_;
    std::unique_ptr<compliance::ComplianceGate> compliance_;
    std::unique_ptr<TokenLedger> tokens_;
};

// ============================================================================
// Tokenization
// ============================================================================

TEST_F(TokenLedgerTest, TokenizeMintsFullSupplyToRegistrar) {
    auto id = tokens_->TokenizeAsset(CallContext(registrar_, 7), "ipfs://x", 5000);
    ASSERT_TRUE(id);
    EXPECT_EQ(*id, 1u);
    EXPECT_EQ(tokens_->GetShareBalance(registrar_, 1), ledger::SUPPLY_PER_ASSET);
    EXPECT_EQ(tokens_->TotalSupply(1), 100000u);
    EXPECT_EQ(tokens_->GetAssetCount(), 1u);

    auto asset = tokens_->GetAssetDetails(1);
    ASSERT_TRUE(asset);
    EXPECT_EQ(asset->owner, registrar_);
    EXPECT_EQ(asset->metadataURI, "ipfs://x");
    EXPECT_EQ(asset->value, 5000u);
    EXPECT_EQ(asset->createdAt, 7u);
    EXPECT_EQ(asset->accruedRevenue, 0u);
    EXPECT_FALSE(asset->locked);
}

TEST_F(TokenLedgerTest, IdsAreSequential) {
    EXPECT_EQ(Tokenize(), 1u);
    EXPECT_EQ(Tokenize(), 2u);
    EXPECT_EQ(Tokenize(), 3u);
    EXPECT_TRUE(tokens_->AssetExists(3));
    EXPECT_FALSE(tokens_->AssetExists(4));
}

TEST_F(TokenLedgerTest, TokenizeValidation) {
    CallContext ctx(registrar_, 1);

    auto r = tokens_->TokenizeAsset(CallContext(CreateTestAddress(1), 1), "ipfs://x", 5000);
    EXPECT_EQ(r.Error(), LedgerError::NotAuthorized);

    EXPECT_EQ(tokens_->TokenizeAsset(ctx, "", 5000).Error(), LedgerError::InvalidURI);
    EXPECT_EQ(tokens_->TokenizeAsset(ctx, std::string(ledger::MAX_URI_LENGTH + 1, 'u'), 5000)
                  .Error(),
              LedgerError::InvalidURI);
    EXPECT_EQ(tokens_->TokenizeAsset(ctx, "ipfs://x", ledger::MIN_VALUE - 1).Error(),
              LedgerError::InvalidValue);
    EXPECT_EQ(tokens_->TokenizeAsset(ctx, "ipfs://x", ledger::MAX_VALUE + 1).Error(),
              LedgerError::InvalidValue);

    EXPECT_TRUE(state_.assets.empty());
    EXPECT_EQ(state_.nextAssetId, 0u);

    EXPECT_TRUE(tokens_->TokenizeAsset(ctx, std::string(ledger::MAX_URI_LENGTH, 'u'),
                                       ledger::MAX_VALUE));
    EXPECT_TRUE(tokens_->TokenizeAsset(ctx, "u", ledger::MIN_VALUE));
}

TEST_F(TokenLedgerTest, UnknownLookups) {
    EXPECT_EQ(tokens_->GetAssetDetails(9).Error(), LedgerError::NotFound);
    EXPECT_EQ(tokens_->GetShareBalance(CreateTestAddress(1), 9), 0u);
    EXPECT_TRUE(tokens_->GetHolders(9).empty());
}

// ============================================================================
// Revenue and Locking
// ============================================================================

TEST_F(TokenLedgerTest, DepositRevenue) {
    AssetId id = Tokenize();

    EXPECT_EQ(tokens_->DepositRevenue(CallContext(registrar_, 2), 99, 10).Error(),
              LedgerError::NotFound);
    EXPECT_EQ(tokens_->DepositRevenue(CallContext(CreateTestAddress(1), 2), id, 10).Error(),
              LedgerError::OwnerOnly);
    EXPECT_EQ(tokens_->DepositRevenue(CallContext(registrar_, 2), id, 0).Error(),
              LedgerError::InvalidAmount);

    ASSERT_TRUE(tokens_->DepositRevenue(CallContext(registrar_, 2), id, 10000));
    ASSERT_TRUE(tokens_->DepositRevenue(CallContext(registrar_, 3), id, 500));
    EXPECT_EQ(tokens_->GetAssetDetails(id)->accruedRevenue, 10500u);

    auto overflow = tokens_->DepositRevenue(CallContext(registrar_, 4), id,
                                            std::numeric_limits<Amount>::max());
    EXPECT_EQ(overflow.Error(), LedgerError::InvalidAmount);
    EXPECT_EQ(tokens_->GetAssetDetails(id)->accruedRevenue, 10500u);
}

TEST_F(TokenLedgerTest, LockBlocksTransfers) {
    AssetId id = Tokenize();
    Address alice = CreateTestAddress(1);
    Approve(alice);

    EXPECT_EQ(tokens_->SetAssetLocked(CallContext(alice, 2), id, true).Error(),
              LedgerError::OwnerOnly);
    ASSERT_TRUE(tokens_->SetAssetLocked(CallContext(registrar_, 2), id, true));
    EXPECT_TRUE(tokens_->GetAssetDetails(id)->locked);

    EXPECT_EQ(Transfer(registrar_, alice, id, 10).Error(), LedgerError::NotAuthorized);

    ASSERT_TRUE(tokens_->SetAssetLocked(CallContext(registrar_, 3), id, false));
    EXPECT_TRUE(Transfer(registrar_, alice, id, 10));
}

// ============================================================================
// Transfers
// ============================================================================

TEST_F(TokenLedgerTest, TransferConservesSupply) {
    AssetId id = Tokenize();
    Address alice = CreateTestAddress(1);
    Address bob = CreateTestAddress(2);
    Approve(alice);
    Approve(bob);

    ASSERT_TRUE(Transfer(registrar_, alice, id, 50000));
    ASSERT_TRUE(Transfer(alice, bob, id, 20000));
    ASSERT_TRUE(Transfer(registrar_, bob, id, 1));

    EXPECT_EQ(tokens_->GetShareBalance(registrar_, id), 49999u);
    EXPECT_EQ(tokens_->GetShareBalance(alice, id), 30000u);
    EXPECT_EQ(tokens_->GetShareBalance(bob, id), 20001u);
    EXPECT_EQ(tokens_->TotalSupply(id), ledger::SUPPLY_PER_ASSET);
    EXPECT_EQ(tokens_->GetHolders(id).size(), 3u);
}

TEST_F(TokenLedgerTest, EmptiedBalanceIsRemoved) {
    AssetId id = Tokenize();
    Address alice = CreateTestAddress(1);
    Approve(alice);

    ASSERT_TRUE(Transfer(registrar_, alice, id, ledger::SUPPLY_PER_ASSET));
    EXPECT_EQ(state_.balances.count({id, registrar_}), 0u);

    auto holders = tokens_->GetHolders(id);
    ASSERT_EQ(holders.size(), 1u);
    EXPECT_EQ(holders[0].first, alice);
    EXPECT_EQ(holders[0].second, ledger::SUPPLY_PER_ASSET);
}

TEST_F(TokenLedgerTest, TransferValidationOrder) {
    AssetId id = Tokenize();
    Address alice = CreateTestAddress(1);

    EXPECT_EQ(Transfer(registrar_, alice, 42, 10).Error(), LedgerError::NotFound);
    EXPECT_EQ(Transfer(registrar_, Address(), id, 10).Error(), LedgerError::InvalidAddress);
    EXPECT_EQ(Transfer(registrar_, registrar_, id, 10).Error(), LedgerError::InvalidAddress);
    EXPECT_EQ(Transfer(registrar_, alice, id, 0).Error(), LedgerError::InvalidAmount);
    EXPECT_EQ(Transfer(registrar_, alice, id, ledger::SUPPLY_PER_ASSET + 1).Error(),
              LedgerError::InvalidAmount);
    EXPECT_EQ(Transfer(alice, registrar_, id, 1).Error(), LedgerError::InvalidAmount);

    // Recipient has no attestation yet
    EXPECT_EQ(Transfer(registrar_, alice, id, 10).Error(), LedgerError::KycRequired);

    EXPECT_EQ(tokens_->GetShareBalance(registrar_, id), ledger::SUPPLY_PER_ASSET);
    EXPECT_EQ(tokens_->GetShareBalance(alice, id), 0u);
}

TEST_F(TokenLedgerTest, TransferLevelIsConfigurable) {
    AssetId id = Tokenize();
    Address alice = CreateTestAddress(1);
    Approve(alice, 1);

    params_.transferLevel = 2;
    EXPECT_EQ(Transfer(registrar_, alice, id, 10).Error(), LedgerError::KycRequired);

    params_.complianceEnabled = false;
    EXPECT_TRUE(Transfer(registrar_, alice, id, 10));
}
