// SHARELEDGER - Market Data Cache Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <shareledger/market/market_data.h>

#include <memory>

using namespace shareledger;
using namespace shareledger::market;

class MarketDataTest : public ::testing::Test {
protected:
    void SetUp() override {
        registrar_ = CreateTestAddress(0xAA);
        oracle_ = CreateTestAddress(0x0C);
        params_.registrar = registrar_;
        params_.complianceEnabled = false;

        compliance_ = std::make_unique<compliance::ComplianceGate>(state_, params_);
        tokens_ = std::make_unique<registry::TokenLedger>(state_, params_, *compliance_);
        market_ = std::make_unique<MarketDataCache>(state_, params_, *tokens_);

        auto id = tokens_->TokenizeAsset(CallContext(registrar_, 1), "ipfs://x", 5000);
        ASSERT_TRUE(id);
        assetId_ = *id;
        ASSERT_TRUE(market_->AuthorizeOracle(CallContext(registrar_, 1), oracle_));
    }

    Address CreateTestAddress(uint8_t id) {
        Address addr;
        addr[0] = id;
        addr[19] = id;
        return addr;
    }

    Address registrar_;
    Address oracle_;
    AssetId assetId_{0};
    ledger::LedgerParams params_;
    ledger::LedgerState state_;
    std::unique_ptr<compliance::ComplianceGate> compliance_;
    std::unique_ptr<registry::TokenLedger> tokens_;
    std::unique_ptr<MarketDataCache> market_;
};

// ============================================================================
// Oracles
// ============================================================================

TEST_F(MarketDataTest, AuthorizeOracle) {
    EXPECT_TRUE(market_->IsOracle(oracle_));
    EXPECT_FALSE(market_->IsOracle(registrar_));

    Address second = CreateTestAddress(0x0D);
    EXPECT_EQ(market_->AuthorizeOracle(CallContext(oracle_, 2), second).Error(),
              LedgerError::NotAuthorized);
    EXPECT_EQ(market_->AuthorizeOracle(CallContext(registrar_, 2), Address()).Error(),
              LedgerError::InvalidAddress);
    EXPECT_EQ(market_->AuthorizeOracle(CallContext(registrar_, 2), oracle_).Error(),
              LedgerError::AlreadyListed);

    ASSERT_TRUE(market_->AuthorizeOracle(CallContext(registrar_, 2), second));
    EXPECT_EQ(market_->GetOracles().size(), 2u);
}

// ============================================================================
// Prices
// ============================================================================

TEST_F(MarketDataTest, SetPriceStoresTuple) {
    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 10), assetId_, 123456, 2));

    auto price = market_->GetMarketPrice(assetId_);
    ASSERT_TRUE(price);
    EXPECT_EQ(price->price, 123456u);
    EXPECT_EQ(price->decimals, 2);
    EXPECT_EQ(price->lastUpdatedAt, 10u);
    EXPECT_EQ(price->oracle, oracle_);
    EXPECT_EQ(tokens_->GetAssetDetails(assetId_)->lastPriceUpdateAt, 10u);

    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 12), assetId_, 200, 0));
    EXPECT_EQ(market_->GetMarketPrice(assetId_)->price, 200u);
    EXPECT_EQ(market_->GetMarketPrice(assetId_)->lastUpdatedAt, 12u);
}

TEST_F(MarketDataTest, SetPriceValidation) {
    EXPECT_EQ(market_->SetPrice(CallContext(registrar_, 10), assetId_, 1, 0).Error(),
              LedgerError::NotAuthorized);
    EXPECT_EQ(market_->SetPrice(CallContext(oracle_, 10), 99, 1, 0).Error(),
              LedgerError::NotFound);
    EXPECT_EQ(market_->SetPrice(CallContext(oracle_, 10), assetId_, 0, 0).Error(),
              LedgerError::InvalidValue);
    EXPECT_EQ(market_->SetPrice(CallContext(oracle_, 10), assetId_, 1,
                                ledger::MAX_PRICE_DECIMALS + 1).Error(),
              LedgerError::InvalidValue);

    EXPECT_TRUE(state_.prices.empty());
    EXPECT_EQ(market_->GetMarketPrice(assetId_).Error(), LedgerError::NotFound);
}

TEST_F(MarketDataTest, ValidatedPriceStaleness) {
    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 100), assetId_, 500, 0));

    EXPECT_TRUE(market_->GetValidatedPrice(assetId_, 6, 100));
    EXPECT_TRUE(market_->GetValidatedPrice(assetId_, 6, 106));

    auto stale = market_->GetValidatedPrice(assetId_, 6, 107);
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.Error(), LedgerError::PriceExpired);

    EXPECT_TRUE(market_->GetValidatedPrice(assetId_, 0, 100));
    EXPECT_EQ(market_->GetValidatedPrice(assetId_, 0, 101).Error(), LedgerError::PriceExpired);

    EXPECT_EQ(market_->GetValidatedPrice(77, 6, 100).Error(), LedgerError::NotFound);
}

TEST_F(MarketDataTest, ConfiguredStalenessWindow) {
    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 100), assetId_, 500, 0));

    params_.maxStaleness = 2;
    EXPECT_TRUE(market_->GetValidatedPrice(assetId_, 102));
    EXPECT_EQ(market_->GetValidatedPrice(assetId_, 103).Error(), LedgerError::PriceExpired);
}

TEST_F(MarketDataTest, RefreshRestoresFreshness) {
    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 100), assetId_, 500, 0));
    EXPECT_FALSE(market_->GetValidatedPrice(assetId_, 6, 200));

    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 199), assetId_, 510, 0));
    auto fresh = market_->GetValidatedPrice(assetId_, 6, 200);
    ASSERT_TRUE(fresh);
    EXPECT_EQ(fresh->price, 510u);
}

// ============================================================================
// Valuation
// ============================================================================

TEST_F(MarketDataTest, HoldingValuation) {
    Address alice = CreateTestAddress(1);
    CallContext ctx(registrar_, 5);
    ASSERT_TRUE(tokens_->CheckTransfer(ctx, alice, assetId_, 25000));
    tokens_->ApplyTransfer(registrar_, alice, assetId_, 25000);

    ASSERT_TRUE(market_->SetPrice(CallContext(oracle_, 100), assetId_, 1000000, 2));

    auto value = market_->GetHoldingValuation(alice, assetId_, 6, 103);
    ASSERT_TRUE(value);
    EXPECT_EQ(*value, 250000u);

    EXPECT_EQ(*market_->GetHoldingValuation(CreateTestAddress(9), assetId_, 6, 103), 0u);
    EXPECT_EQ(market_->GetHoldingValuation(alice, assetId_, 6, 200).Error(),
              LedgerError::PriceExpired);
}
