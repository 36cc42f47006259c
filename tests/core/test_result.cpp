// SHARELEDGER - Result and Error Code Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "shareledger/core/result.h"

#include <stdexcept>

using namespace shareledger;

// ============================================================================
// Error Codes
// ============================================================================

TEST(LedgerErrorTest, StableNumbering) {
    EXPECT_EQ(LedgerErrorCode(LedgerError::OwnerOnly), 100u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::NotFound), 101u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::KycRequired), 105u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::PriceExpired), 108u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::InvalidTitle), 116u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::AlreadyExecuted), 117u);
    EXPECT_EQ(LedgerErrorCode(LedgerError::VotingActive), 118u);
}

TEST(LedgerErrorTest, NamesRoundTrip) {
    for (uint32_t code = 100; code <= 118; ++code) {
        auto err = static_cast<LedgerError>(code);
        auto parsed = ParseLedgerError(LedgerErrorToString(err));
        ASSERT_TRUE(parsed.has_value()) << code;
        EXPECT_EQ(*parsed, err);
    }
    EXPECT_FALSE(ParseLedgerError("NoSuchError").has_value());
}

TEST(LedgerErrorTest, Categories) {
    EXPECT_EQ(GetErrorCategory(LedgerError::OwnerOnly), ErrorCategory::Authorization);
    EXPECT_EQ(GetErrorCategory(LedgerError::NotAuthorized), ErrorCategory::Authorization);
    EXPECT_EQ(GetErrorCategory(LedgerError::NotFound), ErrorCategory::NotFound);
    EXPECT_EQ(GetErrorCategory(LedgerError::VoteExists), ErrorCategory::StateConflict);
    EXPECT_EQ(GetErrorCategory(LedgerError::VotingActive), ErrorCategory::StateConflict);
    EXPECT_EQ(GetErrorCategory(LedgerError::PriceExpired), ErrorCategory::StaleData);
    EXPECT_EQ(GetErrorCategory(LedgerError::KycRequired), ErrorCategory::StaleData);
    EXPECT_EQ(GetErrorCategory(LedgerError::InvalidURI), ErrorCategory::InvalidInput);
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::StaleData), "StaleData");
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, Success) {
    auto r = Result<int>::Success(42);
    EXPECT_TRUE(r.IsOk());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.Value(), 42);
    EXPECT_EQ(*r, 42);
    EXPECT_EQ(r.ToString(), "OK");
    EXPECT_THROW(r.Error(), std::logic_error);
}

TEST(ResultTest, Failure) {
    auto r = Result<int>::Failure(LedgerError::NotFound, "asset 7");
    EXPECT_FALSE(r.IsOk());
    EXPECT_EQ(r.Error(), LedgerError::NotFound);
    EXPECT_EQ(r.Message(), "asset 7");
    EXPECT_EQ(r.ToString(), "NotFound: asset 7");
    EXPECT_THROW(r.Value(), std::logic_error);
}

TEST(ResultTest, VoidResult) {
    auto ok = VoidResult::Success({});
    EXPECT_TRUE(ok.IsOk());

    auto bad = VoidResult::Failure(LedgerError::VoteEnded);
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.ToString(), "VoteEnded");
}
