// SHARELEDGER - Compliance Gate Tests
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <shareledger/compliance/compliance.h>

using namespace shareledger;
using namespace shareledger::compliance;

// ============================================================================
// Test Fixture
// ============================================================================

class ComplianceTest : public ::testing::Test {
protected:
    void SetUp() override {
        registrar_ = CreateTestAddress(0xAA);
        params_.registrar = registrar_;
        gate_ = std::make_unique<ComplianceGate>(state_, params_);
    }

    Address CreateTestAddress(uint8_t id) {
        Address addr;
        addr[0] = id;
        addr[19] = id;
        return addr;
    }

    CallContext AsRegistrar(BlockHeight height) {
        return CallContext(registrar_, height);
    }

    Address registrar_;
    ledger::LedgerParams params_;
    ledger::LedgerState state_;
    std::unique_ptr<ComplianceGate> gate_;
};

// ============================================================================
// Predicate
// ============================================================================

TEST_F(ComplianceTest, UnknownAccountIsNotCompliant) {
    EXPECT_FALSE(gate_->IsCompliant(CreateTestAddress(1), 0, 0));
    EXPECT_FALSE(gate_->GetRecord(CreateTestAddress(1)).has_value());
}

TEST_F(ComplianceTest, LevelAndExpiryAreEnforced) {
    Address alice = CreateTestAddress(1);
    ASSERT_TRUE(gate_->SetCompliance(AsRegistrar(100), alice, true, 2, 200));

    EXPECT_TRUE(gate_->IsCompliant(alice, 0, 100));
    EXPECT_TRUE(gate_->IsCompliant(alice, 2, 150));
    EXPECT_FALSE(gate_->IsCompliant(alice, 3, 150));

    // Expiry is exclusive
    EXPECT_TRUE(gate_->IsCompliant(alice, 1, 199));
    EXPECT_FALSE(gate_->IsCompliant(alice, 1, 200));
    EXPECT_FALSE(gate_->IsCompliant(alice, 1, 5000));
}

TEST_F(ComplianceTest, UnapprovedRecordFails) {
    Address bob = CreateTestAddress(2);
    ASSERT_TRUE(gate_->SetCompliance(AsRegistrar(0), bob, false, 5, 100));
    EXPECT_FALSE(gate_->IsCompliant(bob, 0, 10));

    auto required = gate_->RequireCompliant(bob, 0, 10);
    ASSERT_FALSE(required);
    EXPECT_EQ(required.Error(), LedgerError::KycRequired);
}

// ============================================================================
// Attestation
// ============================================================================

TEST_F(ComplianceTest, SetComplianceStoresRecord) {
    Address alice = CreateTestAddress(1);
    ASSERT_TRUE(gate_->SetCompliance(AsRegistrar(40), alice, true, 3, 90));

    auto record = gate_->GetRecord(alice);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->approved);
    EXPECT_EQ(record->level, 3);
    EXPECT_EQ(record->expiresAt, 90u);
    EXPECT_EQ(record->attestedAt, 40u);
}

TEST_F(ComplianceTest, SetComplianceValidation) {
    Address alice = CreateTestAddress(1);

    auto r = gate_->SetCompliance(CallContext(alice, 0), alice, true, 1, 10);
    EXPECT_EQ(r.Error(), LedgerError::NotAuthorized);

    r = gate_->SetCompliance(AsRegistrar(0), Address(), true, 1, 10);
    EXPECT_EQ(r.Error(), LedgerError::InvalidAddress);

    r = gate_->SetCompliance(AsRegistrar(0), alice, true, ledger::MAX_KYC_LEVEL + 1, 10);
    EXPECT_EQ(r.Error(), LedgerError::InvalidKycLevel);

    r = gate_->SetCompliance(AsRegistrar(50), alice, true, 1, 50);
    EXPECT_EQ(r.Error(), LedgerError::InvalidExpiry);

    r = gate_->SetCompliance(AsRegistrar(50), alice, true, 1,
                             50 + ledger::MAX_EXPIRY_BLOCKS + 1);
    EXPECT_EQ(r.Error(), LedgerError::InvalidExpiry);

    EXPECT_TRUE(state_.compliance.empty());

    EXPECT_TRUE(gate_->SetCompliance(AsRegistrar(50), alice, true, ledger::MAX_KYC_LEVEL,
                                     50 + ledger::MAX_EXPIRY_BLOCKS));
}

TEST_F(ComplianceTest, Revoke) {
    Address alice = CreateTestAddress(1);

    EXPECT_EQ(gate_->RevokeCompliance(AsRegistrar(1), alice).Error(), LedgerError::NotFound);

    ASSERT_TRUE(gate_->SetCompliance(AsRegistrar(1), alice, true, 1, 100));
    EXPECT_EQ(gate_->RevokeCompliance(CallContext(alice, 2), alice).Error(),
              LedgerError::NotAuthorized);
    EXPECT_TRUE(gate_->IsCompliant(alice, 1, 2));

    ASSERT_TRUE(gate_->RevokeCompliance(AsRegistrar(2), alice));
    EXPECT_FALSE(gate_->IsCompliant(alice, 1, 2));
    EXPECT_EQ(gate_->GetRecord(alice)->level, 1);
}

// ============================================================================
// Gating Switch
// ============================================================================

TEST_F(ComplianceTest, CheckGateHonoursSwitch) {
    Address alice = CreateTestAddress(1);
    EXPECT_TRUE(gate_->IsGatingEnabled());
    EXPECT_EQ(gate_->CheckGate(alice, 1, 0).Error(), LedgerError::KycRequired);

    params_.complianceEnabled = false;
    EXPECT_FALSE(gate_->IsGatingEnabled());
    EXPECT_TRUE(gate_->CheckGate(alice, 1, 0));
    EXPECT_FALSE(gate_->IsCompliant(alice, 1, 0));
}
