// SHARELEDGER - Compliance Gate Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/compliance/compliance.h"
#include "shareledger/util/logging.h"

namespace shareledger {
namespace compliance {

namespace {

VoidResult Reject(LedgerError error, const std::string& message) {
    LOG_DEBUG(util::LogCategory::COMPLIANCE) << "Rejected: "
        << LedgerErrorToString(error) << " (" << message << ")";
    return VoidResult::Failure(error, message);
}

} // namespace

ComplianceGate::ComplianceGate(ledger::LedgerState& state,
                               const ledger::LedgerParams& params)
    : state_(state), params_(params) {}

bool ComplianceGate::IsCompliant(const Address& account, uint8_t requiredLevel,
                                 BlockHeight atHeight) const {
    auto it = state_.compliance.find(account);
    if (it == state_.compliance.end()) {
        return false;
    }
    const ComplianceRecord& record = it->second;
    return record.approved && record.level >= requiredLevel && atHeight < record.expiresAt;
}

VoidResult ComplianceGate::RequireCompliant(const Address& account, uint8_t requiredLevel,
                                            BlockHeight atHeight) const {
    if (!IsCompliant(account, requiredLevel, atHeight)) {
        return Reject(LedgerError::KycRequired,
                      account.ToHex() + " is not compliant at level " +
                      std::to_string(requiredLevel));
    }
    return VoidResult::Success({});
}

VoidResult ComplianceGate::CheckGate(const Address& account, uint8_t requiredLevel,
                                     BlockHeight atHeight) const {
    if (!params_.complianceEnabled) {
        return VoidResult::Success({});
    }
    return RequireCompliant(account, requiredLevel, atHeight);
}

VoidResult ComplianceGate::SetCompliance(const CallContext& ctx, const Address& account,
                                         bool approved, uint8_t level,
                                         BlockHeight expiresAt) {
    if (ctx.caller != params_.registrar) {
        return Reject(LedgerError::NotAuthorized, "caller is not the registrar");
    }
    if (account.IsNull()) {
        return Reject(LedgerError::InvalidAddress, "null account");
    }
    if (level > ledger::MAX_KYC_LEVEL) {
        return Reject(LedgerError::InvalidKycLevel,
                      "level " + std::to_string(level) + " above maximum");
    }
    if (expiresAt <= ctx.height || expiresAt - ctx.height > ledger::MAX_EXPIRY_BLOCKS) {
        return Reject(LedgerError::InvalidExpiry,
                      "expiry " + std::to_string(expiresAt) + " outside validity window");
    }

    ComplianceRecord& record = state_.compliance[account];
    record.approved = approved;
    record.level = level;
    record.expiresAt = expiresAt;
    record.attestedAt = ctx.height;

    LOG_INFO(util::LogCategory::COMPLIANCE) << "Attested " << account.ToHex()
        << " approved=" << approved << " level=" << static_cast<int>(level)
        << " expires=" << expiresAt;
    return VoidResult::Success({});
}

VoidResult ComplianceGate::RevokeCompliance(const CallContext& ctx, const Address& account) {
    if (ctx.caller != params_.registrar) {
        return Reject(LedgerError::NotAuthorized, "caller is not the registrar");
    }
    auto it = state_.compliance.find(account);
    if (it == state_.compliance.end()) {
        return Reject(LedgerError::NotFound, "no record for " + account.ToHex());
    }

    it->second.approved = false;
    LOG_INFO(util::LogCategory::COMPLIANCE) << "Revoked " << account.ToHex();
    return VoidResult::Success({});
}

std::optional<ComplianceRecord> ComplianceGate::GetRecord(const Address& account) const {
    auto it = state_.compliance.find(account);
    if (it == state_.compliance.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace compliance
} // namespace shareledger
