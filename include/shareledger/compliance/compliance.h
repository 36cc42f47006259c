// SHARELEDGER - Compliance Gate
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Stores compliance attestations (approved, level, expiry) produced by an
// external attestation process and answers whether an account may take part
// in gated operations at a given height.

#ifndef SHARELEDGER_COMPLIANCE_COMPLIANCE_H
#define SHARELEDGER_COMPLIANCE_COMPLIANCE_H

#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"

#include <optional>

namespace shareledger {
namespace compliance {

using ledger::CallContext;
using ledger::ComplianceRecord;

/**
 * Compliance records and the predicate built on them.
 *
 * A record is valid for heights strictly below expiresAt.
 */
class ComplianceGate {
public:
    ComplianceGate(ledger::LedgerState& state, const ledger::LedgerParams& params);

    /// True iff a record exists, is approved, has at least requiredLevel
    /// and has not expired at atHeight
    bool IsCompliant(const Address& account, uint8_t requiredLevel,
                     BlockHeight atHeight) const;

    /// KycRequired unless IsCompliant()
    VoidResult RequireCompliant(const Address& account, uint8_t requiredLevel,
                                BlockHeight atHeight) const;

    /// RequireCompliant() when gating is enabled, success otherwise
    VoidResult CheckGate(const Address& account, uint8_t requiredLevel,
                         BlockHeight atHeight) const;

    /**
     * Record an attestation. Registrar only.
     *
     * Errors: NotAuthorized, InvalidAddress, InvalidKycLevel (level above
     * MAX_KYC_LEVEL), InvalidExpiry (expiresAt not in
     * (height, height + MAX_EXPIRY_BLOCKS]).
     */
    VoidResult SetCompliance(const CallContext& ctx, const Address& account,
                             bool approved, uint8_t level, BlockHeight expiresAt);

    /// Clear the approved flag of an existing record. Registrar only.
    VoidResult RevokeCompliance(const CallContext& ctx, const Address& account);

    std::optional<ComplianceRecord> GetRecord(const Address& account) const;

    bool IsGatingEnabled() const { return params_.complianceEnabled; }

private:
    ledger::LedgerState& state_;
    const ledger::LedgerParams& params_;
};

} // namespace compliance
} // namespace shareledger

#endif // SHARELEDGER_COMPLIANCE_COMPLIANCE_H
