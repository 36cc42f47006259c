// SHARELEDGER - Dividend Distribution Engine
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Pro-rata distribution of accrued asset revenue to shareholders.
//
// Each holder keeps a high-water mark (lastClaimedAccrual) of the asset
// accrual already accounted for it. A holder is entitled to
//
//     floor(balance * (accruedRevenue - lastClaimedAccrual) / SUPPLY_PER_ASSET)
//
// plus whatever a share transfer settled into its claim record (owed). Only
// a harvest, which passes the compliance gate, moves that entitlement into
// the payout balance. Truncation dust stays with the asset as undistributed
// revenue.

#ifndef SHARELEDGER_DIVIDEND_DIVIDENDS_H
#define SHARELEDGER_DIVIDEND_DIVIDENDS_H

#include "shareledger/compliance/compliance.h"
#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"
#include "shareledger/registry/token_ledger.h"

#include <optional>

namespace shareledger {
namespace dividend {

using ledger::CallContext;
using ledger::DividendClaim;

/// Dividend owed for a balance over an accrual delta, using a 128-bit
/// intermediate product
Amount ComputeDividend(Amount balance, Amount accrued, Amount lastClaimed);

class DividendEngine {
public:
    DividendEngine(ledger::LedgerState& state, const ledger::LedgerParams& params,
                   const registry::TokenLedger& tokens,
                   const compliance::ComplianceGate& compliance);

    /**
     * Pay the caller's pending dividend for an asset.
     *
     * Errors, in order: NotFound (asset), KycRequired, InvalidAmount
     * (nothing to pay).
     * @return Amount credited to the caller's payout balance
     */
    Result<Amount> HarvestDividends(const CallContext& ctx, AssetId assetId);

    /// Amount a harvest would pay right now; zero instead of an error
    Amount PendingDividends(const Address& holder, AssetId assetId) const;

    /// Claim record of a holder; a default record if it never claimed
    DividendClaim GetLastClaim(AssetId assetId, const Address& beneficiary) const;

    /// Revenue harvested into an account across all assets
    Amount GetPayoutBalance(const Address& account) const;

    // ========================================================================
    // Settlement (used around share transfers)
    // ========================================================================

    /// InvalidAmount if settling the holder would overflow its owed amount
    VoidResult CheckSettle(AssetId assetId, const Address& holder) const;

    /**
     * Record the holder's accrued entitlement as owed and move its mark to
     * the current accrual, so a change in balance does not change past
     * entitlement. Nothing is paid out. The asset must exist and
     * CheckSettle() must have succeeded.
     */
    void Settle(AssetId assetId, const Address& holder);

private:
    /// Accrued plus owed entitlement; nullopt if the sum overflows
    std::optional<Amount> Entitlement(const ledger::Asset& asset, const Address& holder) const;

    /// Credit a payout, clear owed and advance the holder's mark
    void Pay(ledger::Asset& asset, const Address& holder, Amount amount, BlockHeight height);

    ledger::LedgerState& state_;
    const ledger::LedgerParams& params_;
    const registry::TokenLedger& tokens_;
    const compliance::ComplianceGate& compliance_;
};

} // namespace dividend
} // namespace shareledger

#endif // SHARELEDGER_DIVIDEND_DIVIDENDS_H
