// SHARELEDGER - Dividend Distribution Engine Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/dividend/dividends.h"
#include "shareledger/util/logging.h"

#include <limits>

namespace shareledger {
namespace dividend {

namespace {

template<typename T>
Result<T> Reject(LedgerError error, const std::string& message) {
    LOG_DEBUG(util::LogCategory::DIVIDEND) << "Rejected: "
        << LedgerErrorToString(error) << " (" << message << ")";
    return Result<T>::Failure(error, message);
}

} // namespace

Amount ComputeDividend(Amount balance, Amount accrued, Amount lastClaimed) {
    if (balance == 0 || accrued <= lastClaimed) {
        return 0;
    }
    unsigned __int128 product = static_cast<unsigned __int128>(balance) *
                                (accrued - lastClaimed);
    // balance <= SUPPLY_PER_ASSET, so the quotient fits in 64 bits
    return static_cast<Amount>(product / ledger::SUPPLY_PER_ASSET);
}

DividendEngine::DividendEngine(ledger::LedgerState& state, const ledger::LedgerParams& params,
                               const registry::TokenLedger& tokens,
                               const compliance::ComplianceGate& compliance)
    : state_(state), params_(params), tokens_(tokens), compliance_(compliance) {}

Result<Amount> DividendEngine::HarvestDividends(const CallContext& ctx, AssetId assetId) {
    auto assetIt = state_.assets.find(assetId);
    if (assetIt == state_.assets.end()) {
        return Reject<Amount>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }

    auto gate = compliance_.CheckGate(ctx.caller, params_.harvestLevel, ctx.height);
    if (!gate) {
        return Result<Amount>::Failure(gate.Error(), gate.Message());
    }

    ledger::Asset& asset = assetIt->second;
    auto entitlement = Entitlement(asset, ctx.caller);
    if (!entitlement) {
        return Reject<Amount>(LedgerError::InvalidAmount, "dividend overflow");
    }
    Amount amount = *entitlement;
    if (amount == 0) {
        return Reject<Amount>(LedgerError::InvalidAmount, "no dividends to harvest");
    }
    if (amount > std::numeric_limits<Amount>::max() - GetPayoutBalance(ctx.caller)) {
        return Reject<Amount>(LedgerError::InvalidAmount, "payout balance overflow");
    }

    Pay(asset, ctx.caller, amount, ctx.height);

    LOG_INFO(util::LogCategory::DIVIDEND) << "Harvested " << amount << " from asset "
        << assetId << " for " << ctx.caller.ToHex();
    return Result<Amount>::Success(amount);
}

Amount DividendEngine::PendingDividends(const Address& holder, AssetId assetId) const {
    auto assetIt = state_.assets.find(assetId);
    if (assetIt == state_.assets.end()) {
        return 0;
    }
    return Entitlement(assetIt->second, holder).value_or(std::numeric_limits<Amount>::max());
}

std::optional<Amount> DividendEngine::Entitlement(const ledger::Asset& asset,
                                                  const Address& holder) const {
    DividendClaim claim = GetLastClaim(asset.id, holder);
    Amount accrued = ComputeDividend(tokens_.GetShareBalance(holder, asset.id),
                                     asset.accruedRevenue, claim.lastClaimedAccrual);
    if (accrued > std::numeric_limits<Amount>::max() - claim.owed) {
        return std::nullopt;
    }
    return accrued + claim.owed;
}

DividendClaim DividendEngine::GetLastClaim(AssetId assetId, const Address& beneficiary) const {
    auto it = state_.claims.find({assetId, beneficiary});
    if (it == state_.claims.end()) {
        return DividendClaim();
    }
    return it->second;
}

Amount DividendEngine::GetPayoutBalance(const Address& account) const {
    auto it = state_.payouts.find(account);
    return it == state_.payouts.end() ? 0 : it->second;
}

VoidResult DividendEngine::CheckSettle(AssetId assetId, const Address& holder) const {
    auto assetIt = state_.assets.find(assetId);
    if (assetIt != state_.assets.end() && !Entitlement(assetIt->second, holder)) {
        return Reject<Unit>(LedgerError::InvalidAmount, "owed dividend overflow");
    }
    return VoidResult::Success({});
}

void DividendEngine::Settle(AssetId assetId, const Address& holder) {
    const ledger::Asset& asset = state_.assets.at(assetId);
    Amount accrued = ComputeDividend(tokens_.GetShareBalance(holder, assetId),
                                     asset.accruedRevenue,
                                     GetLastClaim(assetId, holder).lastClaimedAccrual);

    DividendClaim& claim = state_.claims[{assetId, holder}];
    claim.lastClaimedAccrual = asset.accruedRevenue;
    claim.owed += accrued;
    if (accrued > 0) {
        LOG_DEBUG(util::LogCategory::DIVIDEND) << "Settled " << accrued << " from asset "
            << assetId << " for " << holder.ToHex() << ", owed " << claim.owed;
    }
}

void DividendEngine::Pay(ledger::Asset& asset, const Address& holder, Amount amount,
                         BlockHeight height) {
    DividendClaim& claim = state_.claims[{asset.id, holder}];
    claim.lastClaimedAccrual = asset.accruedRevenue;
    claim.owed = 0;
    claim.totalClaimed += amount;
    claim.lastClaimHeight = height;
    asset.distributedRevenue += amount;
    state_.payouts[holder] += amount;
}

} // namespace dividend
} // namespace shareledger
