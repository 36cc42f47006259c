// SHARELEDGER - Token Ledger & Asset Registry Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/registry/token_ledger.h"
#include "shareledger/util/logging.h"

#include <limits>

namespace shareledger {
namespace registry {

namespace {

template<typename T>
Result<T> Reject(LedgerError error, const std::string& message) {
    LOG_DEBUG(util::LogCategory::REGISTRY) << "Rejected: "
        << LedgerErrorToString(error) << " (" << message << ")";
    return Result<T>::Failure(error, message);
}

} // namespace

TokenLedger::TokenLedger(ledger::LedgerState& state, const ledger::LedgerParams& params,
                         const compliance::ComplianceGate& compliance)
    : state_(state), params_(params), compliance_(compliance) {}

// ============================================================================
// Asset Registry
// ============================================================================

Result<AssetId> TokenLedger::TokenizeAsset(const CallContext& ctx,
                                           const std::string& metadataURI,
                                           Amount value) {
    if (ctx.caller != params_.registrar) {
        return Reject<AssetId>(LedgerError::NotAuthorized, "caller is not the registrar");
    }
    if (metadataURI.empty() || metadataURI.size() > ledger::MAX_URI_LENGTH) {
        return Reject<AssetId>(LedgerError::InvalidURI,
                               "metadata URI length " + std::to_string(metadataURI.size()));
    }
    if (value < ledger::MIN_VALUE || value > ledger::MAX_VALUE) {
        return Reject<AssetId>(LedgerError::InvalidValue,
                               "value " + std::to_string(value) + " out of range");
    }

    AssetId id = ++state_.nextAssetId;

    Asset asset;
    asset.id = id;
    asset.owner = ctx.caller;
    asset.metadataURI = metadataURI;
    asset.value = value;
    asset.createdAt = ctx.height;
    state_.assets.emplace(id, asset);
    state_.balances[{id, ctx.caller}] = ledger::SUPPLY_PER_ASSET;

    LOG_INFO(util::LogCategory::REGISTRY) << "Tokenized asset " << id << " (" << metadataURI
        << ", value " << value << ") at height " << ctx.height;
    return Result<AssetId>::Success(id);
}

Result<Asset> TokenLedger::GetAssetDetails(AssetId assetId) const {
    auto it = state_.assets.find(assetId);
    if (it == state_.assets.end()) {
        return Result<Asset>::Failure(LedgerError::NotFound,
                                      "asset " + std::to_string(assetId));
    }
    return Result<Asset>::Success(it->second);
}

bool TokenLedger::AssetExists(AssetId assetId) const {
    return state_.assets.count(assetId) > 0;
}

VoidResult TokenLedger::DepositRevenue(const CallContext& ctx, AssetId assetId, Amount amount) {
    auto it = state_.assets.find(assetId);
    if (it == state_.assets.end()) {
        return Reject<Unit>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }
    Asset& asset = it->second;
    if (ctx.caller != asset.owner) {
        return Reject<Unit>(LedgerError::OwnerOnly, "caller does not own asset");
    }
    if (amount == 0 || amount > std::numeric_limits<Amount>::max() - asset.accruedRevenue) {
        return Reject<Unit>(LedgerError::InvalidAmount,
                            "revenue amount " + std::to_string(amount));
    }

    asset.accruedRevenue += amount;
    LOG_INFO(util::LogCategory::REGISTRY) << "Asset " << assetId << " accrued " << amount
        << " (total " << asset.accruedRevenue << ")";
    return VoidResult::Success({});
}

VoidResult TokenLedger::SetAssetLocked(const CallContext& ctx, AssetId assetId, bool locked) {
    auto it = state_.assets.find(assetId);
    if (it == state_.assets.end()) {
        return Reject<Unit>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }
    if (ctx.caller != it->second.owner) {
        return Reject<Unit>(LedgerError::OwnerOnly, "caller does not own asset");
    }

    it->second.locked = locked;
    LOG_INFO(util::LogCategory::REGISTRY) << "Asset " << assetId
        << (locked ? " locked" : " unlocked");
    return VoidResult::Success({});
}

// ============================================================================
// Share Balances
// ============================================================================

Amount TokenLedger::GetShareBalance(const Address& holder, AssetId assetId) const {
    auto it = state_.balances.find({assetId, holder});
    return it == state_.balances.end() ? 0 : it->second;
}

std::vector<Holding> TokenLedger::GetHolders(AssetId assetId) const {
    std::vector<Holding> holders;
    auto it = state_.balances.lower_bound({assetId, Address()});
    for (; it != state_.balances.end() && it->first.first == assetId; ++it) {
        if (it->second > 0) {
            holders.emplace_back(it->first.second, it->second);
        }
    }
    return holders;
}

Amount TokenLedger::TotalSupply(AssetId assetId) const {
    Amount total = 0;
    for (const auto& [holder, amount] : GetHolders(assetId)) {
        total += amount;
    }
    return total;
}

VoidResult TokenLedger::CheckTransfer(const CallContext& ctx, const Address& to,
                                      AssetId assetId, Amount amount) const {
    auto it = state_.assets.find(assetId);
    if (it == state_.assets.end()) {
        return Reject<Unit>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }
    if (to.IsNull() || to == ctx.caller) {
        return Reject<Unit>(LedgerError::InvalidAddress, "bad recipient " + to.ToHex());
    }
    Amount balance = GetShareBalance(ctx.caller, assetId);
    if (amount == 0 || amount > balance) {
        return Reject<Unit>(LedgerError::InvalidAmount,
                            "transfer of " + std::to_string(amount) + " with balance " +
                            std::to_string(balance));
    }
    if (it->second.locked) {
        return Reject<Unit>(LedgerError::NotAuthorized,
                            "asset " + std::to_string(assetId) + " is locked");
    }
    return compliance_.CheckGate(to, params_.transferLevel, ctx.height);
}

void TokenLedger::ApplyTransfer(const Address& from, const Address& to, AssetId assetId,
                                Amount amount) {
    Amount& fromBalance = state_.balances[{assetId, from}];
    fromBalance -= amount;
    if (fromBalance == 0) {
        state_.balances.erase(ledger::HolderKey(assetId, from));
    }
    state_.balances[{assetId, to}] += amount;

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Transferred " << amount << " shares of asset "
        << assetId << " from " << from.ToHex() << " to " << to.ToHex();
}

} // namespace registry
} // namespace shareledger
