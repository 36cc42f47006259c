// SHARELEDGER - Token Ledger & Asset Registry
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Tokenizes registered assets into a fixed supply of fungible shares and
// tracks who holds them. The per-asset supply never changes after
// tokenization; transfers only move shares between holders.

#ifndef SHARELEDGER_REGISTRY_TOKEN_LEDGER_H
#define SHARELEDGER_REGISTRY_TOKEN_LEDGER_H

#include "shareledger/compliance/compliance.h"
#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"

#include <string>
#include <utility>
#include <vector>

namespace shareledger {
namespace registry {

using ledger::Asset;
using ledger::CallContext;

/// A holder and its share count
using Holding = std::pair<Address, Amount>;

class TokenLedger {
public:
    TokenLedger(ledger::LedgerState& state, const ledger::LedgerParams& params,
                const compliance::ComplianceGate& compliance);

    // ========================================================================
    // Asset Registry
    // ========================================================================

    /**
     * Register an asset and mint SUPPLY_PER_ASSET shares to the caller.
     *
     * Errors: NotAuthorized (caller is not the registrar), InvalidURI,
     * InvalidValue.
     * @return The new asset id (ids start at 1)
     */
    Result<AssetId> TokenizeAsset(const CallContext& ctx, const std::string& metadataURI,
                                  Amount value);

    Result<Asset> GetAssetDetails(AssetId assetId) const;

    bool AssetExists(AssetId assetId) const;

    uint64_t GetAssetCount() const { return state_.nextAssetId; }

    /// Add revenue to an asset's accrual. Owner only.
    VoidResult DepositRevenue(const CallContext& ctx, AssetId assetId, Amount amount);

    /// Freeze or unfreeze share transfers. Owner only.
    VoidResult SetAssetLocked(const CallContext& ctx, AssetId assetId, bool locked);

    // ========================================================================
    // Share Balances
    // ========================================================================

    /// Shares held; unknown pairs read as zero
    Amount GetShareBalance(const Address& holder, AssetId assetId) const;

    /// Non-zero holdings of an asset in address order
    std::vector<Holding> GetHolders(AssetId assetId) const;

    /// Sum of all balances of an asset (always SUPPLY_PER_ASSET once tokenized)
    Amount TotalSupply(AssetId assetId) const;

    /**
     * Validate a share transfer without applying it.
     *
     * Errors, in order: NotFound, InvalidAddress (null or self recipient),
     * InvalidAmount (zero or above balance), NotAuthorized (asset locked),
     * KycRequired (recipient not compliant).
     */
    VoidResult CheckTransfer(const CallContext& ctx, const Address& to, AssetId assetId,
                             Amount amount) const;

    /// Move shares; CheckTransfer() must have succeeded in the same call
    void ApplyTransfer(const Address& from, const Address& to, AssetId assetId,
                       Amount amount);

private:
    ledger::LedgerState& state_;
    const ledger::LedgerParams& params_;
    const compliance::ComplianceGate& compliance_;
};

} // namespace registry
} // namespace shareledger

#endif // SHARELEDGER_REGISTRY_TOKEN_LEDGER_H
