// SHARELEDGER - Market Data Cache
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Latest oracle price per asset. Readers that act on a price go through
// GetValidatedPrice(), which refuses prices older than a staleness window.

#ifndef SHARELEDGER_MARKET_MARKET_DATA_H
#define SHARELEDGER_MARKET_MARKET_DATA_H

#include "shareledger/core/result.h"
#include "shareledger/core/types.h"
#include "shareledger/ledger/params.h"
#include "shareledger/ledger/state.h"
#include "shareledger/registry/token_ledger.h"

#include <vector>

namespace shareledger {
namespace market {

using ledger::CallContext;
using ledger::MarketPrice;

class MarketDataCache {
public:
    MarketDataCache(ledger::LedgerState& state, const ledger::LedgerParams& params,
                    const registry::TokenLedger& tokens);

    // ========================================================================
    // Oracles
    // ========================================================================

    /// Allow an account to publish prices. Registrar only.
    /// Errors: NotAuthorized, InvalidAddress, AlreadyListed.
    VoidResult AuthorizeOracle(const CallContext& ctx, const Address& oracle);

    bool IsOracle(const Address& account) const;

    std::vector<Address> GetOracles() const;

    // ========================================================================
    // Prices
    // ========================================================================

    /**
     * Publish a price for an asset and stamp the asset's lastPriceUpdateAt.
     *
     * Errors: NotAuthorized (caller is not an oracle), NotFound (asset),
     * InvalidValue (zero price or decimals above MAX_PRICE_DECIMALS).
     */
    VoidResult SetPrice(const CallContext& ctx, AssetId assetId, uint64_t price,
                        uint8_t decimals);

    /// Last published price regardless of age
    Result<MarketPrice> GetMarketPrice(AssetId assetId) const;

    /// Last published price if at most maxStalenessBlocks old at height,
    /// else PriceExpired
    Result<MarketPrice> GetValidatedPrice(AssetId assetId, BlockHeight maxStalenessBlocks,
                                          BlockHeight height) const;

    /// GetValidatedPrice() with the configured staleness window
    Result<MarketPrice> GetValidatedPrice(AssetId assetId, BlockHeight height) const {
        return GetValidatedPrice(assetId, params_.maxStaleness, height);
    }

    /**
     * Value of a holder's shares, balance * price / SUPPLY_PER_ASSET, in
     * units of 10^-decimals. Fails like GetValidatedPrice().
     */
    Result<uint64_t> GetHoldingValuation(const Address& holder, AssetId assetId,
                                         BlockHeight maxStalenessBlocks,
                                         BlockHeight height) const;

private:
    ledger::LedgerState& state_;
    const ledger::LedgerParams& params_;
    const registry::TokenLedger& tokens_;
};

} // namespace market
} // namespace shareledger

#endif // SHARELEDGER_MARKET_MARKET_DATA_H
