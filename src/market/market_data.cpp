// SHARELEDGER - Market Data Cache Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/market/market_data.h"
#include "shareledger/util/logging.h"

namespace shareledger {
namespace market {

namespace {

template<typename T>
Result<T> Reject(LedgerError error, const std::string& message) {
    LOG_DEBUG(util::LogCategory::MARKET) << "Rejected: "
        << LedgerErrorToString(error) << " (" << message << ")";
    return Result<T>::Failure(error, message);
}

} // namespace

MarketDataCache::MarketDataCache(ledger::LedgerState& state,
                                 const ledger::LedgerParams& params,
                                 const registry::TokenLedger& tokens)
    : state_(state), params_(params), tokens_(tokens) {}

// ============================================================================
// Oracles
// ============================================================================

VoidResult MarketDataCache::AuthorizeOracle(const CallContext& ctx, const Address& oracle) {
    if (ctx.caller != params_.registrar) {
        return Reject<Unit>(LedgerError::NotAuthorized, "caller is not the registrar");
    }
    if (oracle.IsNull()) {
        return Reject<Unit>(LedgerError::InvalidAddress, "null oracle");
    }
    if (state_.oracles.count(oracle) > 0) {
        return Reject<Unit>(LedgerError::AlreadyListed, oracle.ToHex() + " already authorized");
    }

    state_.oracles.insert(oracle);
    LOG_INFO(util::LogCategory::MARKET) << "Authorized oracle " << oracle.ToHex();
    return VoidResult::Success({});
}

bool MarketDataCache::IsOracle(const Address& account) const {
    return state_.oracles.count(account) > 0;
}

std::vector<Address> MarketDataCache::GetOracles() const {
    return std::vector<Address>(state_.oracles.begin(), state_.oracles.end());
}

// ============================================================================
// Prices
// ============================================================================

VoidResult MarketDataCache::SetPrice(const CallContext& ctx, AssetId assetId, uint64_t price,
                                     uint8_t decimals) {
    if (!IsOracle(ctx.caller)) {
        return Reject<Unit>(LedgerError::NotAuthorized, "caller is not an oracle");
    }
    auto assetIt = state_.assets.find(assetId);
    if (assetIt == state_.assets.end()) {
        return Reject<Unit>(LedgerError::NotFound, "asset " + std::to_string(assetId));
    }
    if (price == 0 || decimals > ledger::MAX_PRICE_DECIMALS) {
        return Reject<Unit>(LedgerError::InvalidValue,
                            "price " + std::to_string(price) + " decimals " +
                            std::to_string(decimals));
    }

    MarketPrice& entry = state_.prices[assetId];
    entry.price = price;
    entry.decimals = decimals;
    entry.lastUpdatedAt = ctx.height;
    entry.oracle = ctx.caller;
    assetIt->second.lastPriceUpdateAt = ctx.height;

    LOG_DEBUG(util::LogCategory::MARKET) << "Price of asset " << assetId << " = " << price
        << "e-" << static_cast<int>(decimals) << " at height " << ctx.height;
    return VoidResult::Success({});
}

Result<MarketPrice> MarketDataCache::GetMarketPrice(AssetId assetId) const {
    auto it = state_.prices.find(assetId);
    if (it == state_.prices.end()) {
        return Result<MarketPrice>::Failure(LedgerError::NotFound,
                                            "no price for asset " + std::to_string(assetId));
    }
    return Result<MarketPrice>::Success(it->second);
}

Result<MarketPrice> MarketDataCache::GetValidatedPrice(AssetId assetId,
                                                       BlockHeight maxStalenessBlocks,
                                                       BlockHeight height) const {
    auto price = GetMarketPrice(assetId);
    if (!price) {
        return price;
    }
    BlockHeight updatedAt = price->lastUpdatedAt;
    if (height > updatedAt && height - updatedAt > maxStalenessBlocks) {
        return Reject<MarketPrice>(LedgerError::PriceExpired,
                                   "price of asset " + std::to_string(assetId) + " is " +
                                   std::to_string(height - updatedAt) + " blocks old");
    }
    return price;
}

Result<uint64_t> MarketDataCache::GetHoldingValuation(const Address& holder, AssetId assetId,
                                                      BlockHeight maxStalenessBlocks,
                                                      BlockHeight height) const {
    auto price = GetValidatedPrice(assetId, maxStalenessBlocks, height);
    if (!price) {
        return Result<uint64_t>::Failure(price.Error(), price.Message());
    }
    unsigned __int128 product = static_cast<unsigned __int128>(
        tokens_.GetShareBalance(holder, assetId)) * price->price;
    return Result<uint64_t>::Success(
        static_cast<uint64_t>(product / ledger::SUPPLY_PER_ASSET));
}

} // namespace market
} // namespace shareledger
