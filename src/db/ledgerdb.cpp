// SHARELEDGER - Ledger Database Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/db/ledgerdb.h"
#include "shareledger/util/logging.h"

#include <stdexcept>
#include <system_error>

namespace shareledger {
namespace db {

namespace {

/// Meta row: layout version, id counters and the state root
struct MetaRecord {
    uint32_t version{LEDGER_DB_VERSION};
    uint64_t nextAssetId{0};
    uint64_t nextProposalId{0};
    Hash256 stateRoot;
};

void Serialize(DataStream& s, const MetaRecord& meta) {
    s << meta.version << meta.nextAssetId << meta.nextProposalId << meta.stateRoot;
}

void Unserialize(DataStream& s, MetaRecord& meta) {
    s >> meta.version >> meta.nextAssetId >> meta.nextProposalId >> meta.stateRoot;
}

/// Decode the parts of a key after its prefix byte
template<typename... Parts>
bool DecodeKey(const Slice& key, Parts&... parts) {
    if (key.empty()) {
        return false;
    }
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(key.data()) + 1, key.size() - 1);
        (ss >> ... >> parts);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

template<typename T>
bool DecodeValue(const Slice& value, T& obj) {
    return DeserializeFromString(value.ToString(), obj);
}

bool IsLedgerPrefix(char c) {
    for (char p : prefix::ALL) {
        if (p == c) return true;
    }
    return false;
}

} // namespace

LedgerDB::LedgerDB(const std::filesystem::path& dbPath, const Options& options, bool wipe) {
    if (wipe) {
        Status destroyed = DestroyDatabase(dbPath);
        if (!destroyed.ok()) {
            throw std::runtime_error("Failed to wipe ledger database: " + destroyed.ToString());
        }
    }

    auto [status, database] = OpenDatabase(dbPath, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open ledger database: " + status.ToString());
    }
    db_ = std::move(database);
}

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("LedgerDB: null database");
    }
}

Status LedgerDB::Flush(const ledger::LedgerState& state) {
    SHARELEDGER_LOG_TIMER(util::LogCategory::DB, "ledger flush");

    WriteBatch batch;

    // Drop every stored row first; the puts below re-add the live ones
    {
        auto it = db_->NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            Slice key = it->key();
            if (!key.empty() && IsLedgerPrefix(key[0])) {
                batch.Delete(key);
            }
        }
        if (!it->status().ok()) {
            return it->status();
        }
    }

    for (const auto& [id, asset] : state.assets) {
        batch.Put(MakeKey(prefix::ASSET, id), SerializeToString(asset));
    }
    for (const auto& [key, amount] : state.balances) {
        batch.Put(MakeKey(prefix::BALANCE, key.first, key.second), SerializeToString(amount));
    }
    for (const auto& [account, record] : state.compliance) {
        batch.Put(MakeKey(prefix::COMPLIANCE, account), SerializeToString(record));
    }
    for (const auto& [id, proposal] : state.proposals) {
        batch.Put(MakeKey(prefix::PROPOSAL, id), SerializeToString(proposal));
    }
    for (const auto& [key, vote] : state.votes) {
        batch.Put(MakeKey(prefix::VOTE, key.first, key.second), SerializeToString(vote));
    }
    for (const auto& [key, claim] : state.claims) {
        batch.Put(MakeKey(prefix::CLAIM, key.first, key.second), SerializeToString(claim));
    }
    for (const auto& [id, price] : state.prices) {
        batch.Put(MakeKey(prefix::PRICE, id), SerializeToString(price));
    }
    for (const auto& [account, amount] : state.payouts) {
        batch.Put(MakeKey(prefix::PAYOUT, account), SerializeToString(amount));
    }
    for (const auto& oracle : state.oracles) {
        batch.Put(MakeKey(prefix::ORACLE, oracle), SerializeToString(true));
    }

    MetaRecord meta;
    meta.nextAssetId = state.nextAssetId;
    meta.nextProposalId = state.nextProposalId;
    meta.stateRoot = ledger::ComputeStateRoot(state);
    batch.Put(MakeKey(prefix::META), SerializeToString(meta));

    WriteOptions options;
    options.sync = true;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Ledger flush failed: " << s.ToString();
        return s;
    }

    ++nFlushes_;
    LOG_DEBUG(util::LogCategory::DB) << "Flushed ledger state (" << batch.Count()
        << " operations, root " << meta.stateRoot.ToHex() << ")";
    return Status::Ok();
}

Status LedgerDB::Load(ledger::LedgerState& state) const {
    SHARELEDGER_LOG_TIMER(util::LogCategory::DB, "ledger load");

    std::string metaValue;
    Status s = db_->Get(MakeKey(prefix::META), &metaValue);
    if (!s.ok()) {
        return s;
    }
    MetaRecord meta;
    if (!DeserializeFromString(metaValue, meta)) {
        return Status::Corruption("undecodable meta row");
    }
    if (meta.version != LEDGER_DB_VERSION) {
        return Status::NotSupported("ledger database version " + std::to_string(meta.version));
    }

    ledger::LedgerState loaded;
    loaded.nextAssetId = meta.nextAssetId;
    loaded.nextProposalId = meta.nextProposalId;

    auto it = db_->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        Slice key = it->key();
        Slice value = it->value();
        if (key.empty()) {
            continue;
        }

        bool ok = true;
        switch (key[0]) {
            case prefix::ASSET: {
                AssetId id = 0;
                ledger::Asset asset;
                ok = DecodeKey(key, id) && DecodeValue(value, asset) && asset.id == id;
                if (ok) loaded.assets.emplace(id, asset);
                break;
            }
            case prefix::BALANCE: {
                ledger::HolderKey hk;
                Amount amount = 0;
                ok = DecodeKey(key, hk.first, hk.second) && DecodeValue(value, amount);
                if (ok) loaded.balances.emplace(hk, amount);
                break;
            }
            case prefix::COMPLIANCE: {
                Address account;
                ledger::ComplianceRecord record;
                ok = DecodeKey(key, account) && DecodeValue(value, record);
                if (ok) loaded.compliance.emplace(account, record);
                break;
            }
            case prefix::PROPOSAL: {
                ProposalId id = 0;
                ledger::Proposal proposal;
                ok = DecodeKey(key, id) && DecodeValue(value, proposal) && proposal.id == id;
                if (ok) loaded.proposals.emplace(id, proposal);
                break;
            }
            case prefix::VOTE: {
                ledger::VoteKey vk;
                ledger::VoteRecord vote;
                ok = DecodeKey(key, vk.first, vk.second) && DecodeValue(value, vote);
                if (ok) loaded.votes.emplace(vk, vote);
                break;
            }
            case prefix::CLAIM: {
                ledger::HolderKey hk;
                ledger::DividendClaim claim;
                ok = DecodeKey(key, hk.first, hk.second) && DecodeValue(value, claim);
                if (ok) loaded.claims.emplace(hk, claim);
                break;
            }
            case prefix::PRICE: {
                AssetId id = 0;
                ledger::MarketPrice price;
                ok = DecodeKey(key, id) && DecodeValue(value, price);
                if (ok) loaded.prices.emplace(id, price);
                break;
            }
            case prefix::PAYOUT: {
                Address account;
                Amount amount = 0;
                ok = DecodeKey(key, account) && DecodeValue(value, amount);
                if (ok) loaded.payouts.emplace(account, amount);
                break;
            }
            case prefix::ORACLE: {
                Address oracle;
                ok = DecodeKey(key, oracle);
                if (ok) loaded.oracles.insert(oracle);
                break;
            }
            default:
                break;
        }

        if (!ok) {
            return Status::Corruption("undecodable row with prefix '" +
                                      std::string(1, key[0]) + "'");
        }
    }
    if (!it->status().ok()) {
        return it->status();
    }

    Hash256 root = ledger::ComputeStateRoot(loaded);
    if (root != meta.stateRoot) {
        return Status::Corruption("state root mismatch: stored " + meta.stateRoot.ToHex() +
                                  ", computed " + root.ToHex());
    }

    state = std::move(loaded);
    LOG_INFO(util::LogCategory::DB) << "Loaded ledger state: " << state.assets.size()
        << " assets, " << state.proposals.size() << " proposals, root " << root.ToHex();
    return Status::Ok();
}

bool LedgerDB::HasState() const {
    return db_->Exists(MakeKey(prefix::META));
}

std::optional<Hash256> LedgerDB::GetStoredStateRoot() const {
    std::string value;
    if (!db_->Get(MakeKey(prefix::META), &value).ok()) {
        return std::nullopt;
    }
    MetaRecord meta;
    if (!DeserializeFromString(value, meta)) {
        return std::nullopt;
    }
    return meta.stateRoot;
}

} // namespace db
} // namespace shareledger
