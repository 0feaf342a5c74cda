// VELEDGER - Ledger Store Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/db/ledger_store.h"
#include "veledger/core/errors.h"
#include "veledger/util/config.h"
#include "veledger/util/logging.h"

namespace veledger {
namespace db {

namespace {

const char* const META_ESCROW = "escrow";
const char* const META_REWARDS = "rewards";

// Emission series tags under prefix::EMISSION
constexpr uint8_t SERIES_BASE = 'b';
constexpr uint8_t SERIES_NODE = 'n';
constexpr uint8_t SERIES_THRESHOLD = 't';

// ----------------------------------------------------------------------------
// Keys
// ----------------------------------------------------------------------------

class KeyBuilder {
public:
    explicit KeyBuilder(char prefix) { ser_writedata8(ss_, static_cast<uint8_t>(prefix)); }

    KeyBuilder& Number(uint64_t n) {
        ser_writebe64(ss_, n);
        return *this;
    }

    KeyBuilder& Time(Timestamp t) { return Number(static_cast<uint64_t>(t)); }

    KeyBuilder& Account(const Address& addr) {
        Serialize(ss_, addr);
        return *this;
    }

    KeyBuilder& Tag(uint8_t tag) {
        ser_writedata8(ss_, tag);
        return *this;
    }

    std::string str() const { return ss_.str(); }

private:
    DataStream ss_;
};

std::string MetaKey(const char* name) {
    return MakeKey(prefix::META, Slice(name));
}

Address ReadAccount(DataStream& ss) {
    Address addr;
    Unserialize(ss, addr);
    return addr;
}

// ----------------------------------------------------------------------------
// Values
// ----------------------------------------------------------------------------

std::string EncodePoint(const escrow::Point& p) {
    DataStream ss;
    ss << p.bias << p.slope << p.ts << p.blk;
    return ss.str();
}

escrow::Point DecodePoint(DataStream& ss) {
    escrow::Point p;
    ss >> p.bias >> p.slope >> p.ts >> p.blk;
    return p;
}

std::string EncodeLocked(const escrow::LockedBalance& locked) {
    DataStream ss;
    ss << locked.amount << locked.end;
    return ss.str();
}

escrow::LockedBalance DecodeLocked(DataStream& ss) {
    escrow::LockedBalance locked;
    ss >> locked.amount >> locked.end;
    return locked;
}

template<typename T>
std::string EncodeValue(const T& value) {
    DataStream ss;
    ss << value;
    return ss.str();
}

template<typename T>
T DecodeValue(DataStream& ss) {
    T value{};
    ss >> value;
    return value;
}

/// Throw StorageError unless the stream was consumed exactly
void ExpectConsumed(const DataStream& ss, const char* what) {
    if (!ss.empty()) {
        throw StorageError(std::string("trailing bytes in ") + what + " row");
    }
}

void CheckStatus(const Status& status, const std::string& context) {
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << context << ": " << status.ToString();
        throw StorageError(context + ": " + status.ToString());
    }
}

void PutEmissionSeries(WriteBatch& batch, uint8_t tag,
                       const std::vector<rewards::EmissionSchedule::Series::Entry>& entries) {
    for (const auto& entry : entries) {
        batch.Put(KeyBuilder(prefix::EMISSION).Tag(tag).Time(entry.first).str(),
                  EncodeValue(entry.second));
    }
}

} // namespace

// ============================================================================
// StoreConfig
// ============================================================================

StoreConfig StoreConfig::FromConfig(const util::ConfigManager& config,
                                    const std::filesystem::path& datadir) {
    namespace keys = util::ConfigKeys;

    StoreConfig cfg;
    if (auto name = config.TryGetString(keys::BACKEND, keys::DB_SECTION)) {
        auto backend = ParseBackend(*name);
        if (!backend) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "db.backend must be 'memory' or 'leveldb', got '" + *name + "'");
        }
        cfg.backend = *backend;
    }

    std::filesystem::path path = config.GetPath(keys::PATH, "ledger", keys::DB_SECTION);
    cfg.path = path.is_absolute() ? path : datadir / path;
    return cfg;
}

// ============================================================================
// LedgerStore
// ============================================================================

LedgerStore::LedgerStore(std::unique_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw StorageError("ledger store requires a database");
    }
}

std::unique_ptr<LedgerStore> LedgerStore::Open(const StoreConfig& config) {
    auto [status, db] = OpenDatabase(config.path, Options(), config.backend);
    CheckStatus(status, std::string("cannot open ") + BackendToString(config.backend) +
                            " store at " + config.path.string());
    LOG_INFO(util::LogCategory::DB) << "Ledger store using " << BackendToString(config.backend)
                                    << " backend";
    return std::make_unique<LedgerStore>(std::move(db));
}

bool LedgerStore::HasState() const {
    return db_->Exists(MetaKey(META_ESCROW));
}

bool LedgerStore::HasRewardState() const {
    return db_->Exists(MetaKey(META_REWARDS));
}

void LedgerStore::ForEachRow(
    char tablePrefix,
    const std::function<void(DataStream& key, const std::string& value)>& fn) const {
    auto iter = db_->NewIterator();
    const std::string start = MakeKey(tablePrefix);
    for (iter->Seek(Slice(start)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (key.empty() || key[0] != tablePrefix) {
            break;
        }
        DataStream keyStream(reinterpret_cast<const uint8_t*>(key.data()) + 1, key.size() - 1);
        fn(keyStream, iter->value().ToString());
    }
    CheckStatus(iter->status(), "iteration failed");
}

void LedgerStore::Save(const escrow::EscrowState& state,
                       const rewards::RewardEngine::State* rewards) {
    WriteBatch batch;

    // Drop every existing row first so removed entries do not survive
    {
        auto iter = db_->NewIterator();
        for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
            batch.Delete(iter->key());
        }
        CheckStatus(iter->status(), "iteration failed");
    }

    const auto& positions = state.positions;
    for (const auto& [id, locked] : positions.locked) {
        batch.Put(KeyBuilder(prefix::POSITION).Number(id).str(), EncodeLocked(locked));
    }
    for (size_t epoch = 0; epoch < positions.globalPoints.size(); ++epoch) {
        batch.Put(KeyBuilder(prefix::GLOBAL_POINT).Number(epoch).str(),
                  EncodePoint(positions.globalPoints[epoch]));
    }
    for (const auto& [id, points] : positions.userPoints) {
        for (size_t epoch = 0; epoch < points.size(); ++epoch) {
            batch.Put(KeyBuilder(prefix::USER_POINT).Number(id).Number(epoch).str(),
                      EncodePoint(points[epoch]));
        }
    }
    for (const auto& [ts, delta] : positions.slopeChanges) {
        batch.Put(KeyBuilder(prefix::SLOPE_CHANGE).Time(ts).str(), EncodeValue(delta));
    }

    const auto& delegation = state.delegation;
    for (const auto& [account, delegatee] : delegation.delegates) {
        batch.Put(KeyBuilder(prefix::DELEGATE).Account(account).str(), EncodeValue(delegatee));
    }
    for (const auto& [delegatee, checkpoints] : delegation.checkpoints) {
        for (size_t i = 0; i < checkpoints.size(); ++i) {
            DataStream value;
            value << checkpoints[i].ts << checkpoints[i].ids;
            batch.Put(KeyBuilder(prefix::DELEGATION).Account(delegatee).Number(i).str(), value.str());
        }
    }
    for (const auto& [signer, nonce] : delegation.nonces) {
        batch.Put(KeyBuilder(prefix::NONCE).Account(signer).str(), EncodeValue(nonce));
    }

    for (const auto& [id, owner] : state.owners) {
        batch.Put(KeyBuilder(prefix::OWNER).Number(id).str(), EncodeValue(owner));
    }
    for (const auto& [id, approved] : state.approvals) {
        batch.Put(KeyBuilder(prefix::APPROVAL).Number(id).str(), EncodeValue(approved));
    }
    for (const auto& [owner, ops] : state.operators) {
        for (const auto& op : ops) {
            batch.Put(KeyBuilder(prefix::OPERATOR).Account(owner).Account(op).str(), EncodeValue(true));
        }
    }
    for (const auto& [id, ts] : state.createdAt) {
        batch.Put(KeyBuilder(prefix::CREATED).Number(id).str(), EncodeValue(ts));
    }
    for (TokenId id : state.nonVoting) {
        batch.Put(KeyBuilder(prefix::NON_VOTING).Number(id).str(), EncodeValue(true));
    }

    {
        DataStream meta;
        meta << LEDGER_STORE_VERSION << state.nextId << state.sequence << positions.supply
             << state.liquidationsEnabled << state.penaltyNumerator << state.treasury;
        batch.Put(MetaKey(META_ESCROW), meta.str());
    }

    if (rewards) {
        for (const auto& [id, marker] : rewards->lastClaim) {
            batch.Put(KeyBuilder(prefix::CLAIM).Number(id).str(), EncodeValue(marker));
        }
        PutEmissionSeries(batch, SERIES_BASE, rewards->emissions.baseRates);
        PutEmissionSeries(batch, SERIES_NODE, rewards->emissions.nodeRates);
        PutEmissionSeries(batch, SERIES_THRESHOLD, rewards->emissions.thresholds);
        batch.Put(MetaKey(META_REWARDS), EncodeValue(LEDGER_STORE_VERSION));
    }

    WriteOptions options;
    options.sync = true;
    CheckStatus(db_->Write(options, &batch), "ledger save failed");

    LOG_INFO(util::LogCategory::DB) << "Saved ledger: " << state.owners.size() << " positions, "
                                    << positions.globalPoints.size() << " global points, "
                                    << batch.Count() << " batch operations";
}

bool LedgerStore::Load(escrow::EscrowState& state, rewards::RewardEngine::State* rewards) const {
    std::string metaValue;
    Status status = db_->Get(MetaKey(META_ESCROW), &metaValue);
    if (status.IsNotFound()) {
        return false;
    }
    CheckStatus(status, "cannot read ledger meta");

    escrow::EscrowState loaded;
    try {
        DataStream meta(metaValue);
        uint64_t version = DecodeValue<uint64_t>(meta);
        if (version != LEDGER_STORE_VERSION) {
            throw StorageError("unsupported ledger store version " + std::to_string(version));
        }
        meta >> loaded.nextId >> loaded.sequence >> loaded.positions.supply
             >> loaded.liquidationsEnabled >> loaded.penaltyNumerator >> loaded.treasury;
        ExpectConsumed(meta, "meta");

        auto& positions = loaded.positions;
        ForEachRow(prefix::POSITION, [&](DataStream& key, const std::string& value) {
            TokenId id = ser_readbe64(key);
            DataStream v(value);
            positions.locked[id] = DecodeLocked(v);
            ExpectConsumed(v, "position");
        });
        ForEachRow(prefix::GLOBAL_POINT, [&](DataStream& key, const std::string& value) {
            uint64_t epoch = ser_readbe64(key);
            if (epoch != positions.globalPoints.size()) {
                throw StorageError("gap in global point history at epoch " + std::to_string(epoch));
            }
            DataStream v(value);
            positions.globalPoints.push_back(DecodePoint(v));
            ExpectConsumed(v, "global point");
        });
        ForEachRow(prefix::USER_POINT, [&](DataStream& key, const std::string& value) {
            TokenId id = ser_readbe64(key);
            uint64_t epoch = ser_readbe64(key);
            auto& points = positions.userPoints[id];
            if (epoch != points.size()) {
                throw StorageError("gap in point history of position " + std::to_string(id));
            }
            DataStream v(value);
            points.push_back(DecodePoint(v));
            ExpectConsumed(v, "user point");
        });
        ForEachRow(prefix::SLOPE_CHANGE, [&](DataStream& key, const std::string& value) {
            Timestamp ts = static_cast<Timestamp>(ser_readbe64(key));
            DataStream v(value);
            positions.slopeChanges[ts] = DecodeValue<Amount>(v);
            ExpectConsumed(v, "slope change");
        });

        auto& delegation = loaded.delegation;
        ForEachRow(prefix::DELEGATE, [&](DataStream& key, const std::string& value) {
            Address account = ReadAccount(key);
            DataStream v(value);
            delegation.delegates[account] = DecodeValue<Address>(v);
            ExpectConsumed(v, "delegate");
        });
        ForEachRow(prefix::DELEGATION, [&](DataStream& key, const std::string& value) {
            Address delegatee = ReadAccount(key);
            uint64_t index = ser_readbe64(key);
            auto& checkpoints = delegation.checkpoints[delegatee];
            if (index != checkpoints.size()) {
                throw StorageError("gap in delegation checkpoints of 0x" + delegatee.ToHex());
            }
            escrow::DelegationCheckpoint cp;
            DataStream v(value);
            v >> cp.ts >> cp.ids;
            ExpectConsumed(v, "delegation checkpoint");
            checkpoints.push_back(std::move(cp));
        });
        ForEachRow(prefix::NONCE, [&](DataStream& key, const std::string& value) {
            Address signer = ReadAccount(key);
            DataStream v(value);
            delegation.nonces[signer] = DecodeValue<uint64_t>(v);
            ExpectConsumed(v, "nonce");
        });

        ForEachRow(prefix::OWNER, [&](DataStream& key, const std::string& value) {
            TokenId id = ser_readbe64(key);
            DataStream v(value);
            loaded.owners[id] = DecodeValue<Address>(v);
            ExpectConsumed(v, "owner");
        });
        ForEachRow(prefix::APPROVAL, [&](DataStream& key, const std::string& value) {
            TokenId id = ser_readbe64(key);
            DataStream v(value);
            loaded.approvals[id] = DecodeValue<Address>(v);
            ExpectConsumed(v, "approval");
        });
        ForEachRow(prefix::OPERATOR, [&](DataStream& key, const std::string&) {
            Address owner = ReadAccount(key);
            loaded.operators[owner].insert(ReadAccount(key));
        });
        ForEachRow(prefix::CREATED, [&](DataStream& key, const std::string& value) {
            TokenId id = ser_readbe64(key);
            DataStream v(value);
            loaded.createdAt[id] = DecodeValue<Timestamp>(v);
            ExpectConsumed(v, "creation time");
        });
        ForEachRow(prefix::NON_VOTING, [&](DataStream& key, const std::string&) {
            loaded.nonVoting.insert(ser_readbe64(key));
        });

        if (rewards && HasRewardState()) {
            rewards::RewardEngine::State loadedRewards;
            ForEachRow(prefix::CLAIM, [&](DataStream& key, const std::string& value) {
                TokenId id = ser_readbe64(key);
                DataStream v(value);
                loadedRewards.lastClaim[id] = DecodeValue<Timestamp>(v);
                ExpectConsumed(v, "claim marker");
            });
            ForEachRow(prefix::EMISSION, [&](DataStream& key, const std::string& value) {
                uint8_t tag = ser_readdata8(key);
                Timestamp ts = static_cast<Timestamp>(ser_readbe64(key));
                DataStream v(value);
                Amount amount = DecodeValue<Amount>(v);
                ExpectConsumed(v, "emission");
                auto& emissions = loadedRewards.emissions;
                switch (tag) {
                    case SERIES_BASE: emissions.baseRates.emplace_back(ts, amount); break;
                    case SERIES_NODE: emissions.nodeRates.emplace_back(ts, amount); break;
                    case SERIES_THRESHOLD: emissions.thresholds.emplace_back(ts, amount); break;
                    default:
                        throw StorageError("unknown emission series tag " + std::to_string(tag));
                }
            });
            *rewards = std::move(loadedRewards);
        }
    } catch (const std::ios_base::failure& e) {
        throw StorageError(std::string("truncated ledger row: ") + e.what());
    }

    state = std::move(loaded);
    LOG_INFO(util::LogCategory::DB) << "Loaded ledger: " << state.owners.size() << " positions, "
                                    << state.positions.globalPoints.size() << " global points";
    return true;
}

} // namespace db
} // namespace veledger
