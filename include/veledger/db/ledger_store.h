// VELEDGER - Ledger Store
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Persists a full escrow snapshot (and optionally the reward engine state)
// into a key-value Database. Each table gets its own key prefix so that a
// prefix scan returns its rows in key order.

#ifndef VELEDGER_DB_LEDGER_STORE_H
#define VELEDGER_DB_LEDGER_STORE_H

#include "veledger/db/database.h"
#include "veledger/escrow/voting_escrow.h"
#include "veledger/rewards/reward_engine.h"

#include <functional>
#include <memory>
#include <string>

namespace veledger {

namespace util {
class ConfigManager;
}

namespace db {

/// On-disk layout version written into the meta row
constexpr uint64_t LEDGER_STORE_VERSION = 1;

struct StoreConfig {
    Backend backend{Backend::Memory};
    std::filesystem::path path;

    /// Read [db] backend/path; a relative path is resolved against `datadir`
    static StoreConfig FromConfig(const util::ConfigManager& config,
                                  const std::filesystem::path& datadir);
};

class LedgerStore {
public:
    explicit LedgerStore(std::unique_ptr<Database> db);

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    /// Open the configured backend; throws StorageError on failure
    static std::unique_ptr<LedgerStore> Open(const StoreConfig& config);

    /**
     * Replace the stored state with `state` (and `rewards` if given) in a
     * single atomic batch. Throws StorageError if the write fails.
     */
    void Save(const escrow::EscrowState& state,
              const rewards::RewardEngine::State* rewards = nullptr);

    /**
     * Read the stored state. Returns false if nothing has been saved yet.
     * `rewards` is left untouched when no reward state was saved.
     * Throws StorageError on undecodable rows or a version mismatch.
     */
    bool Load(escrow::EscrowState& state, rewards::RewardEngine::State* rewards = nullptr) const;

    bool HasState() const;
    bool HasRewardState() const;

    Database& GetDatabase() { return *db_; }

private:
    /// Visit every row whose key starts with `prefix`; the callback gets the key without it
    void ForEachRow(char prefix,
                    const std::function<void(DataStream& key, const std::string& value)>& fn) const;

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace veledger

#endif // VELEDGER_DB_LEDGER_STORE_H
