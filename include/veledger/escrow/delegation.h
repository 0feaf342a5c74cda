// VELEDGER - Delegation Checkpoint Index
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// For every delegate address, an append-only list of (timestamp, id set)
// checkpoints recording exactly which positions count towards its votes.
// An account without an explicit delegate delegates to itself.

#ifndef VELEDGER_ESCROW_DELEGATION_H
#define VELEDGER_ESCROW_DELEGATION_H

#include "veledger/core/types.h"
#include "veledger/escrow/journal.h"

#include <map>
#include <string>
#include <vector>

namespace veledger {
namespace escrow {

/// Position ids delegated to one address from `ts` onwards
struct DelegationCheckpoint {
    Timestamp ts{0};
    std::vector<TokenId> ids;

    bool operator==(const DelegationCheckpoint& other) const {
        return ts == other.ts && ids == other.ids;
    }
};

class DelegationIndex {
public:
    struct State {
        std::map<Address, Address> delegates;
        std::map<Address, std::vector<DelegationCheckpoint>> checkpoints;
        std::map<Address, uint64_t> nonces;
    };

    explicit DelegationIndex(Journal& journal) : journal_(journal) {}

    DelegationIndex(const DelegationIndex&) = delete;
    DelegationIndex& operator=(const DelegationIndex&) = delete;

    // ========================================================================
    // Delegates
    // ========================================================================

    /// Active delegate of `account` (the account itself when unset)
    Address DelegateOf(const Address& account) const;

    bool HasExplicitDelegate(const Address& account) const {
        return delegates_.count(account) > 0;
    }

    /// Record `delegatee` as the active delegate; a null delegatee means self
    void SetDelegate(const Address& account, const Address& delegatee);

    // ========================================================================
    // Checkpoints
    // ========================================================================

    /**
     * Move `ids` out of `from`'s set and into `to`'s set at `now`, one
     * checkpoint per side. A null side is skipped; from == to is a no-op.
     * Throws InvariantError if an id is missing from `from` or already in `to`,
     * and PreconditionError(FlashProtected) on a second push for the same
     * delegate at the same instant.
     */
    void MoveIds(const Address& from, const Address& to,
                 const std::vector<TokenId>& ids, Timestamp now);

    /// Ids currently delegated to `delegate`
    std::vector<TokenId> CurrentSet(const Address& delegate) const;

    /// Ids delegated to `delegate` at time t (latest checkpoint with ts <= t)
    std::vector<TokenId> SetAt(const Address& delegate, Timestamp t) const;

    size_t NumCheckpoints(const Address& delegate) const;

    const DelegationCheckpoint& CheckpointAt(const Address& delegate, size_t index) const;

    // ========================================================================
    // Signature nonces
    // ========================================================================

    uint64_t Nonce(const Address& signer) const;

    /// Consume `nonce`; throws SignatureInvalid unless it is the next one
    void UseNonce(const Address& signer, uint64_t nonce);

    // ========================================================================
    // Snapshot
    // ========================================================================

    State Export() const;
    void Import(State state);

private:
    void Push(const Address& delegate, std::vector<TokenId> ids, Timestamp now);

    Journal& journal_;
    std::map<Address, Address> delegates_;
    std::map<Address, std::vector<DelegationCheckpoint>> checkpoints_;
    std::map<Address, uint64_t> nonces_;
};

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_DELEGATION_H
