// VELEDGER - Delegation Checkpoint Index Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/escrow/delegation.h"
#include "veledger/util/logging.h"

#include <algorithm>

namespace veledger {
namespace escrow {

// ============================================================================
// Delegates
// ============================================================================

Address DelegationIndex::DelegateOf(const Address& account) const {
    auto it = delegates_.find(account);
    return it == delegates_.end() ? account : it->second;
}

void DelegationIndex::SetDelegate(const Address& account, const Address& delegatee) {
    if (delegatee.IsNull() || delegatee == account) {
        journal_.Erase(delegates_, account);
    } else {
        journal_.Put(delegates_, account, delegatee);
    }
}

// ============================================================================
// Checkpoints
// ============================================================================

void DelegationIndex::MoveIds(const Address& from, const Address& to,
                              const std::vector<TokenId>& ids, Timestamp now) {
    if (from == to || ids.empty()) {
        return;
    }

    if (!from.IsNull()) {
        std::vector<TokenId> remaining = CurrentSet(from);
        for (TokenId id : ids) {
            auto it = std::find(remaining.begin(), remaining.end(), id);
            if (it == remaining.end()) {
                LOG_ERROR(util::LogCategory::DELEGATION)
                    << "Position " << id << " not in delegate set of " << from;
                throw InvariantError("position " + std::to_string(id) +
                                     " is not delegated to 0x" + from.ToHex());
            }
            remaining.erase(it);
        }
        Push(from, std::move(remaining), now);
    }

    if (!to.IsNull()) {
        std::vector<TokenId> extended = CurrentSet(to);
        for (TokenId id : ids) {
            if (std::find(extended.begin(), extended.end(), id) != extended.end()) {
                LOG_ERROR(util::LogCategory::DELEGATION)
                    << "Position " << id << " already in delegate set of " << to;
                throw InvariantError("position " + std::to_string(id) +
                                     " is already delegated to 0x" + to.ToHex());
            }
            extended.push_back(id);
        }
        Push(to, std::move(extended), now);
    }

    LOG_DEBUG(util::LogCategory::DELEGATION)
        << "Moved " << ids.size() << " position(s) from " << from << " to " << to
        << " at " << now;
}

void DelegationIndex::Push(const Address& delegate, std::vector<TokenId> ids, Timestamp now) {
    auto it = checkpoints_.find(delegate);
    if (it == checkpoints_.end()) {
        journal_.Put(checkpoints_, delegate, std::vector<DelegationCheckpoint>());
        it = checkpoints_.find(delegate);
    }

    std::vector<DelegationCheckpoint>& list = it->second;
    if (!list.empty()) {
        if (list.back().ts == now) {
            throw PreconditionError(ErrorCode::FlashProtected,
                                    "delegate 0x" + delegate.ToHex() +
                                    " already checkpointed at " + std::to_string(now));
        }
        if (list.back().ts > now) {
            throw InvariantError("delegation checkpoint at " + std::to_string(now) +
                                 " precedes " + std::to_string(list.back().ts),
                                 ErrorCode::CheckpointUnorderedInsertion);
        }
    }

    DelegationCheckpoint cp;
    cp.ts = now;
    cp.ids = std::move(ids);
    journal_.PushBack(list, std::move(cp));
}

std::vector<TokenId> DelegationIndex::CurrentSet(const Address& delegate) const {
    auto it = checkpoints_.find(delegate);
    if (it == checkpoints_.end() || it->second.empty()) {
        return {};
    }
    return it->second.back().ids;
}

std::vector<TokenId> DelegationIndex::SetAt(const Address& delegate, Timestamp t) const {
    auto it = checkpoints_.find(delegate);
    if (it == checkpoints_.end()) {
        return {};
    }
    const auto& list = it->second;
    auto pos = std::upper_bound(list.begin(), list.end(), t,
                                [](Timestamp lhs, const DelegationCheckpoint& rhs) {
                                    return lhs < rhs.ts;
                                });
    if (pos == list.begin()) {
        return {};
    }
    return std::prev(pos)->ids;
}

size_t DelegationIndex::NumCheckpoints(const Address& delegate) const {
    auto it = checkpoints_.find(delegate);
    return it == checkpoints_.end() ? 0 : it->second.size();
}

const DelegationCheckpoint& DelegationIndex::CheckpointAt(const Address& delegate,
                                                          size_t index) const {
    auto it = checkpoints_.find(delegate);
    if (it == checkpoints_.end() || index >= it->second.size()) {
        throw PreconditionError(ErrorCode::NotFound,
                                "no delegation checkpoint " + std::to_string(index) +
                                " for 0x" + delegate.ToHex());
    }
    return it->second[index];
}

// ============================================================================
// Nonces
// ============================================================================

uint64_t DelegationIndex::Nonce(const Address& signer) const {
    auto it = nonces_.find(signer);
    return it == nonces_.end() ? 0 : it->second;
}

void DelegationIndex::UseNonce(const Address& signer, uint64_t nonce) {
    uint64_t expected = Nonce(signer);
    if (nonce != expected) {
        throw PreconditionError(ErrorCode::SignatureInvalid,
                                "invalid nonce " + std::to_string(nonce) +
                                ", expected " + std::to_string(expected));
    }
    journal_.Put(nonces_, signer, expected + 1);
}

// ============================================================================
// Snapshot
// ============================================================================

DelegationIndex::State DelegationIndex::Export() const {
    State state;
    state.delegates = delegates_;
    state.checkpoints = checkpoints_;
    state.nonces = nonces_;
    return state;
}

void DelegationIndex::Import(State state) {
    if (journal_.IsOpen()) {
        throw InvariantError("cannot import delegation state inside a transaction");
    }
    for (const auto& entry : state.checkpoints) {
        const auto& list = entry.second;
        for (size_t i = 1; i < list.size(); ++i) {
            if (list[i].ts <= list[i - 1].ts) {
                throw InvariantError("delegation checkpoints for 0x" + entry.first.ToHex() +
                                     " not strictly increasing",
                                     ErrorCode::CheckpointUnorderedInsertion);
            }
        }
    }
    delegates_ = std::move(state.delegates);
    checkpoints_ = std::move(state.checkpoints);
    nonces_ = std::move(state.nonces);
}

} // namespace escrow
} // namespace veledger
