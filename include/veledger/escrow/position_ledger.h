// VELEDGER - Position Ledger
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Locked balances, per-position point histories, the global point history
// and the slope-change schedule. ApplyLock is the single write path for all
// of them; every lock mutation (create, top up, extend, merge, split,
// withdraw, liquidate) funnels through it.

#ifndef VELEDGER_ESCROW_POSITION_LEDGER_H
#define VELEDGER_ESCROW_POSITION_LEDGER_H

#include "veledger/core/types.h"
#include "veledger/escrow/journal.h"
#include "veledger/escrow/point_history.h"

#include <map>
#include <vector>

namespace veledger {
namespace escrow {

class PositionLedger {
public:
    /// Plain copy of every table, for snapshots and persistence
    struct State {
        std::map<TokenId, LockedBalance> locked;
        std::vector<Point> globalPoints;                     // index = epoch
        std::map<TokenId, std::vector<Point>> userPoints;    // index = user epoch
        std::map<Timestamp, Amount> slopeChanges;
        Amount supply{0};
    };

    explicit PositionLedger(Journal& journal, int maxReplayWeeks = DEFAULT_MAX_REPLAY_WEEKS);

    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Replace the locked balance of `id` and checkpoint the change.
     * An empty balance removes the row; the user history is kept.
     * `seq` is stamped into every point written.
     */
    void ApplyLock(TokenId id, const LockedBalance& next, Timestamp now, uint64_t seq);

    /// Bring the global history up to `now` without touching any position
    void GlobalCheckpoint(Timestamp now, uint64_t seq);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Current locked balance (empty if none)
    LockedBalance Locked(TokenId id) const;

    bool HasLock(TokenId id) const { return locked_.count(id) > 0; }

    /// Sum of all locked amounts
    Amount Supply() const { return supply_; }

    /// Power of one position at t from its own history; 0 before its first point
    Amount VotingPowerOf(TokenId id, Timestamp t) const;

    /// Aggregate power at t, replayed read-only from the latest global point <= t
    Amount TotalPowerAt(Timestamp t) const;

    uint64_t UserPointEpoch(TokenId id) const;

    /// User point at an epoch (epoch 0 is the empty sentinel)
    Point UserPoint(TokenId id, uint64_t epoch) const;

    const PointHistory& Global() const { return global_; }
    const SlopeChangeSchedule& Schedule() const { return schedule_; }

    int MaxReplayWeeks() const { return maxReplayWeeks_; }
    void SetMaxReplayWeeks(int weeks);

    // ========================================================================
    // Snapshot
    // ========================================================================

    State Export() const;

    /// Replace every table; throws InvariantError on malformed histories
    void Import(State state);

private:
    void Checkpoint(TokenId id, const LockedBalance& oldLock, const LockedBalance& newLock,
                    Timestamp now, uint64_t seq);

    Journal& journal_;
    int maxReplayWeeks_;

    std::map<TokenId, LockedBalance> locked_;
    std::map<TokenId, PointHistory> userHistories_;
    PointHistory global_;
    SlopeChangeSchedule schedule_;
    Amount supply_{0};
};

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_POSITION_LEDGER_H
