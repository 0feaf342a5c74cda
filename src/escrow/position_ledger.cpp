// VELEDGER - Position Ledger Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/escrow/position_ledger.h"
#include "veledger/util/logging.h"

namespace veledger {
namespace escrow {

namespace {

/// TokenId reserved for the no-position heartbeat
constexpr TokenId HEARTBEAT_ID = 0;

} // namespace

PositionLedger::PositionLedger(Journal& journal, int maxReplayWeeks)
    : journal_(journal), maxReplayWeeks_(maxReplayWeeks) {
    SetMaxReplayWeeks(maxReplayWeeks);
}

void PositionLedger::SetMaxReplayWeeks(int weeks) {
    if (weeks <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "max replay weeks must be positive");
    }
    maxReplayWeeks_ = weeks;
}

// ============================================================================
// Mutation
// ============================================================================

void PositionLedger::ApplyLock(TokenId id, const LockedBalance& next, Timestamp now, uint64_t seq) {
    if (id == HEARTBEAT_ID) {
        throw InvariantError("position id 0 is reserved");
    }
    if (next.amount < 0) {
        throw InvariantError("negative locked amount for position " + std::to_string(id));
    }
    if (next.end % WEEK != 0) {
        throw InvariantError("unlock time " + std::to_string(next.end) +
                             " is not a week boundary");
    }

    LockedBalance prev = Locked(id);
    journal_.Assign(supply_, CheckedAdd(supply_, CheckedSub(next.amount, prev.amount)));
    if (supply_ < 0) {
        throw InvariantError("total locked supply would go negative");
    }

    if (next.IsEmpty()) {
        journal_.Erase(locked_, id);
    } else {
        journal_.Put(locked_, id, next);
    }

    Checkpoint(id, prev, next, now, seq);

    LOG_DEBUG(util::LogCategory::CHECKPOINT)
        << "Position " << id << ": " << prev.ToString() << " -> " << next.ToString()
        << " at " << now;
}

void PositionLedger::GlobalCheckpoint(Timestamp now, uint64_t seq) {
    Checkpoint(HEARTBEAT_ID, LockedBalance{}, LockedBalance{}, now, seq);
}

void PositionLedger::Checkpoint(TokenId id, const LockedBalance& oldLock,
                                const LockedBalance& newLock, Timestamp now, uint64_t seq) {
    Point uOld;
    Point uNew;
    Amount oldDslope = 0;
    Amount newDslope = 0;

    if (id != HEARTBEAT_ID) {
        uOld = oldLock.ToPoint(now);
        uNew = newLock.ToPoint(now);

        // Read the scheduled deltas before the replay below consumes them
        oldDslope = schedule_.At(oldLock.end);
        if (newLock.end != 0) {
            newDslope = (newLock.end == oldLock.end) ? oldDslope : schedule_.At(newLock.end);
        }
    }

    Point last;
    last.ts = now;
    last.blk = seq;
    if (global_.Epoch() > 0) {
        last = global_.Latest();
    }

    bool caughtUp = ReplayDecay(last, now, schedule_, maxReplayWeeks_,
                                [this, seq](const Point& boundary) {
                                    Point p = boundary;
                                    p.blk = seq;
                                    global_.Record(p, journal_);
                                });
    if (!caughtUp) {
        LOG_WARN(util::LogCategory::CHECKPOINT)
            << "Global replay stopped after " << maxReplayWeeks_ << " weeks at " << last.ts
            << ", " << (now - last.ts) << "s behind; further checkpoints will catch up";
    }
    last.blk = seq;

    if (id != HEARTBEAT_ID) {
        last.slope = CheckedAdd(last.slope, CheckedSub(uNew.slope, uOld.slope));
        last.bias = CheckedAdd(last.bias, CheckedSub(uNew.bias, uOld.bias));
        if (last.slope < 0) last.slope = 0;
        if (last.bias < 0) last.bias = 0;
    }

    global_.Record(last, journal_);

    if (id == HEARTBEAT_ID) {
        return;
    }

    if (oldLock.end > now) {
        // Old line no longer ends at oldLock.end
        oldDslope = CheckedAdd(oldDslope, uOld.slope);
        if (newLock.end == oldLock.end) {
            oldDslope = CheckedSub(oldDslope, uNew.slope);
        }
        schedule_.Set(oldLock.end, oldDslope, journal_);
    }

    if (newLock.end > now && newLock.end > oldLock.end) {
        newDslope = CheckedSub(newDslope, uNew.slope);
        schedule_.Set(newLock.end, newDslope, journal_);
    }

    auto it = userHistories_.find(id);
    if (it == userHistories_.end()) {
        journal_.Put(userHistories_, id, PointHistory());
        it = userHistories_.find(id);
    }
    uNew.ts = now;
    uNew.blk = seq;
    it->second.Record(uNew, journal_);
}

// ============================================================================
// Queries
// ============================================================================

LockedBalance PositionLedger::Locked(TokenId id) const {
    auto it = locked_.find(id);
    return it == locked_.end() ? LockedBalance{} : it->second;
}

Amount PositionLedger::VotingPowerOf(TokenId id, Timestamp t) const {
    auto it = userHistories_.find(id);
    if (it == userHistories_.end()) {
        return 0;
    }
    uint64_t epoch = it->second.FindEpoch(t);
    if (epoch == 0) {
        return 0;
    }
    return it->second.At(epoch).ValueAt(t);
}

Amount PositionLedger::TotalPowerAt(Timestamp t) const {
    uint64_t epoch = global_.FindEpoch(t);
    if (epoch == 0) {
        return 0;
    }
    Point point = global_.At(epoch);
    if (!ReplayDecay(point, t, schedule_, maxReplayWeeks_)) {
        LOG_WARN(util::LogCategory::CHECKPOINT)
            << "Total power query at " << t << " exceeded " << maxReplayWeeks_
            << " replay weeks; result is approximate";
        return point.ValueAt(t);
    }
    return point.bias;
}

uint64_t PositionLedger::UserPointEpoch(TokenId id) const {
    auto it = userHistories_.find(id);
    return it == userHistories_.end() ? 0 : it->second.Epoch();
}

Point PositionLedger::UserPoint(TokenId id, uint64_t epoch) const {
    auto it = userHistories_.find(id);
    if (it == userHistories_.end()) {
        if (epoch == 0) {
            return Point{};
        }
        throw PreconditionError(ErrorCode::NotFound,
                                "no point history for position " + std::to_string(id));
    }
    return it->second.At(epoch);
}

// ============================================================================
// Snapshot
// ============================================================================

PositionLedger::State PositionLedger::Export() const {
    State state;
    state.locked = locked_;
    state.globalPoints = global_.Points();
    for (const auto& entry : userHistories_) {
        state.userPoints[entry.first] = entry.second.Points();
    }
    state.slopeChanges = schedule_.Entries();
    state.supply = supply_;
    return state;
}

void PositionLedger::Import(State state) {
    if (journal_.IsOpen()) {
        throw InvariantError("cannot import ledger state inside a transaction");
    }

    Amount total = 0;
    for (const auto& entry : state.locked) {
        if (entry.second.amount < 0 || entry.second.end % WEEK != 0) {
            throw InvariantError("malformed locked balance for position " +
                                 std::to_string(entry.first));
        }
        total = CheckedAdd(total, entry.second.amount);
    }
    if (total != state.supply) {
        throw InvariantError("locked supply " + AmountToString(state.supply) +
                             " does not match sum of positions " + AmountToString(total));
    }

    PointHistory global;
    global.Assign(std::move(state.globalPoints));

    std::map<TokenId, PointHistory> users;
    for (auto& entry : state.userPoints) {
        users[entry.first].Assign(std::move(entry.second));
    }

    SlopeChangeSchedule schedule;
    schedule.Assign(std::move(state.slopeChanges));

    locked_ = std::move(state.locked);
    global_ = std::move(global);
    userHistories_ = std::move(users);
    schedule_ = std::move(schedule);
    supply_ = state.supply;
}

} // namespace escrow
} // namespace veledger
