// VELEDGER - Point History and Slope-Change Schedule
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Voting power is piecewise linear: between checkpoints it decays as
// bias - slope * (t - ts). The global history records the aggregate line,
// the slope-change schedule records when individual lines stop decaying,
// and ReplayDecay walks the aggregate forward one week at a time.

#ifndef VELEDGER_ESCROW_POINT_HISTORY_H
#define VELEDGER_ESCROW_POINT_HISTORY_H

#include "veledger/core/types.h"
#include "veledger/escrow/journal.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace veledger {
namespace escrow {

// ============================================================================
// Point
// ============================================================================

/// (bias, slope, timestamp, block) checkpoint of a decaying line
struct Point {
    Amount bias{0};
    Amount slope{0};
    Timestamp ts{0};
    uint64_t blk{0};

    /// Value of the line at t >= ts, floored at zero
    Amount ValueAt(Timestamp t) const;

    bool operator==(const Point& other) const {
        return bias == other.bias && slope == other.slope && ts == other.ts && blk == other.blk;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Locked amount and week-aligned unlock time of one position
struct LockedBalance {
    Amount amount{0};
    Timestamp end{0};

    bool IsEmpty() const { return amount == 0 && end == 0; }

    bool operator==(const LockedBalance& other) const {
        return amount == other.amount && end == other.end;
    }
    bool operator!=(const LockedBalance& other) const { return !(*this == other); }

    /// Slope and bias of this lock as seen at `now` (zero once expired)
    Point ToPoint(Timestamp now) const;

    std::string ToString() const;
};

// ============================================================================
// PointHistory
// ============================================================================

/**
 * Append-only sequence of points indexed by epoch.
 *
 * Epoch 0 is an empty sentinel; real checkpoints start at epoch 1. Keys are
 * strictly increasing, except that a checkpoint at the same instant as the
 * head replaces the head so lookups at that instant see the final state.
 */
class PointHistory {
public:
    PointHistory() : points_(1) {}

    /// Latest epoch (0 if nothing was recorded)
    uint64_t Epoch() const { return points_.size() - 1; }

    /// Point at an epoch; throws PreconditionError(NotFound) when out of range
    const Point& At(uint64_t epoch) const;

    const Point& Latest() const { return points_.back(); }

    /// Largest epoch whose timestamp is <= t (0 if none)
    uint64_t FindEpoch(Timestamp t) const;

    /// Append, or replace the head when it has the same timestamp
    void Record(const Point& point, Journal& journal);

    const std::vector<Point>& Points() const { return points_; }

    /// Replace all points (restore); element 0 is the sentinel
    void Assign(std::vector<Point> points);

private:
    std::vector<Point> points_;
};

// ============================================================================
// SlopeChangeSchedule
// ============================================================================

/**
 * Sparse map from a future week boundary to the (negative) slope delta
 * applied to the aggregate line when replay reaches it. Entries are read
 * during replay, never removed.
 */
class SlopeChangeSchedule {
public:
    /// Scheduled delta at ts (0 if none)
    Amount At(Timestamp ts) const;

    void Set(Timestamp ts, Amount delta, Journal& journal);

    size_t Size() const { return changes_.size(); }

    const std::map<Timestamp, Amount>& Entries() const { return changes_; }

    void Assign(std::map<Timestamp, Amount> changes);

private:
    std::map<Timestamp, Amount> changes_;
};

// ============================================================================
// Replay
// ============================================================================

/// Default bound on replay iterations (about five years of weeks)
constexpr int DEFAULT_MAX_REPLAY_WEEKS = 255;

/**
 * Advance `point` to time `to`, one week boundary at a time, applying the
 * scheduled slope changes and clamping bias and slope at zero. Every week
 * boundary strictly before `to` is reported to `onBoundary`.
 *
 * Returns false if `maxWeeks` iterations were exhausted before reaching
 * `to`; the point is then left at the last boundary reached.
 */
bool ReplayDecay(Point& point, Timestamp to, const SlopeChangeSchedule& schedule,
                 int maxWeeks, const std::function<void(const Point&)>& onBoundary = nullptr);

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_POINT_HISTORY_H
