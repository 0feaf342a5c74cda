// VELEDGER - Point History Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/escrow/point_history.h"
#include "veledger/util/logging.h"

#include <algorithm>
#include <sstream>

namespace veledger {
namespace escrow {

// ============================================================================
// Point / LockedBalance
// ============================================================================

Amount Point::ValueAt(Timestamp t) const {
    Amount value = CheckedSub(bias, CheckedMul(slope, static_cast<Amount>(t - ts)));
    return value < 0 ? 0 : value;
}

std::string Point::ToString() const {
    std::ostringstream oss;
    oss << "Point(bias=" << AmountToString(bias)
        << ", slope=" << AmountToString(slope)
        << ", ts=" << ts
        << ", blk=" << blk << ")";
    return oss.str();
}

Point LockedBalance::ToPoint(Timestamp now) const {
    Point p;
    if (end > now && amount > 0) {
        p.slope = amount / static_cast<Amount>(MAXTIME);
        p.bias = CheckedMul(p.slope, static_cast<Amount>(end - now));
    }
    return p;
}

std::string LockedBalance::ToString() const {
    std::ostringstream oss;
    oss << "Locked(amount=" << FormatAmount(amount) << ", end=" << end << ")";
    return oss.str();
}

// ============================================================================
// PointHistory
// ============================================================================

const Point& PointHistory::At(uint64_t epoch) const {
    if (epoch >= points_.size()) {
        throw PreconditionError(ErrorCode::NotFound,
                                "epoch " + std::to_string(epoch) + " beyond latest " +
                                std::to_string(Epoch()));
    }
    return points_[epoch];
}

uint64_t PointHistory::FindEpoch(Timestamp t) const {
    // Binary search over epochs 1..Epoch() (timestamps strictly increasing)
    auto first = points_.begin() + 1;
    auto it = std::upper_bound(first, points_.end(), t,
                               [](Timestamp lhs, const Point& rhs) { return lhs < rhs.ts; });
    return static_cast<uint64_t>(it - first);
}

void PointHistory::Record(const Point& point, Journal& journal) {
    const Point& head = points_.back();
    if (Epoch() > 0 && point.ts == head.ts) {
        journal.Assign(points_.back(), point);
        return;
    }
    if (Epoch() > 0 && point.ts < head.ts) {
        LOG_ERROR(util::LogCategory::CHECKPOINT)
            << "Out-of-order checkpoint at " << point.ts << " after " << head.ts;
        throw InvariantError("checkpoint at " + std::to_string(point.ts) +
                             " precedes head at " + std::to_string(head.ts),
                             ErrorCode::CheckpointUnorderedInsertion);
    }
    journal.PushBack(points_, point);
}

void PointHistory::Assign(std::vector<Point> points) {
    if (points.empty()) {
        points.resize(1);
    }
    for (size_t i = 2; i < points.size(); ++i) {
        if (points[i].ts <= points[i - 1].ts) {
            throw InvariantError("point history timestamps not strictly increasing",
                                 ErrorCode::CheckpointUnorderedInsertion);
        }
    }
    points_ = std::move(points);
}

// ============================================================================
// SlopeChangeSchedule
// ============================================================================

Amount SlopeChangeSchedule::At(Timestamp ts) const {
    auto it = changes_.find(ts);
    return it == changes_.end() ? 0 : it->second;
}

void SlopeChangeSchedule::Set(Timestamp ts, Amount delta, Journal& journal) {
    if (ts % WEEK != 0) {
        throw InvariantError("slope change at non-week boundary " + std::to_string(ts));
    }
    journal.Put(changes_, ts, delta);
}

void SlopeChangeSchedule::Assign(std::map<Timestamp, Amount> changes) {
    changes_ = std::move(changes);
}

// ============================================================================
// Replay
// ============================================================================

bool ReplayDecay(Point& point, Timestamp to, const SlopeChangeSchedule& schedule,
                 int maxWeeks, const std::function<void(const Point&)>& onBoundary) {
    if (to < point.ts) {
        throw InvariantError("replay target " + std::to_string(to) +
                             " precedes point at " + std::to_string(point.ts));
    }

    Timestamp lastTs = point.ts;
    Timestamp ti = FloorToWeek(lastTs);

    for (int i = 0; i < maxWeeks; ++i) {
        ti += WEEK;
        Amount dSlope = 0;
        if (ti > to) {
            ti = to;
        } else {
            dSlope = schedule.At(ti);
        }

        point.bias = CheckedSub(point.bias, CheckedMul(point.slope, static_cast<Amount>(ti - lastTs)));
        point.slope = CheckedAdd(point.slope, dSlope);
        // Integer truncation in slopes can overshoot by a few base units
        if (point.bias < 0) point.bias = 0;
        if (point.slope < 0) point.slope = 0;

        lastTs = ti;
        point.ts = ti;

        if (ti == to) {
            return true;
        }
        if (onBoundary) {
            onBoundary(point);
        }
    }
    return false;
}

} // namespace escrow
} // namespace veledger
