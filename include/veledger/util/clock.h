// VELEDGER - Clock
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Timestamp source for the ledger. Every mutation reads "now" exactly once
// per operation so that all checkpoints written by it share one instant.

#ifndef VELEDGER_UTIL_CLOCK_H
#define VELEDGER_UTIL_CLOCK_H

#include "veledger/core/types.h"

#include <mutex>

namespace veledger {
namespace util {

/// Monotonic, non-decreasing timestamp source
class IClock {
public:
    virtual ~IClock() = default;

    /// Current Unix time in seconds
    virtual Timestamp Now() const = 0;
};

/// Wall clock, clamped so it never reports an earlier value than before
class SystemClock : public IClock {
public:
    Timestamp Now() const override;

private:
    mutable std::mutex mutex_;
    mutable Timestamp last_{0};
};

/// Manually driven clock for tests and scripted simulation
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override;

    /// Jump to an absolute time; throws PreconditionError if t < Now()
    void Set(Timestamp t);

    /// Move forward by seconds (must be >= 0)
    void Advance(Timestamp seconds);

    void AdvanceDays(int64_t days) { Advance(days * DAY); }
    void AdvanceWeeks(int64_t weeks) { Advance(weeks * WEEK); }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace util
} // namespace veledger

#endif // VELEDGER_UTIL_CLOCK_H
