// VELEDGER - Clock Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/util/clock.h"
#include "veledger/core/errors.h"

#include <algorithm>
#include <chrono>

namespace veledger {
namespace util {

Timestamp SystemClock::Now() const {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::lock_guard<std::mutex> lock(mutex_);
    last_ = std::max<Timestamp>(last_, static_cast<Timestamp>(now));
    return last_;
}

Timestamp ManualClock::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::Set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (t < now_) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "clock cannot move backwards: " + std::to_string(t) +
                                " < " + std::to_string(now_));
    }
    now_ = t;
}

void ManualClock::Advance(Timestamp seconds) {
    if (seconds < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "negative clock advance: " + std::to_string(seconds));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += seconds;
}

} // namespace util
} // namespace veledger
