// VELEDGER - Emission Schedule Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/rewards/emission_schedule.h"

namespace veledger {
namespace rewards {

EmissionSchedule::EmissionSchedule(Timestamp genesis, Amount baseRate, Amount nodeRate,
                                   Amount threshold) {
    base_.Push(genesis, baseRate);
    node_.Push(genesis, nodeRate);
    threshold_.Push(genesis, threshold);
}

EmissionSchedule::State EmissionSchedule::Export() const {
    State state;
    state.baseRates = base_.Entries();
    state.nodeRates = node_.Entries();
    state.thresholds = threshold_.Entries();
    return state;
}

void EmissionSchedule::Import(State state) {
    Series base;
    Series node;
    Series threshold;
    base.Assign(std::move(state.baseRates));
    node.Assign(std::move(state.nodeRates));
    threshold.Assign(std::move(state.thresholds));

    base_ = std::move(base);
    node_ = std::move(node);
    threshold_ = std::move(threshold);
}

} // namespace rewards
} // namespace veledger
