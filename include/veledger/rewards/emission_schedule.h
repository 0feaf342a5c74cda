// VELEDGER - Emission Schedule
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// The three time-varying reward parameters: base emission rate, node
// emission rate and node reward threshold. Rates are per unit of voting
// power per day, scaled by MULTIPLIER.

#ifndef VELEDGER_REWARDS_EMISSION_SCHEDULE_H
#define VELEDGER_REWARDS_EMISSION_SCHEDULE_H

#include "veledger/core/checkpoint_series.h"
#include "veledger/core/types.h"

#include <vector>

namespace veledger {
namespace rewards {

class EmissionSchedule {
public:
    using Series = CheckpointSeries<Amount>;

    struct State {
        std::vector<Series::Entry> baseRates;
        std::vector<Series::Entry> nodeRates;
        std::vector<Series::Entry> thresholds;
    };

    EmissionSchedule() = default;

    /// Seed all three series at `genesis`
    EmissionSchedule(Timestamp genesis, Amount baseRate, Amount nodeRate, Amount threshold);

    void PushBaseEmissionRate(Timestamp key, Amount rate) { base_.Push(key, rate); }
    void PushNodeEmissionRate(Timestamp key, Amount rate) { node_.Push(key, rate); }
    void PushNodeRewardThreshold(Timestamp key, Amount threshold) { threshold_.Push(key, threshold); }

    Amount BaseEmissionRateAt(Timestamp t) const { return base_.UpperLookup(t); }
    Amount NodeEmissionRateAt(Timestamp t) const { return node_.UpperLookup(t); }
    Amount NodeRewardThresholdAt(Timestamp t) const { return threshold_.UpperLookup(t); }

    Amount BaseEmissionRate() const { return base_.Latest(); }
    Amount NodeEmissionRate() const { return node_.Latest(); }
    Amount NodeRewardThreshold() const { return threshold_.Latest(); }

    const Series& BaseSeries() const { return base_; }
    const Series& NodeSeries() const { return node_; }
    const Series& ThresholdSeries() const { return threshold_; }

    State Export() const;
    void Import(State state);

private:
    Series base_;
    Series node_;
    Series threshold_;
};

} // namespace rewards
} // namespace veledger

#endif // VELEDGER_REWARDS_EMISSION_SCHEDULE_H
