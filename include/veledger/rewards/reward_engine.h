// VELEDGER - Reward Accrual Engine
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Rewards accrue per position per elapsed midnight:
//
//   reward(day) = power(day) * (base(day) + quality(day) * node(day) / 10) / MULTIPLIER
//
// where quality counts only if power(day) reaches the node reward threshold.
// Emission parameters are step functions that may change on any day, so
// owed rewards are summed day by day since the last claim.

#ifndef VELEDGER_REWARDS_REWARD_ENGINE_H
#define VELEDGER_REWARDS_REWARD_ENGINE_H

#include "veledger/core/types.h"
#include "veledger/escrow/interfaces.h"
#include "veledger/escrow/voting_escrow.h"
#include "veledger/rewards/emission_schedule.h"
#include "veledger/util/clock.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace veledger {

namespace util {
class ConfigManager;
}

namespace rewards {

/// Highest quality score a node can report
constexpr int MAX_NODE_QUALITY = 10;

/// Default ceiling on either emission rate (1% of power per day)
constexpr Amount DEFAULT_MAX_EMISSION_RATE = MULTIPLIER / 100;

struct RewardsConfig {
    Amount baseEmissionRate{0};
    Amount nodeEmissionRate{0};
    Amount nodeRewardThreshold{0};
    Amount maxEmissionRate{DEFAULT_MAX_EMISSION_RATE};

    /// First midnight of the emission schedule (0 = midnight of start-up)
    Timestamp genesis{0};

    /// Read the [rewards] section; throws PreconditionError on unusable values
    static RewardsConfig FromConfig(const util::ConfigManager& config);
};

/// Published after every successful claim
struct ClaimEvent {
    TokenId id{0};
    Address owner;
    Address recipient;
    Amount amount{0};
    Timestamp settledThrough{0};
    bool compounded{false};

    std::string ToString() const;
};

using ClaimListener = std::function<void(const ClaimEvent&)>;

class RewardEngine : public escrow::IRewardsOracle {
public:
    struct State {
        std::map<TokenId, Timestamp> lastClaim;
        EmissionSchedule::State emissions;
    };

    /**
     * @param config       Initial emission parameters
     * @param escrow       Ledger whose voting power earns rewards
     * @param clock        Timestamp source
     * @param rewardToken  Custody view of the reward token held by `self`
     * @param self         Address under which the engine holds rewards
     */
    RewardEngine(const RewardsConfig& config, escrow::VotingEscrow& escrow,
                 util::IClock& clock, escrow::IFungibleAsset& rewardToken, const Address& self);

    RewardEngine(const RewardEngine&) = delete;
    RewardEngine& operator=(const RewardEngine&) = delete;

    // ========================================================================
    // Accrual
    // ========================================================================

    /// Rewards owed to `id` through the latest midnight
    Amount Unclaimed(TokenId id) const override;

    /// Pay owed rewards to `recipient`; caller must own the position
    Amount Claim(const Address& caller, TokenId id, const Address& recipient);

    /// Claim and re-lock the reward into the same position
    Amount CompoundLockRewards(const Address& caller, TokenId id);

    // ========================================================================
    // Governance
    // ========================================================================

    void SetBaseEmissionRate(const Address& caller, Amount rate);
    void SetNodeEmissionRate(const Address& caller, Amount rate);
    void SetNodeRewardThreshold(const Address& caller, Amount threshold);
    void SetNodeProperties(const Address& caller, const escrow::INodeProperties* nodes);

    /// Recover reward tokens held by the engine
    void WithdrawToken(const Address& caller, const Address& recipient, Amount amount);

    // ========================================================================
    // Queries
    // ========================================================================

    Amount BaseEmissionRateAt(Timestamp t) const;
    Amount NodeEmissionRateAt(Timestamp t) const;
    Amount NodeRewardThresholdAt(Timestamp t) const;
    Amount MaxEmissionRate() const { return maxEmissionRate_; }

    Timestamp Genesis() const { return genesis_; }

    /// Most recent midnight at or before now
    Timestamp LatestMidnight() const;

    /// Midnight through which `id` was settled (0 if never claimed)
    Timestamp LastClaim(TokenId id) const;

    const Address& SelfAddress() const { return self_; }

    void AddListener(ClaimListener listener);

    State Export() const;
    void Import(State state);

private:
    Amount UnclaimedAt(TokenId id, Timestamp now) const;
    /// Check and advance the claim marker; the caller moves the tokens
    ClaimEvent Settle(const Address& caller, TokenId id, const Address& recipient,
                      bool compounded, Timestamp& previousMarker);
    void RestoreMarker(TokenId id, Timestamp previousMarker);
    void PayReward(const Address& recipient, Amount amount);
    void RequireGovernance(const Address& caller) const;
    void CheckEmissionRate(Amount rate) const;
    void Publish(const ClaimEvent& event);

    escrow::VotingEscrow& escrow_;
    util::IClock& clock_;
    escrow::IFungibleAsset& token_;
    Address self_;
    const escrow::INodeProperties* nodes_{nullptr};

    Amount maxEmissionRate_;
    Timestamp genesis_;
    EmissionSchedule schedule_;
    std::map<TokenId, Timestamp> lastClaim_;

    bool entered_{false};
    std::vector<ClaimListener> listeners_;
};

} // namespace rewards
} // namespace veledger

#endif // VELEDGER_REWARDS_REWARD_ENGINE_H
