// VELEDGER - Reward Engine Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "veledger/asset/token_ledger.h"
#include "veledger/node/node_registry.h"
#include "veledger/rewards/reward_engine.h"
#include "veledger/util/config.h"

#include <memory>
#include <vector>

using namespace veledger;
using namespace veledger::rewards;

namespace {

constexpr Timestamp START = 1700000000;
constexpr Timestamp YEAR = 365 * DAY;
constexpr Amount BASE_RATE = MULTIPLIER / 1000;

const Address ESCROW = Address::FromLabel(200);
const Address REWARDS = Address::FromLabel(201);
const Address GOVERNANCE = Address::FromLabel(202);

escrow::LedgerConfig EscrowConfig() {
    escrow::LedgerConfig cfg;
    cfg.governance = GOVERNANCE;
    return cfg;
}

RewardsConfig EngineConfig() {
    RewardsConfig cfg;
    cfg.baseEmissionRate = BASE_RATE;
    return cfg;
}

} // namespace

class RewardEngineTest : public ::testing::Test {
protected:
    RewardEngineTest()
        : clock_(START),
          token_("TOKEN"),
          escrowCustody_(token_.Custody(ESCROW)),
          rewardCustody_(token_.Custody(REWARDS)),
          escrow_(EscrowConfig(), clock_, *escrowCustody_, ESCROW),
          engine_(EngineConfig(), escrow_, clock_, *rewardCustody_, REWARDS) {
        token_.Mint(alice_, 10000 * COIN);
        token_.Mint(REWARDS, 1000000 * COIN);
        engine_.AddListener([this](const ClaimEvent& e) { claims_.push_back(e); });
    }

    template<typename Fn>
    ErrorCode CodeOf(Fn&& fn) {
        try {
            fn();
        } catch (const LedgerError& e) {
            return e.code();
        }
        return ErrorCode::OK;
    }

    /// Reward for one midnight at the given rate
    Amount DailyReward(TokenId id, Timestamp day, Amount rate) const {
        return MulDiv(escrow_.VotingPowerOf(id, day), rate, MULTIPLIER);
    }

    util::ManualClock clock_;
    asset::TokenLedger token_;
    std::shared_ptr<escrow::IFungibleAsset> escrowCustody_;
    std::shared_ptr<escrow::IFungibleAsset> rewardCustody_;
    escrow::VotingEscrow escrow_;
    RewardEngine engine_;
    std::vector<ClaimEvent> claims_;

    Address alice_ = Address::FromLabel(1);
    Address bob_ = Address::FromLabel(2);
};

// ============================================================================
// Accrual
// ============================================================================

TEST_F(RewardEngineTest, GenesisIsMidnightOfStartup) {
    EXPECT_EQ(engine_.Genesis(), FloorToDay(START));
    EXPECT_EQ(engine_.BaseEmissionRateAt(engine_.Genesis()), BASE_RATE);
    EXPECT_EQ(engine_.BaseEmissionRateAt(engine_.Genesis() - 1), 0);
    EXPECT_EQ(engine_.MaxEmissionRate(), DEFAULT_MAX_EMISSION_RATE);
}

TEST_F(RewardEngineTest, NothingOwedBeforeFirstMidnight) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    EXPECT_EQ(engine_.Unclaimed(id), 0);
    EXPECT_EQ(CodeOf([&] { engine_.Claim(alice_, id, alice_); }), ErrorCode::NoUnclaimedRewards);
    EXPECT_EQ(engine_.Unclaimed(999), 0);
}

TEST_F(RewardEngineTest, AccruesOncePerMidnight) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    Timestamp firstMidnight = FloorToDay(START) + DAY;

    clock_.Set(firstMidnight - 1);
    EXPECT_EQ(engine_.Unclaimed(id), 0);

    clock_.Set(firstMidnight);
    Amount day1 = DailyReward(id, firstMidnight, BASE_RATE);
    EXPECT_GT(day1, 0);
    EXPECT_EQ(engine_.Unclaimed(id), day1);

    Amount previous = day1;
    for (int i = 0; i < 5; ++i) {
        clock_.AdvanceDays(1);
        Amount owed = engine_.Unclaimed(id);
        EXPECT_GT(owed, previous);
        previous = owed;
    }
    // Power decays, so each later day earns a little less
    EXPECT_LT(previous, 6 * day1);
}

TEST_F(RewardEngineTest, ClaimPaysAndResets) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(3);
    Amount owed = engine_.Unclaimed(id);
    ASSERT_GT(owed, 0);

    EXPECT_EQ(CodeOf([&] { engine_.Claim(bob_, id, bob_); }), ErrorCode::NotAuthorized);
    EXPECT_EQ(CodeOf([&] { engine_.Claim(alice_, id, Address()); }), ErrorCode::InvalidArgument);

    EXPECT_EQ(engine_.Claim(alice_, id, bob_), owed);
    EXPECT_EQ(token_.BalanceOf(bob_), owed);
    EXPECT_EQ(token_.BalanceOf(REWARDS), 1000000 * COIN - owed);
    EXPECT_EQ(engine_.Unclaimed(id), 0);
    EXPECT_EQ(engine_.LastClaim(id), engine_.LatestMidnight());
    EXPECT_EQ(CodeOf([&] { engine_.Claim(alice_, id, alice_); }), ErrorCode::NoUnclaimedRewards);

    ASSERT_EQ(claims_.size(), 1u);
    EXPECT_EQ(claims_[0].amount, owed);
    EXPECT_EQ(claims_[0].recipient, bob_);
    EXPECT_FALSE(claims_[0].compounded);

    clock_.AdvanceDays(1);
    EXPECT_EQ(engine_.Unclaimed(id), DailyReward(id, engine_.LatestMidnight(), BASE_RATE));
}

TEST_F(RewardEngineTest, RefusedPayoutKeepsRewardsOwed) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    Amount owed = engine_.Unclaimed(id);

    token_.SetTransferHook([](const Address&, const Address&, Amount) -> std::optional<Amount> {
        return std::nullopt;
    });
    EXPECT_THROW(engine_.Claim(alice_, id, alice_), TransferError);
    token_.ClearTransferHook();

    EXPECT_EQ(engine_.Unclaimed(id), owed);
    EXPECT_EQ(engine_.LastClaim(id), 0);
    EXPECT_TRUE(claims_.empty());
}

TEST_F(RewardEngineTest, InsufficientRewardBalance) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    engine_.WithdrawToken(GOVERNANCE, bob_, 1000000 * COIN);

    EXPECT_EQ(CodeOf([&] { engine_.Claim(alice_, id, alice_); }), ErrorCode::InsufficientBalance);
    EXPECT_GT(engine_.Unclaimed(id), 0);
}

TEST_F(RewardEngineTest, ExpiredLockStopsAccruing) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 3 * WEEK);
    Timestamp end = escrow_.Locked(id).end;

    clock_.Set(end + 2 * DAY);
    Amount owed = engine_.Unclaimed(id);
    EXPECT_GT(owed, 0);

    clock_.AdvanceDays(30);
    EXPECT_EQ(engine_.Unclaimed(id), owed);
}

// ============================================================================
// Compounding
// ============================================================================

TEST_F(RewardEngineTest, CompoundRelocksIntoPosition) {
    escrow_.SetRewardsOracle(GOVERNANCE, &engine_);
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    Amount owed = engine_.Unclaimed(id);

    EXPECT_EQ(engine_.CompoundLockRewards(alice_, id), owed);

    EXPECT_EQ(escrow_.Locked(id).amount, 1000 * COIN + owed);
    EXPECT_EQ(token_.BalanceOf(ESCROW), 1000 * COIN + owed);
    EXPECT_EQ(token_.BalanceOf(REWARDS), 1000000 * COIN - owed);
    EXPECT_EQ(engine_.Unclaimed(id), 0);
    ASSERT_EQ(claims_.size(), 1u);
    EXPECT_TRUE(claims_[0].compounded);
    escrow_.SetRewardsOracle(GOVERNANCE, nullptr);
}

TEST_F(RewardEngineTest, CompoundRequiresEscrowedToken) {
    asset::TokenLedger other("OTHER");
    auto otherCustody = other.Custody(REWARDS);
    RewardEngine foreign(EngineConfig(), escrow_, clock_, *otherCustody, REWARDS);
    other.Mint(REWARDS, 1000 * COIN);

    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    EXPECT_EQ(CodeOf([&] { foreign.CompoundLockRewards(alice_, id); }), ErrorCode::InvalidArgument);
    EXPECT_GT(foreign.Claim(alice_, id, alice_), 0);
}

TEST_F(RewardEngineTest, PendingRewardsBlockEscrowChanges) {
    escrow_.SetRewardsOracle(GOVERNANCE, &engine_);
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(1);

    EXPECT_EQ(CodeOf([&] { escrow_.IncreaseAmount(alice_, id, COIN); }), ErrorCode::PendingRewards);
    engine_.Claim(alice_, id, alice_);
    escrow_.IncreaseAmount(alice_, id, COIN);
    EXPECT_EQ(escrow_.Locked(id).amount, 1001 * COIN);
    escrow_.SetRewardsOracle(GOVERNANCE, nullptr);
}

// ============================================================================
// Emission Parameters
// ============================================================================

TEST_F(RewardEngineTest, EmissionRateCeiling) {
    EXPECT_EQ(CodeOf([&] { engine_.SetBaseEmissionRate(alice_, BASE_RATE); }),
              ErrorCode::NotAuthorized);
    EXPECT_EQ(CodeOf([&] { engine_.SetBaseEmissionRate(GOVERNANCE, DEFAULT_MAX_EMISSION_RATE + 1); }),
              ErrorCode::EmissionRateTooHigh);
    EXPECT_EQ(CodeOf([&] { engine_.SetNodeEmissionRate(GOVERNANCE, DEFAULT_MAX_EMISSION_RATE + 1); }),
              ErrorCode::EmissionRateTooHigh);
    EXPECT_EQ(CodeOf([&] { engine_.SetBaseEmissionRate(GOVERNANCE, -1); }),
              ErrorCode::InvalidArgument);
    engine_.SetBaseEmissionRate(GOVERNANCE, DEFAULT_MAX_EMISSION_RATE);

    RewardsConfig cfg = EngineConfig();
    cfg.baseEmissionRate = DEFAULT_MAX_EMISSION_RATE * 2;
    EXPECT_THROW({ RewardEngine tooFast(cfg, escrow_, clock_, *rewardCustody_, REWARDS); },
                 PreconditionError);
}

TEST_F(RewardEngineTest, RateChangesApplyFromNextMidnight) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    Amount before = engine_.Unclaimed(id);

    engine_.SetBaseEmissionRate(GOVERNANCE, 0);
    EXPECT_EQ(engine_.BaseEmissionRateAt(clock_.Now()), 0);
    EXPECT_EQ(engine_.BaseEmissionRateAt(engine_.LatestMidnight()), BASE_RATE);

    clock_.AdvanceDays(3);
    EXPECT_EQ(engine_.Unclaimed(id), before);

    engine_.SetBaseEmissionRate(GOVERNANCE, 2 * BASE_RATE);
    clock_.AdvanceDays(1);
    EXPECT_EQ(engine_.Unclaimed(id),
              before + DailyReward(id, engine_.LatestMidnight(), 2 * BASE_RATE));
}

TEST_F(RewardEngineTest, NodeQualityBoostsRewards) {
    node::NodeRegistry nodes;
    engine_.SetNodeProperties(GOVERNANCE, &nodes);
    engine_.SetNodeEmissionRate(GOVERNANCE, DEFAULT_MAX_EMISSION_RATE);

    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    nodes.Attach(id);
    nodes.SetQuality(id, 5, START);

    clock_.AdvanceDays(1);
    Timestamp day = engine_.LatestMidnight();
    Amount rate = BASE_RATE + 5 * DEFAULT_MAX_EMISSION_RATE / MAX_NODE_QUALITY;
    EXPECT_EQ(engine_.Unclaimed(id), DailyReward(id, day, rate));

    // Below the threshold quality does not count
    engine_.SetNodeRewardThreshold(GOVERNANCE, 5000 * COIN);
    clock_.AdvanceDays(1);
    EXPECT_EQ(engine_.Unclaimed(id),
              DailyReward(id, day, rate) + DailyReward(id, engine_.LatestMidnight(), BASE_RATE));
    EXPECT_EQ(engine_.NodeRewardThresholdAt(clock_.Now()), 5000 * COIN);
    engine_.SetNodeProperties(GOVERNANCE, nullptr);
}

TEST_F(RewardEngineTest, WithdrawToken) {
    EXPECT_EQ(CodeOf([&] { engine_.WithdrawToken(alice_, alice_, COIN); }), ErrorCode::NotAuthorized);
    EXPECT_EQ(CodeOf([&] { engine_.WithdrawToken(GOVERNANCE, bob_, 0); }), ErrorCode::InvalidArgument);
    EXPECT_EQ(CodeOf([&] { engine_.WithdrawToken(GOVERNANCE, bob_, 2000000 * COIN); }),
              ErrorCode::InsufficientBalance);
    engine_.WithdrawToken(GOVERNANCE, bob_, 10 * COIN);
    EXPECT_EQ(token_.BalanceOf(bob_), 10 * COIN);
}

// ============================================================================
// Persistence and Configuration
// ============================================================================

TEST_F(RewardEngineTest, ExportImport) {
    TokenId id = escrow_.CreateLock(alice_, 1000 * COIN, 2 * YEAR);
    clock_.AdvanceDays(2);
    engine_.Claim(alice_, id, alice_);
    engine_.SetBaseEmissionRate(GOVERNANCE, 2 * BASE_RATE);

    RewardEngine::State state = engine_.Export();
    RewardEngine copy(RewardsConfig(), escrow_, clock_, *rewardCustody_, REWARDS);
    copy.Import(state);

    EXPECT_EQ(copy.LastClaim(id), engine_.LastClaim(id));
    EXPECT_EQ(copy.BaseEmissionRateAt(clock_.Now()), 2 * BASE_RATE);
    clock_.AdvanceDays(1);
    EXPECT_EQ(copy.Unclaimed(id), engine_.Unclaimed(id));

    state.lastClaim[id] += 1;
    EXPECT_THROW(copy.Import(state), InvariantError);
}

TEST(RewardsConfigTest, FromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[rewards]\n"
        "base_emission_rate = 0.001\n"
        "node_emission_rate = 0.005\n"
        "node_reward_threshold = 100\n"
        "genesis = 1699920000\n").success);

    RewardsConfig cfg = RewardsConfig::FromConfig(config);
    EXPECT_EQ(cfg.baseEmissionRate, MULTIPLIER / 1000);
    EXPECT_EQ(cfg.nodeEmissionRate, MULTIPLIER / 200);
    EXPECT_EQ(cfg.nodeRewardThreshold, 100 * COIN);
    EXPECT_EQ(cfg.maxEmissionRate, DEFAULT_MAX_EMISSION_RATE);
    EXPECT_EQ(cfg.genesis, 1699920000);
}

TEST(RewardsConfigTest, RejectsUnusableValues) {
    util::ConfigManager tooHigh;
    ASSERT_TRUE(tooHigh.ParseString("[rewards]\nbase_emission_rate = 0.5\n").success);
    try {
        RewardsConfig::FromConfig(tooHigh);
        FAIL() << "expected PreconditionError";
    } catch (const PreconditionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmissionRateTooHigh);
    }

    util::ConfigManager negative;
    ASSERT_TRUE(negative.ParseString("[rewards]\nnode_emission_rate = -1\n").success);
    EXPECT_THROW(RewardsConfig::FromConfig(negative), PreconditionError);

    util::ConfigManager badGenesis;
    ASSERT_TRUE(badGenesis.ParseString("[rewards]\ngenesis = soon\n").success);
    EXPECT_THROW(RewardsConfig::FromConfig(badGenesis), PreconditionError);
}
