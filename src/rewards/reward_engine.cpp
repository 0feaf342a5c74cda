// VELEDGER - Reward Accrual Engine Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/rewards/reward_engine.h"
#include "veledger/escrow/journal.h"
#include "veledger/util/config.h"
#include "veledger/util/logging.h"

#include <sstream>

namespace veledger {
namespace rewards {

// ============================================================================
// RewardsConfig
// ============================================================================

namespace {

Amount ReadRate(const util::ConfigManager& config, const char* key, Amount defaultValue) {
    const char* section = util::ConfigKeys::REWARDS_SECTION;
    if (!config.HasKey(key, section)) {
        return defaultValue;
    }
    auto value = config.TryGetAmount(key, section);
    if (!value || *value < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                std::string("rewards.") + key + " is not a valid amount");
    }
    return *value;
}

} // namespace

RewardsConfig RewardsConfig::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    RewardsConfig cfg;
    cfg.baseEmissionRate = ReadRate(config, keys::BASE_EMISSION_RATE, cfg.baseEmissionRate);
    cfg.nodeEmissionRate = ReadRate(config, keys::NODE_EMISSION_RATE, cfg.nodeEmissionRate);
    cfg.nodeRewardThreshold = ReadRate(config, keys::NODE_REWARD_THRESHOLD, cfg.nodeRewardThreshold);
    cfg.maxEmissionRate = ReadRate(config, keys::MAX_EMISSION_RATE, cfg.maxEmissionRate);

    if (config.HasKey(keys::GENESIS, keys::REWARDS_SECTION)) {
        auto genesis = config.TryGetInt(keys::GENESIS, keys::REWARDS_SECTION);
        if (!genesis || *genesis < 0) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "rewards.genesis must be a non-negative timestamp");
        }
        cfg.genesis = *genesis;
    }

    if (cfg.baseEmissionRate > cfg.maxEmissionRate || cfg.nodeEmissionRate > cfg.maxEmissionRate) {
        throw PreconditionError(ErrorCode::EmissionRateTooHigh,
                                "configured emission rate exceeds rewards.max_emission_rate");
    }
    return cfg;
}

std::string ClaimEvent::ToString() const {
    std::ostringstream oss;
    oss << (compounded ? "Compound" : "Claim") << "(id=" << id
        << ", owner=0x" << owner.ToHex()
        << ", recipient=0x" << recipient.ToHex()
        << ", amount=" << FormatAmount(amount)
        << ", through=" << settledThrough << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

RewardEngine::RewardEngine(const RewardsConfig& config, escrow::VotingEscrow& escrow,
                           util::IClock& clock, escrow::IFungibleAsset& rewardToken,
                           const Address& self)
    : escrow_(escrow),
      clock_(clock),
      token_(rewardToken),
      self_(self),
      maxEmissionRate_(config.maxEmissionRate),
      genesis_(FloorToDay(config.genesis != 0 ? config.genesis : clock.Now())) {
    if (config.baseEmissionRate < 0 || config.nodeEmissionRate < 0 || config.nodeRewardThreshold < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "negative emission parameter");
    }
    CheckEmissionRate(config.baseEmissionRate);
    CheckEmissionRate(config.nodeEmissionRate);
    schedule_ = EmissionSchedule(genesis_, config.baseEmissionRate, config.nodeEmissionRate,
                                 config.nodeRewardThreshold);

    LOG_INFO(util::LogCategory::REWARDS)
        << "Reward engine genesis " << genesis_ << ", base rate " << config.baseEmissionRate
        << ", node rate " << config.nodeEmissionRate;
}

// ============================================================================
// Accrual
// ============================================================================

Timestamp RewardEngine::LatestMidnight() const {
    return FloorToDay(clock_.Now());
}

Timestamp RewardEngine::LastClaim(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    auto it = lastClaim_.find(id);
    return it == lastClaim_.end() ? 0 : it->second;
}

Amount RewardEngine::Unclaimed(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    return UnclaimedAt(id, clock_.Now());
}

Amount RewardEngine::UnclaimedAt(TokenId id, Timestamp now) const {
    Timestamp createdAt = escrow_.CreatedAt(id);
    if (createdAt == 0) {
        return 0;
    }

    auto it = lastClaim_.find(id);
    Timestamp last = (it != lastClaim_.end()) ? it->second : FloorToDay(createdAt);
    Timestamp latest = FloorToDay(now);

    Amount reward = 0;
    Amount previousPower = escrow_.VotingPowerOf(id, last);

    for (Timestamp day = last + DAY; day <= latest; day += DAY) {
        if (day - last > MAXTIME) {
            break;
        }
        Amount power = escrow_.VotingPowerOf(id, day);
        if (power == 0 && previousPower != 0) {
            // Expired at this boundary
            break;
        }
        previousPower = power;
        if (power == 0) {
            continue;
        }

        int quality = 0;
        if (nodes_ != nullptr && power >= schedule_.NodeRewardThresholdAt(day)) {
            quality = nodes_->QualityOf(id, day);
            if (quality < 0 || quality > MAX_NODE_QUALITY) {
                LOG_ERROR(util::LogCategory::REWARDS)
                    << "Node quality " << quality << " for position " << id << " out of range";
                throw InvariantError("node quality " + std::to_string(quality) +
                                     " outside 0.." + std::to_string(MAX_NODE_QUALITY));
            }
        }

        Amount rate = CheckedAdd(schedule_.BaseEmissionRateAt(day),
                                 CheckedMul(quality, schedule_.NodeEmissionRateAt(day)) / MAX_NODE_QUALITY);
        reward = CheckedAdd(reward, MulDiv(power, rate, MULTIPLIER));
    }
    return reward;
}

ClaimEvent RewardEngine::Settle(const Address& caller, TokenId id, const Address& recipient,
                               bool compounded, Timestamp& previousMarker) {
    Address owner = escrow_.OwnerOf(id);
    if (caller != owner) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "caller 0x" + caller.ToHex() + " does not own position " +
                                std::to_string(id));
    }

    Timestamp now = clock_.Now();
    Amount reward = UnclaimedAt(id, now);
    if (reward <= 0) {
        throw PreconditionError(ErrorCode::NoUnclaimedRewards,
                                "position " + std::to_string(id) + " has no unclaimed rewards");
    }
    Amount balance = token_.BalanceOf(self_);
    if (balance < reward) {
        throw TransferError(ErrorCode::InsufficientBalance,
                            "reward balance " + FormatAmount(balance) + " below owed " +
                            FormatAmount(reward));
    }

    auto it = lastClaim_.find(id);
    previousMarker = (it != lastClaim_.end()) ? it->second : 0;
    Timestamp settledThrough = FloorToDay(now);
    lastClaim_[id] = settledThrough;

    ClaimEvent event;
    event.id = id;
    event.owner = owner;
    event.recipient = recipient;
    event.amount = reward;
    event.settledThrough = settledThrough;
    event.compounded = compounded;
    return event;
}

Amount RewardEngine::Claim(const Address& caller, TokenId id, const Address& recipient) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    escrow::ReentrancyGuard guard(entered_);

    if (recipient.IsNull()) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot claim to the null address");
    }

    Timestamp previousMarker = 0;
    ClaimEvent event = Settle(caller, id, recipient, false, previousMarker);
    try {
        PayReward(recipient, event.amount);
    } catch (const LedgerError&) {
        RestoreMarker(id, previousMarker);
        throw;
    }

    Publish(event);
    return event.amount;
}

Amount RewardEngine::CompoundLockRewards(const Address& caller, TokenId id) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    escrow::ReentrancyGuard guard(entered_);

    if (token_.AssetId() != escrow_.Asset().AssetId()) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "reward token " + token_.AssetId() + " is not the escrowed token " +
                                escrow_.Asset().AssetId());
    }

    Timestamp previousMarker = 0;
    ClaimEvent event = Settle(caller, id, self_, true, previousMarker);
    try {
        // The escrow pulls the reward straight out of the engine's balance
        escrow_.DepositFor(self_, id, event.amount);
    } catch (const LedgerError&) {
        RestoreMarker(id, previousMarker);
        throw;
    }

    Publish(event);
    return event.amount;
}

void RewardEngine::RestoreMarker(TokenId id, Timestamp previousMarker) {
    if (previousMarker == 0) {
        lastClaim_.erase(id);
    } else {
        lastClaim_[id] = previousMarker;
    }
}

void RewardEngine::PayReward(const Address& recipient, Amount amount) {
    Amount before = token_.BalanceOf(self_);
    if (!token_.Transfer(recipient, amount)) {
        LOG_WARN(util::LogCategory::REWARDS)
            << "Reward transfer of " << FormatAmount(amount) << " to " << recipient << " refused";
        throw TransferError(ErrorCode::TransferFailed,
                            "reward transfer of " + FormatAmount(amount) + " failed");
    }
    Amount sent = CheckedSub(before, token_.BalanceOf(self_));
    if (sent != amount) {
        throw TransferError(ErrorCode::TransferFailed,
                            "reward transfer moved " + FormatAmount(sent) + " instead of " +
                            FormatAmount(amount));
    }
}

void RewardEngine::Publish(const ClaimEvent& event) {
    LOG_INFO(util::LogCategory::REWARDS) << event.ToString();
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::REWARDS) << "Claim listener failed: " << e.what();
        }
    }
}

void RewardEngine::AddListener(ClaimListener listener) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    listeners_.push_back(std::move(listener));
}

// ============================================================================
// Governance
// ============================================================================

void RewardEngine::RequireGovernance(const Address& caller) const {
    const Address& governance = escrow_.Governance();
    if (governance.IsNull() || caller != governance) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "caller 0x" + caller.ToHex() + " is not governance");
    }
}

void RewardEngine::CheckEmissionRate(Amount rate) const {
    if (rate < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "negative emission rate");
    }
    if (rate > maxEmissionRate_) {
        throw PreconditionError(ErrorCode::EmissionRateTooHigh,
                                "emission rate " + AmountToString(rate) + " exceeds maximum " +
                                AmountToString(maxEmissionRate_));
    }
}

void RewardEngine::SetBaseEmissionRate(const Address& caller, Amount rate) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    RequireGovernance(caller);
    CheckEmissionRate(rate);
    Amount previous = schedule_.BaseEmissionRate();
    schedule_.PushBaseEmissionRate(clock_.Now(), rate);
    LOG_INFO(util::LogCategory::REWARDS)
        << "Base emission rate " << previous << " -> " << rate;
}

void RewardEngine::SetNodeEmissionRate(const Address& caller, Amount rate) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    RequireGovernance(caller);
    CheckEmissionRate(rate);
    Amount previous = schedule_.NodeEmissionRate();
    schedule_.PushNodeEmissionRate(clock_.Now(), rate);
    LOG_INFO(util::LogCategory::REWARDS)
        << "Node emission rate " << previous << " -> " << rate;
}

void RewardEngine::SetNodeRewardThreshold(const Address& caller, Amount threshold) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    RequireGovernance(caller);
    if (threshold < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "negative node reward threshold");
    }
    Amount previous = schedule_.NodeRewardThreshold();
    schedule_.PushNodeRewardThreshold(clock_.Now(), threshold);
    LOG_INFO(util::LogCategory::REWARDS)
        << "Node reward threshold " << FormatAmount(previous) << " -> " << FormatAmount(threshold);
}

void RewardEngine::SetNodeProperties(const Address& caller, const escrow::INodeProperties* nodes) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    RequireGovernance(caller);
    nodes_ = nodes;
}

void RewardEngine::WithdrawToken(const Address& caller, const Address& recipient, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    escrow::ReentrancyGuard guard(entered_);
    RequireGovernance(caller);
    if (amount <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "withdrawal amount must be positive");
    }
    Amount balance = token_.BalanceOf(self_);
    if (balance < amount) {
        throw TransferError(ErrorCode::InsufficientBalance,
                            "reward balance " + FormatAmount(balance) + " below " + FormatAmount(amount));
    }
    PayReward(recipient, amount);
    LOG_INFO(util::LogCategory::REWARDS)
        << "Withdrew " << FormatAmount(amount) << " reward tokens to " << recipient;
}

// ============================================================================
// Queries
// ============================================================================

Amount RewardEngine::BaseEmissionRateAt(Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    return schedule_.BaseEmissionRateAt(t);
}

Amount RewardEngine::NodeEmissionRateAt(Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    return schedule_.NodeEmissionRateAt(t);
}

Amount RewardEngine::NodeRewardThresholdAt(Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    return schedule_.NodeRewardThresholdAt(t);
}

// ============================================================================
// Persistence
// ============================================================================

RewardEngine::State RewardEngine::Export() const {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    State state;
    state.lastClaim = lastClaim_;
    state.emissions = schedule_.Export();
    return state;
}

void RewardEngine::Import(State state) {
    std::lock_guard<std::recursive_mutex> lock(escrow_.LedgerMutex());
    for (const auto& entry : state.lastClaim) {
        if (entry.second % DAY != 0) {
            throw InvariantError("claim marker of position " + std::to_string(entry.first) +
                                 " is not a midnight");
        }
    }
    EmissionSchedule schedule;
    schedule.Import(std::move(state.emissions));
    schedule_ = std::move(schedule);
    lastClaim_ = std::move(state.lastClaim);
}

} // namespace rewards
} // namespace veledger
