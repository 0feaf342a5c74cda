// VELEDGER - Voting Escrow Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/escrow/voting_escrow.h"
#include "veledger/crypto/hash.h"
#include "veledger/util/config.h"
#include "veledger/util/logging.h"

#include <algorithm>
#include <sstream>

namespace veledger {
namespace escrow {

namespace {

/// Domain tag of the DelegateBySig digest
const char* const DELEGATION_DOMAIN = "veledger.delegation.v1";

Address ParseConfigAddress(const util::ConfigManager& config, const char* key) {
    auto value = config.TryGetString(key, util::ConfigKeys::ESCROW_SECTION);
    if (!value || value->empty()) {
        return Address();
    }
    Address addr = Address::FromHex(*value);
    if (addr.IsNull()) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                std::string("escrow.") + key + " is not a valid address: " + *value);
    }
    return addr;
}

} // namespace

// ============================================================================
// LedgerConfig
// ============================================================================

LedgerConfig LedgerConfig::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    const char* section = keys::ESCROW_SECTION;

    LedgerConfig cfg;
    cfg.name = config.GetString(keys::NAME, cfg.name, section);
    cfg.symbol = config.GetString(keys::SYMBOL, cfg.symbol, section);
    cfg.version = config.GetString(keys::VERSION, cfg.version, section);
    cfg.baseUri = config.GetString(keys::BASE_URI, cfg.baseUri, section);
    cfg.governance = ParseConfigAddress(config, keys::GOVERNANCE);
    cfg.treasury = ParseConfigAddress(config, keys::TREASURY);

    if (config.HasKey(keys::MIN_LOCK_AMOUNT, section)) {
        auto amount = config.TryGetAmount(keys::MIN_LOCK_AMOUNT, section);
        if (!amount || *amount < 0) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "escrow.min_lock_amount is not a valid amount");
        }
        cfg.minLockAmount = *amount;
    }

    if (config.HasKey(keys::LIQUIDATIONS_ENABLED, section)) {
        auto enabled = config.TryGetBool(keys::LIQUIDATIONS_ENABLED, section);
        if (!enabled) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "escrow.liquidations_enabled is not a boolean");
        }
        cfg.liquidationsEnabled = *enabled;
    }

    if (config.HasKey(keys::PENALTY_NUMERATOR, section)) {
        auto numerator = config.TryGetInt(keys::PENALTY_NUMERATOR, section);
        if (!numerator || *numerator < 0 || *numerator > static_cast<int64_t>(PENALTY_DENOMINATOR)) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "escrow.liquidation_penalty_numerator must be within 0..100000");
        }
        cfg.penaltyNumerator = *numerator;
    }

    if (config.HasKey(keys::MAX_REPLAY_WEEKS, section)) {
        auto weeks = config.TryGetInt(keys::MAX_REPLAY_WEEKS, section);
        if (!weeks || *weeks <= 0 || *weeks > 10000) {
            throw PreconditionError(ErrorCode::InvalidArgument,
                                    "escrow.max_replay_weeks must be within 1..10000");
        }
        cfg.maxReplayWeeks = static_cast<int>(*weeks);
    }

    return cfg;
}

// ============================================================================
// Events
// ============================================================================

const char* DepositTypeToString(DepositType type) {
    switch (type) {
        case DepositType::CreateLock:         return "create_lock";
        case DepositType::IncreaseAmount:     return "increase_amount";
        case DepositType::IncreaseUnlockTime: return "increase_unlock_time";
        case DepositType::DepositFor:         return "deposit_for";
        case DepositType::Merge:              return "merge";
        case DepositType::Split:              return "split";
    }
    return "unknown";
}

const char* EscrowEventTypeToString(EscrowEventType type) {
    switch (type) {
        case EscrowEventType::Deposit:              return "Deposit";
        case EscrowEventType::Withdraw:             return "Withdraw";
        case EscrowEventType::Liquidate:            return "Liquidate";
        case EscrowEventType::Merge:                return "Merge";
        case EscrowEventType::Split:                return "Split";
        case EscrowEventType::Transfer:             return "Transfer";
        case EscrowEventType::DelegateChanged:      return "DelegateChanged";
        case EscrowEventType::DelegateVotesChanged: return "DelegateVotesChanged";
        case EscrowEventType::Supply:               return "Supply";
    }
    return "Unknown";
}

std::string EscrowEvent::ToString() const {
    std::ostringstream oss;
    oss << EscrowEventTypeToString(type) << "(";
    switch (type) {
        case EscrowEventType::Deposit:
            oss << "id=" << id << ", type=" << DepositTypeToString(depositType)
                << ", payer=0x" << from.ToHex() << ", value=" << FormatAmount(amount)
                << ", end=" << lockEnd;
            break;
        case EscrowEventType::Withdraw:
            oss << "id=" << id << ", to=0x" << to.ToHex() << ", value=" << FormatAmount(amount);
            break;
        case EscrowEventType::Liquidate:
            oss << "id=" << id << ", to=0x" << to.ToHex() << ", value=" << FormatAmount(amount)
                << ", penalty=" << FormatAmount(penalty);
            break;
        case EscrowEventType::Merge:
            oss << "from=" << id << ", to=" << otherId << ", value=" << FormatAmount(amount)
                << ", end=" << lockEnd;
            break;
        case EscrowEventType::Split:
            oss << "from=" << id << ", new=" << otherId << ", kept=" << FormatAmount(amount)
                << ", split=" << FormatAmount(penalty);
            break;
        case EscrowEventType::Transfer:
            oss << "id=" << id << ", from=0x" << from.ToHex() << ", to=0x" << to.ToHex();
            break;
        case EscrowEventType::DelegateChanged:
            oss << "delegator=0x" << from.ToHex() << ", from=0x" << other.ToHex()
                << ", to=0x" << to.ToHex();
            break;
        case EscrowEventType::DelegateVotesChanged:
            oss << "delegate=0x" << to.ToHex() << ", previous=" << FormatAmount(penalty)
                << ", new=" << FormatAmount(amount);
            break;
        case EscrowEventType::Supply:
            oss << "previous=" << FormatAmount(penalty) << ", new=" << FormatAmount(amount);
            break;
    }
    oss << ", ts=" << ts << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

VotingEscrow::VotingEscrow(const LedgerConfig& config, util::IClock& clock,
                           IFungibleAsset& asset, const Address& self)
    : config_(config),
      clock_(clock),
      asset_(asset),
      self_(self),
      positions_(journal_, config.maxReplayWeeks),
      delegation_(journal_) {
    if (config_.penaltyNumerator < 0 || config_.penaltyNumerator > PENALTY_DENOMINATOR) {
        throw PreconditionError(ErrorCode::InvalidArgument, "penalty numerator out of range");
    }
    if (config_.minLockAmount < 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "negative minimum lock amount");
    }
    LOG_INFO(util::LogCategory::ESCROW)
        << "Voting escrow '" << config_.name << "' (" << config_.symbol << ") custody " << self_;
}

// ============================================================================
// Operation plumbing
// ============================================================================

Timestamp VotingEscrow::BeginOperation() {
    pendingEvents_.clear();
    journal_.Assign(sequence_, sequence_ + 1);
    return clock_.Now();
}

void VotingEscrow::Emit(EscrowEvent event) {
    pendingEvents_.push_back(std::move(event));
}

void VotingEscrow::FlushEvents() {
    std::vector<EscrowEvent> events;
    events.swap(pendingEvents_);
    for (const auto& event : events) {
        LOG_DEBUG(util::LogCategory::ESCROW) << event.ToString();
        for (const auto& listener : listeners_) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                LOG_ERROR(util::LogCategory::ESCROW)
                    << "Event listener failed on " << EscrowEventTypeToString(event.type)
                    << ": " << e.what();
            }
        }
    }
}

void VotingEscrow::AddListener(EscrowListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

// ============================================================================
// Preconditions
// ============================================================================

void VotingEscrow::RequireGovernance(const Address& caller) const {
    if (config_.governance.IsNull() || caller != config_.governance) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "caller 0x" + caller.ToHex() + " is not governance");
    }
}

void VotingEscrow::RequireApprovedOrOwner(const Address& caller, TokenId id) const {
    if (owners_.count(id) == 0) {
        throw PreconditionError(ErrorCode::NotFound, "position " + std::to_string(id) + " does not exist");
    }
    if (!IsApprovedOrOwner(caller, id)) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "caller 0x" + caller.ToHex() + " is not owner or approved for " +
                                std::to_string(id));
    }
}

void VotingEscrow::RequireNoPendingRewards(TokenId id) const {
    if (rewards_ != nullptr && rewards_->Unclaimed(id) > 0) {
        throw PreconditionError(ErrorCode::PendingRewards,
                                "position " + std::to_string(id) + " has unclaimed rewards");
    }
}

void VotingEscrow::RequireNotAttached(TokenId id) const {
    if (nodes_ != nullptr && nodes_->IsAttached(id)) {
        throw PreconditionError(ErrorCode::NodeAttached,
                                "position " + std::to_string(id) + " is attached to a node");
    }
}

void VotingEscrow::RequireNotFlashed(TokenId id, Timestamp now) const {
    auto it = lastStructural_.find(id);
    if (it != lastStructural_.end() && it->second == now) {
        throw PreconditionError(ErrorCode::FlashProtected,
                                "position " + std::to_string(id) + " already changed at " +
                                std::to_string(now));
    }
}

Timestamp VotingEscrow::ValidatedUnlockTime(Timestamp duration, Timestamp now) const {
    if (duration <= 0 || duration > MAXTIME) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "lock duration " + std::to_string(duration) + " out of range");
    }
    Timestamp unlockTime = FloorToWeek(now + duration);
    if (unlockTime <= now) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "unlock time must be in the future");
    }
    if (unlockTime > now + MAXTIME) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "unlock time exceeds the maximum lock duration");
    }
    return unlockTime;
}

// ============================================================================
// Custody
// ============================================================================

void VotingEscrow::PullAsset(const Address& payer, Amount value) {
    Amount before = asset_.BalanceOf(self_);
    if (!asset_.TransferFrom(payer, value)) {
        LOG_WARN(util::LogCategory::ASSET)
            << "Transfer of " << FormatAmount(value) << " from " << payer << " refused";
        throw TransferError(ErrorCode::TransferFailed,
                            "transfer of " + FormatAmount(value) + " from 0x" + payer.ToHex() + " failed");
    }
    Amount received = CheckedSub(asset_.BalanceOf(self_), before);
    if (received != value) {
        LOG_ERROR(util::LogCategory::ASSET)
            << "Custody received " << FormatAmount(received) << ", expected " << FormatAmount(value);
        throw TransferError(ErrorCode::TransferFailed,
                            "custody received " + FormatAmount(received) +
                            " instead of " + FormatAmount(value));
    }
}

void VotingEscrow::PayAsset(const Address& payee, Amount value) {
    if (value == 0) {
        return;
    }
    Amount before = asset_.BalanceOf(self_);
    if (!asset_.Transfer(payee, value)) {
        LOG_WARN(util::LogCategory::ASSET)
            << "Payout of " << FormatAmount(value) << " to " << payee << " refused";
        throw TransferError(ErrorCode::TransferFailed,
                            "payout of " + FormatAmount(value) + " to 0x" + payee.ToHex() + " failed");
    }
    Amount sent = CheckedSub(before, asset_.BalanceOf(self_));
    if (sent != value) {
        LOG_ERROR(util::LogCategory::ASSET)
            << "Custody released " << FormatAmount(sent) << ", expected " << FormatAmount(value);
        throw TransferError(ErrorCode::TransferFailed,
                            "custody released " + FormatAmount(sent) +
                            " instead of " + FormatAmount(value));
    }
}

// ============================================================================
// Ownership internals
// ============================================================================

void VotingEscrow::SetOwner(TokenId id, const Address& owner) {
    journal_.Put(owners_, id, owner);
    std::set<TokenId> tokens;
    auto it = ownerTokens_.find(owner);
    if (it != ownerTokens_.end()) {
        tokens = it->second;
    }
    tokens.insert(id);
    journal_.Put(ownerTokens_, owner, std::move(tokens));
}

void VotingEscrow::ClearOwner(TokenId id) {
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return;
    }
    Address owner = it->second;
    journal_.Erase(owners_, id);
    journal_.Erase(approvals_, id);

    auto tokensIt = ownerTokens_.find(owner);
    if (tokensIt != ownerTokens_.end()) {
        std::set<TokenId> tokens = tokensIt->second;
        tokens.erase(id);
        if (tokens.empty()) {
            journal_.Erase(ownerTokens_, owner);
        } else {
            journal_.Put(ownerTokens_, owner, std::move(tokens));
        }
    }
}

TokenId VotingEscrow::Mint(const Address& to, Timestamp now) {
    if (to.IsNull()) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot mint to the null address");
    }
    TokenId id = nextId_;
    journal_.Assign(nextId_, nextId_ + 1);
    SetOwner(id, to);
    journal_.Put(createdAt_, id, now);
    journal_.Put(lastStructural_, id, now);
    delegation_.MoveIds(Address(), delegation_.DelegateOf(to), {id}, now);

    EscrowEvent event;
    event.type = EscrowEventType::Transfer;
    event.id = id;
    event.to = to;
    event.ts = now;
    Emit(event);
    return id;
}

void VotingEscrow::Burn(TokenId id, Timestamp now) {
    Address owner = OwnerOf(id);
    delegation_.MoveIds(delegation_.DelegateOf(owner), Address(), {id}, now);
    ClearOwner(id);

    EscrowEvent event;
    event.type = EscrowEventType::Transfer;
    event.id = id;
    event.from = owner;
    event.ts = now;
    Emit(event);
}

void VotingEscrow::TransferInternal(const Address& from, const Address& to, TokenId id, Timestamp now) {
    delegation_.MoveIds(delegation_.DelegateOf(from), delegation_.DelegateOf(to), {id}, now);
    ClearOwner(id);
    SetOwner(id, to);
    journal_.Put(lastStructural_, id, now);

    EscrowEvent event;
    event.type = EscrowEventType::Transfer;
    event.id = id;
    event.from = from;
    event.to = to;
    event.ts = now;
    Emit(event);
}

// ============================================================================
// Lock internals
// ============================================================================

TokenId VotingEscrow::CreateLockInternal(const Address& payer, Amount value, Timestamp unlockTime,
                                         const Address& recipient, bool nonVoting,
                                         DepositType type, Timestamp now) {
    TokenId id = Mint(recipient, now);
    if (nonVoting) {
        journal_.Insert(nonVoting_, id);
    }
    DepositInternal(payer, id, value, unlockTime, type, now);
    return id;
}

void VotingEscrow::DepositInternal(const Address& payer, TokenId id, Amount value,
                                   Timestamp unlockTime, DepositType type, Timestamp now) {
    Amount supplyBefore = positions_.Supply();
    LockedBalance next = positions_.Locked(id);
    next.amount = CheckedAdd(next.amount, value);
    if (unlockTime != 0) {
        next.end = unlockTime;
    }
    positions_.ApplyLock(id, next, now, sequence_);

    // Merge and split values are already in custody
    if (value != 0 && type != DepositType::Merge && type != DepositType::Split) {
        PullAsset(payer, value);
    }

    EscrowEvent deposit;
    deposit.type = EscrowEventType::Deposit;
    deposit.depositType = type;
    deposit.id = id;
    deposit.from = payer;
    deposit.amount = value;
    deposit.lockEnd = next.end;
    deposit.ts = now;
    Emit(deposit);

    EscrowEvent supply;
    supply.type = EscrowEventType::Supply;
    supply.amount = positions_.Supply();
    supply.penalty = supplyBefore;
    supply.ts = now;
    Emit(supply);

    LOG_INFO(util::LogCategory::ESCROW)
        << DepositTypeToString(type) << " position " << id << " +" << FormatAmount(value)
        << " -> " << next.ToString();
}

void VotingEscrow::WithdrawInternal(TokenId id, Timestamp now) {
    Address owner = OwnerOf(id);
    LockedBalance locked = positions_.Locked(id);
    Amount supplyBefore = positions_.Supply();

    positions_.ApplyLock(id, LockedBalance{}, now, sequence_);
    Burn(id, now);
    PayAsset(owner, locked.amount);

    EscrowEvent withdraw;
    withdraw.type = EscrowEventType::Withdraw;
    withdraw.id = id;
    withdraw.to = owner;
    withdraw.amount = locked.amount;
    withdraw.ts = now;
    Emit(withdraw);

    EscrowEvent supply;
    supply.type = EscrowEventType::Supply;
    supply.amount = positions_.Supply();
    supply.penalty = supplyBefore;
    supply.ts = now;
    Emit(supply);

    LOG_INFO(util::LogCategory::ESCROW)
        << "Withdrew position " << id << ": " << FormatAmount(locked.amount) << " to " << owner;
}

// ============================================================================
// Lock lifecycle
// ============================================================================

TokenId VotingEscrow::CreateLock(const Address& caller, Amount value, Timestamp duration,
                                 bool nonVoting) {
    return CreateLockFor(caller, value, duration, caller, nonVoting);
}

TokenId VotingEscrow::CreateLockFor(const Address& caller, Amount value, Timestamp duration,
                                    const Address& recipient, bool nonVoting) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    if (value <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "lock value must be positive");
    }
    if (value < config_.minLockAmount) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "lock value " + FormatAmount(value) + " below minimum " +
                                FormatAmount(config_.minLockAmount));
    }
    Timestamp unlockTime = ValidatedUnlockTime(duration, now);

    TokenId id = CreateLockInternal(caller, value, unlockTime, recipient, nonVoting,
                                    DepositType::CreateLock, now);

    tx.Commit();
    FlushEvents();
    return id;
}

void VotingEscrow::DepositFor(const Address& payer, TokenId id, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    if (value <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "deposit value must be positive");
    }
    LockedBalance locked = positions_.Locked(id);
    if (locked.amount <= 0) {
        throw PreconditionError(ErrorCode::NotFound, "no lock for position " + std::to_string(id));
    }
    if (locked.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState, "lock " + std::to_string(id) + " has expired");
    }
    RequireNoPendingRewards(id);

    DepositInternal(payer, id, value, 0, DepositType::DepositFor, now);

    tx.Commit();
    FlushEvents();
}

void VotingEscrow::IncreaseAmount(const Address& caller, TokenId id, Amount value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    RequireApprovedOrOwner(caller, id);
    if (value <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "increase value must be positive");
    }
    LockedBalance locked = positions_.Locked(id);
    if (locked.amount <= 0) {
        throw PreconditionError(ErrorCode::NotFound, "no lock for position " + std::to_string(id));
    }
    if (locked.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState, "lock " + std::to_string(id) + " has expired");
    }
    RequireNoPendingRewards(id);

    DepositInternal(caller, id, value, 0, DepositType::IncreaseAmount, now);

    tx.Commit();
    FlushEvents();
}

void VotingEscrow::IncreaseUnlockTime(const Address& caller, TokenId id, Timestamp duration) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    RequireApprovedOrOwner(caller, id);
    LockedBalance locked = positions_.Locked(id);
    if (locked.amount <= 0) {
        throw PreconditionError(ErrorCode::NotFound, "no lock for position " + std::to_string(id));
    }
    if (locked.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState, "lock " + std::to_string(id) + " has expired");
    }
    Timestamp unlockTime = ValidatedUnlockTime(duration, now);
    if (unlockTime <= locked.end) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "unlock time can only increase (current " +
                                std::to_string(locked.end) + ")");
    }
    RequireNoPendingRewards(id);

    DepositInternal(caller, id, 0, unlockTime, DepositType::IncreaseUnlockTime, now);

    tx.Commit();
    FlushEvents();
}

void VotingEscrow::Withdraw(const Address& caller, TokenId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    RequireApprovedOrOwner(caller, id);
    LockedBalance locked = positions_.Locked(id);
    if (now < locked.end) {
        throw PreconditionError(ErrorCode::InvalidState,
                                "lock " + std::to_string(id) + " expires at " + std::to_string(locked.end));
    }
    RequireNotAttached(id);
    RequireNoPendingRewards(id);

    WithdrawInternal(id, now);

    tx.Commit();
    FlushEvents();
}

Amount VotingEscrow::Liquidate(const Address& caller, TokenId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    if (!config_.liquidationsEnabled) {
        throw PreconditionError(ErrorCode::LiquidationsDisabled, "liquidations are disabled");
    }
    RequireApprovedOrOwner(caller, id);
    RequireNotAttached(id);
    RequireNoPendingRewards(id);

    LockedBalance locked = positions_.Locked(id);
    if (now >= locked.end) {
        WithdrawInternal(id, now);
        tx.Commit();
        FlushEvents();
        return 0;
    }

    if (config_.treasury.IsNull()) {
        throw PreconditionError(ErrorCode::InvalidState, "no treasury configured for liquidation penalties");
    }

    Amount power = positions_.VotingPowerOf(id, now);
    Amount penalty = MulDiv(power, config_.penaltyNumerator, PENALTY_DENOMINATOR);
    if (penalty <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "liquidation penalty of position " + std::to_string(id) + " is zero");
    }
    if (penalty > locked.amount) {
        throw InvariantError("liquidation penalty exceeds locked value");
    }

    Address owner = OwnerOf(id);
    Amount supplyBefore = positions_.Supply();
    Amount payout = locked.amount - penalty;

    positions_.ApplyLock(id, LockedBalance{}, now, sequence_);
    Burn(id, now);
    PayAsset(owner, payout);
    PayAsset(config_.treasury, penalty);

    EscrowEvent liquidate;
    liquidate.type = EscrowEventType::Liquidate;
    liquidate.id = id;
    liquidate.to = owner;
    liquidate.amount = payout;
    liquidate.penalty = penalty;
    liquidate.ts = now;
    Emit(liquidate);

    EscrowEvent supply;
    supply.type = EscrowEventType::Supply;
    supply.amount = positions_.Supply();
    supply.penalty = supplyBefore;
    supply.ts = now;
    Emit(supply);

    LOG_INFO(util::LogCategory::ESCROW)
        << "Liquidated position " << id << ": " << FormatAmount(payout) << " to " << owner
        << ", penalty " << FormatAmount(penalty) << " to treasury";

    tx.Commit();
    FlushEvents();
    return penalty;
}

void VotingEscrow::Merge(const Address& caller, TokenId from, TokenId to) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    if (from == to) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot merge a position into itself");
    }
    RequireApprovedOrOwner(caller, from);
    RequireApprovedOrOwner(caller, to);
    if (OwnerOf(from) != OwnerOf(to)) {
        throw PreconditionError(ErrorCode::NotAuthorized, "merged positions have different owners");
    }
    if (IsNonVoting(from) != IsNonVoting(to)) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "cannot merge voting and non-voting positions");
    }
    RequireNotFlashed(from, now);
    RequireNotFlashed(to, now);
    RequireNotAttached(from);
    RequireNotAttached(to);
    RequireNoPendingRewards(from);
    RequireNoPendingRewards(to);

    LockedBalance lockedFrom = positions_.Locked(from);
    LockedBalance lockedTo = positions_.Locked(to);
    if (lockedFrom.amount <= 0 || lockedTo.amount <= 0) {
        throw PreconditionError(ErrorCode::NotFound, "merged positions must both hold a lock");
    }
    if (lockedFrom.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState,
                                "source lock " + std::to_string(from) + " has expired; withdraw it instead");
    }
    if (lockedTo.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState, "target lock " + std::to_string(to) + " has expired");
    }

    Amount combined = CheckedAdd(lockedFrom.amount, lockedTo.amount);
    Amount weighted = CheckedAdd(CheckedMul(lockedFrom.amount, lockedFrom.end),
                                 CheckedMul(lockedTo.amount, lockedTo.end)) / combined;
    // Rounding up one week keeps the merged lock from ending before the weighted average
    Timestamp end = FloorToWeek(SafeCast<Timestamp>(weighted)) + WEEK;
    end = std::min(end, FloorToWeek(now + MAXTIME));

    Amount supplyBefore = positions_.Supply();
    positions_.ApplyLock(from, LockedBalance{}, now, sequence_);
    Burn(from, now);

    LockedBalance merged;
    merged.amount = combined;
    merged.end = end;
    positions_.ApplyLock(to, merged, now, sequence_);
    journal_.Put(lastStructural_, to, now);

    if (positions_.Supply() != supplyBefore) {
        throw InvariantError("merge changed the locked supply");
    }

    EscrowEvent deposit;
    deposit.type = EscrowEventType::Deposit;
    deposit.depositType = DepositType::Merge;
    deposit.id = to;
    deposit.from = caller;
    deposit.amount = lockedFrom.amount;
    deposit.lockEnd = end;
    deposit.ts = now;
    Emit(deposit);

    EscrowEvent event;
    event.type = EscrowEventType::Merge;
    event.id = from;
    event.otherId = to;
    event.amount = combined;
    event.lockEnd = end;
    event.ts = now;
    Emit(event);

    LOG_INFO(util::LogCategory::ESCROW)
        << "Merged position " << from << " into " << to << ": " << merged.ToString();

    tx.Commit();
    FlushEvents();
}

TokenId VotingEscrow::Split(const Address& caller, TokenId id, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    RequireApprovedOrOwner(caller, id);
    LockedBalance locked = positions_.Locked(id);
    if (locked.end <= now) {
        throw PreconditionError(ErrorCode::InvalidState, "lock " + std::to_string(id) + " has expired");
    }
    if (amount <= 0 || amount >= locked.amount) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "split amount must be within (0, " + FormatAmount(locked.amount) + ")");
    }
    RequireNotFlashed(id, now);
    RequireNotAttached(id);
    RequireNoPendingRewards(id);

    Address owner = OwnerOf(id);
    Amount supplyBefore = positions_.Supply();

    LockedBalance kept = locked;
    kept.amount = locked.amount - amount;
    positions_.ApplyLock(id, kept, now, sequence_);
    journal_.Put(lastStructural_, id, now);

    TokenId newId = CreateLockInternal(owner, amount, locked.end, owner, IsNonVoting(id),
                                       DepositType::Split, now);

    if (positions_.Supply() != supplyBefore) {
        throw InvariantError("split changed the locked supply");
    }

    EscrowEvent event;
    event.type = EscrowEventType::Split;
    event.id = id;
    event.otherId = newId;
    event.amount = kept.amount;
    event.penalty = amount;
    event.lockEnd = locked.end;
    event.ts = now;
    Emit(event);

    LOG_INFO(util::LogCategory::ESCROW)
        << "Split " << FormatAmount(amount) << " out of position " << id << " into " << newId;

    tx.Commit();
    FlushEvents();
    return newId;
}

void VotingEscrow::Checkpoint() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    positions_.GlobalCheckpoint(now, sequence_);

    tx.Commit();
    FlushEvents();
}

// ============================================================================
// Ownership
// ============================================================================

void VotingEscrow::TransferFrom(const Address& caller, const Address& from, const Address& to, TokenId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    RequireApprovedOrOwner(caller, id);
    if (OwnerOf(id) != from) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "0x" + from.ToHex() + " does not own position " + std::to_string(id));
    }
    if (to.IsNull()) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot transfer to the null address");
    }
    RequireNotFlashed(id, now);

    TransferInternal(from, to, id, now);

    LOG_INFO(util::LogCategory::ESCROW)
        << "Transferred position " << id << " from " << from << " to " << to;

    tx.Commit();
    FlushEvents();
}

void VotingEscrow::Approve(const Address& caller, const Address& approved, TokenId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    BeginOperation();

    Address owner = OwnerOf(id);
    if (caller != owner && !IsApprovedForAll(owner, caller)) {
        throw PreconditionError(ErrorCode::NotAuthorized,
                                "caller 0x" + caller.ToHex() + " may not approve position " +
                                std::to_string(id));
    }
    if (approved == owner) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot approve the owner");
    }
    if (approved.IsNull()) {
        journal_.Erase(approvals_, id);
    } else {
        journal_.Put(approvals_, id, approved);
    }

    tx.Commit();
    FlushEvents();
}

void VotingEscrow::SetApprovalForAll(const Address& caller, const Address& op, bool approved) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    BeginOperation();

    if (op == caller) {
        throw PreconditionError(ErrorCode::InvalidArgument, "cannot set approval for self");
    }
    std::set<Address> ops;
    auto it = operators_.find(caller);
    if (it != operators_.end()) {
        ops = it->second;
    }
    if (approved) {
        ops.insert(op);
    } else {
        ops.erase(op);
    }
    if (ops.empty()) {
        journal_.Erase(operators_, caller);
    } else {
        journal_.Put(operators_, caller, std::move(ops));
    }

    tx.Commit();
    FlushEvents();
}

Address VotingEscrow::OwnerOf(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        throw PreconditionError(ErrorCode::NotFound, "position " + std::to_string(id) + " does not exist");
    }
    return it->second;
}

bool VotingEscrow::Exists(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return owners_.count(id) > 0;
}

Address VotingEscrow::GetApproved(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = approvals_.find(id);
    return it == approvals_.end() ? Address() : it->second;
}

bool VotingEscrow::IsApprovedForAll(const Address& owner, const Address& op) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = operators_.find(owner);
    return it != operators_.end() && it->second.count(op) > 0;
}

bool VotingEscrow::IsApprovedOrOwner(const Address& spender, TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return false;
    }
    const Address& owner = it->second;
    return spender == owner || GetApproved(id) == spender || IsApprovedForAll(owner, spender);
}

uint64_t VotingEscrow::BalanceOf(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = ownerTokens_.find(owner);
    return it == ownerTokens_.end() ? 0 : it->second.size();
}

std::vector<TokenId> VotingEscrow::TokensOf(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = ownerTokens_.find(owner);
    if (it == ownerTokens_.end()) {
        return {};
    }
    return std::vector<TokenId>(it->second.begin(), it->second.end());
}

// ============================================================================
// Delegation
// ============================================================================

Amount VotingEscrow::VotesOfSet(const std::vector<TokenId>& ids, Timestamp t) const {
    Amount votes = 0;
    for (TokenId id : ids) {
        if (nonVoting_.count(id) > 0) {
            continue;
        }
        votes = CheckedAdd(votes, positions_.VotingPowerOf(id, t));
    }
    return votes;
}

void VotingEscrow::DelegateInternal(const Address& delegator, const Address& delegatee, Timestamp now) {
    Address target = delegatee.IsNull() ? delegator : delegatee;
    Address previous = delegation_.DelegateOf(delegator);
    if (previous == target) {
        return;
    }

    Amount previousVotesOld = VotesOfSet(delegation_.CurrentSet(previous), now);
    Amount targetVotesOld = VotesOfSet(delegation_.CurrentSet(target), now);

    delegation_.SetDelegate(delegator, target);
    delegation_.MoveIds(previous, target, TokensOf(delegator), now);

    EscrowEvent changed;
    changed.type = EscrowEventType::DelegateChanged;
    changed.from = delegator;
    changed.to = target;
    changed.other = previous;
    changed.ts = now;
    Emit(changed);

    EscrowEvent previousVotes;
    previousVotes.type = EscrowEventType::DelegateVotesChanged;
    previousVotes.to = previous;
    previousVotes.amount = VotesOfSet(delegation_.CurrentSet(previous), now);
    previousVotes.penalty = previousVotesOld;
    previousVotes.ts = now;
    Emit(previousVotes);

    EscrowEvent targetVotes;
    targetVotes.type = EscrowEventType::DelegateVotesChanged;
    targetVotes.to = target;
    targetVotes.amount = VotesOfSet(delegation_.CurrentSet(target), now);
    targetVotes.penalty = targetVotesOld;
    targetVotes.ts = now;
    Emit(targetVotes);

    LOG_INFO(util::LogCategory::DELEGATION)
        << delegator << " delegated from " << previous << " to " << target;
}

void VotingEscrow::Delegate(const Address& caller, const Address& delegatee) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    DelegateInternal(caller, delegatee, now);

    tx.Commit();
    FlushEvents();
}

Hash256 VotingEscrow::DelegationDigest(const Address& delegatee, uint64_t nonce, Timestamp expiry) const {
    crypto::HashWriter writer;
    writer.Write(std::string(DELEGATION_DOMAIN));
    writer.WriteU64(config_.name.size());
    writer.Write(config_.name);
    writer.Write(delegatee);
    writer.WriteU64(nonce);
    writer.WriteU64(static_cast<uint64_t>(expiry));
    return writer.GetHash();
}

void VotingEscrow::DelegateBySig(const crypto::PublicKey& signer, const Address& delegatee,
                                 uint64_t nonce, Timestamp expiry, const std::vector<Byte>& signature) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    Transaction tx(journal_);
    Timestamp now = BeginOperation();

    if (now > expiry) {
        throw PreconditionError(ErrorCode::SignatureInvalid,
                                "delegation signature expired at " + std::to_string(expiry));
    }
    if (!signer.IsValid()) {
        throw PreconditionError(ErrorCode::SignatureInvalid, "invalid signer public key");
    }
    if (!signer.Verify(DelegationDigest(delegatee, nonce, expiry), signature)) {
        LOG_WARN(util::LogCategory::CRYPTO) << "Rejected delegation signature from " << signer.GetAddress();
        throw PreconditionError(ErrorCode::SignatureInvalid, "delegation signature does not verify");
    }

    Address account = signer.GetAddress();
    delegation_.UseNonce(account, nonce);
    DelegateInternal(account, delegatee, now);

    tx.Commit();
    FlushEvents();
}

Address VotingEscrow::Delegates(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.DelegateOf(account);
}

uint64_t VotingEscrow::Nonce(const Address& signer) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.Nonce(signer);
}

std::vector<TokenId> VotingEscrow::CurrentDelegateSet(const Address& delegate) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.CurrentSet(delegate);
}

std::vector<TokenId> VotingEscrow::DelegateSetAt(const Address& delegate, Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.SetAt(delegate, t);
}

size_t VotingEscrow::NumDelegationCheckpoints(const Address& delegate) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.NumCheckpoints(delegate);
}

DelegationCheckpoint VotingEscrow::DelegationCheckpointAt(const Address& delegate, size_t index) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return delegation_.CheckpointAt(delegate, index);
}

Amount VotingEscrow::GetVotes(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return GetPastVotes(account, clock_.Now());
}

Amount VotingEscrow::GetPastVotes(const Address& account, Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return VotesOfSet(delegation_.SetAt(account, t), t);
}

// ============================================================================
// Voting power and ledger state
// ============================================================================

Amount VotingEscrow::VotingPowerOf(TokenId id, Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.VotingPowerOf(id, t);
}

Amount VotingEscrow::BalanceOfNFT(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.VotingPowerOf(id, clock_.Now());
}

Amount VotingEscrow::TotalPowerAt(Timestamp t) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.TotalPowerAt(t);
}

Amount VotingEscrow::TotalPower() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.TotalPowerAt(clock_.Now());
}

LockedBalance VotingEscrow::Locked(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.Locked(id);
}

uint64_t VotingEscrow::UserPointEpoch(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.UserPointEpoch(id);
}

Point VotingEscrow::UserPointHistory(TokenId id, uint64_t epoch) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.UserPoint(id, epoch);
}

uint64_t VotingEscrow::Epoch() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.Global().Epoch();
}

Point VotingEscrow::PointHistory(uint64_t epoch) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.Global().At(epoch);
}

Amount VotingEscrow::SlopeChange(Timestamp ts) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.Schedule().At(ts);
}

Amount VotingEscrow::TotalLocked() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return positions_.Supply();
}

Timestamp VotingEscrow::CreatedAt(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = createdAt_.find(id);
    return it == createdAt_.end() ? 0 : it->second;
}

bool VotingEscrow::IsNonVoting(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return nonVoting_.count(id) > 0;
}

TokenId VotingEscrow::NextId() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return nextId_;
}

std::string VotingEscrow::TokenURI(TokenId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (owners_.count(id) == 0) {
        throw PreconditionError(ErrorCode::NotFound, "position " + std::to_string(id) + " does not exist");
    }
    return config_.baseUri + std::to_string(id);
}

// ============================================================================
// Governance
// ============================================================================

void VotingEscrow::SetLiquidationsEnabled(const Address& caller, bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RequireGovernance(caller);
    config_.liquidationsEnabled = enabled;
    LOG_INFO(util::LogCategory::ESCROW) << "Liquidations " << (enabled ? "enabled" : "disabled");
}

void VotingEscrow::SetTreasury(const Address& caller, const Address& treasury) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RequireGovernance(caller);
    config_.treasury = treasury;
    LOG_INFO(util::LogCategory::ESCROW) << "Treasury set to " << treasury;
}

void VotingEscrow::SetPenaltyNumerator(const Address& caller, Amount numerator) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RequireGovernance(caller);
    if (numerator < 0 || numerator > PENALTY_DENOMINATOR) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "penalty numerator " + AmountToString(numerator) + " out of range");
    }
    config_.penaltyNumerator = numerator;
    LOG_INFO(util::LogCategory::ESCROW) << "Liquidation penalty numerator set to " << numerator;
}

void VotingEscrow::SetRewardsOracle(const Address& caller, const IRewardsOracle* oracle) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RequireGovernance(caller);
    rewards_ = oracle;
}

void VotingEscrow::SetNodeProperties(const Address& caller, const INodeProperties* nodes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RequireGovernance(caller);
    nodes_ = nodes;
}

bool VotingEscrow::LiquidationsEnabled() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return config_.liquidationsEnabled;
}

Address VotingEscrow::Treasury() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return config_.treasury;
}

Amount VotingEscrow::PenaltyNumerator() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return config_.penaltyNumerator;
}

// ============================================================================
// Snapshot
// ============================================================================

EscrowState VotingEscrow::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EscrowState state;
    state.positions = positions_.Export();
    state.delegation = delegation_.Export();
    state.owners = owners_;
    state.approvals = approvals_;
    state.operators = operators_;
    state.createdAt = createdAt_;
    state.nonVoting = nonVoting_;
    state.nextId = nextId_;
    state.sequence = sequence_;
    state.liquidationsEnabled = config_.liquidationsEnabled;
    state.penaltyNumerator = config_.penaltyNumerator;
    state.treasury = config_.treasury;
    return state;
}

void VotingEscrow::Restore(EscrowState state) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);

    for (const auto& entry : state.owners) {
        if (entry.first == 0 || entry.first >= state.nextId) {
            throw InvariantError("owned position " + std::to_string(entry.first) +
                                 " outside allocated id range");
        }
        if (state.positions.locked.count(entry.first) == 0) {
            throw InvariantError("owned position " + std::to_string(entry.first) + " has no lock");
        }
    }
    for (const auto& entry : state.positions.locked) {
        if (state.owners.count(entry.first) == 0) {
            throw InvariantError("lock " + std::to_string(entry.first) + " has no owner");
        }
    }
    if (state.penaltyNumerator < 0 || state.penaltyNumerator > PENALTY_DENOMINATOR) {
        throw InvariantError("restored penalty numerator out of range");
    }

    PositionLedger::State previousPositions = positions_.Export();
    positions_.Import(std::move(state.positions));
    try {
        delegation_.Import(std::move(state.delegation));
    } catch (const LedgerError&) {
        positions_.Import(std::move(previousPositions));
        throw;
    }

    ownerTokens_.clear();
    for (const auto& entry : state.owners) {
        ownerTokens_[entry.second].insert(entry.first);
    }
    owners_ = std::move(state.owners);
    approvals_ = std::move(state.approvals);
    operators_ = std::move(state.operators);
    createdAt_ = std::move(state.createdAt);
    nonVoting_ = std::move(state.nonVoting);
    lastStructural_.clear();
    nextId_ = state.nextId;
    sequence_ = state.sequence;
    config_.liquidationsEnabled = state.liquidationsEnabled;
    config_.penaltyNumerator = state.penaltyNumerator;
    config_.treasury = state.treasury;

    LOG_INFO(util::LogCategory::ESCROW)
        << "Restored " << owners_.size() << " position(s), epoch " << positions_.Global().Epoch()
        << ", next id " << nextId_;
}

} // namespace escrow
} // namespace veledger
