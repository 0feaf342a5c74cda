// VELEDGER - Voting Escrow
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Users lock the underlying token for up to four years and receive a
// position whose voting power decays linearly to zero at unlock time.
// VotingEscrow owns the position ledger and the delegation index and is the
// only entry point that mutates them. Every public mutation reads the clock
// once, runs inside one journal transaction, and moves custody of the
// underlying asset last.

#ifndef VELEDGER_ESCROW_VOTING_ESCROW_H
#define VELEDGER_ESCROW_VOTING_ESCROW_H

#include "veledger/core/types.h"
#include "veledger/crypto/keys.h"
#include "veledger/escrow/delegation.h"
#include "veledger/escrow/interfaces.h"
#include "veledger/escrow/journal.h"
#include "veledger/escrow/position_ledger.h"
#include "veledger/util/clock.h"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace veledger {

namespace util {
class ConfigManager;
}

namespace escrow {

// ============================================================================
// Configuration
// ============================================================================

/// Liquidation penalties are expressed in parts of this denominator
constexpr Amount PENALTY_DENOMINATOR = 100000;

/// Default penalty: half of the current voting power
constexpr Amount DEFAULT_PENALTY_NUMERATOR = 50000;

struct LedgerConfig {
    std::string name{"Vote-escrowed Token"};
    std::string symbol{"veTOKEN"};
    std::string version{"1.0.0"};
    std::string baseUri;

    /// Only this address may call the governance setters
    Address governance;

    /// Smallest value accepted by CreateLock
    Amount minLockAmount{0};

    bool liquidationsEnabled{false};
    Amount penaltyNumerator{DEFAULT_PENALTY_NUMERATOR};
    Address treasury;

    int maxReplayWeeks{DEFAULT_MAX_REPLAY_WEEKS};

    /// Read the [escrow] section; throws PreconditionError on unusable values
    static LedgerConfig FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Events
// ============================================================================

enum class DepositType {
    CreateLock,
    IncreaseAmount,
    IncreaseUnlockTime,
    DepositFor,
    Merge,
    Split,
};

const char* DepositTypeToString(DepositType type);

enum class EscrowEventType {
    Deposit,
    Withdraw,
    Liquidate,
    Merge,
    Split,
    Transfer,
    DelegateChanged,
    DelegateVotesChanged,
    Supply,
};

const char* EscrowEventTypeToString(EscrowEventType type);

/**
 * One ledger event. Field use per type:
 *   Deposit              id, from (payer), amount, lockEnd, depositType
 *   Withdraw             id, to (owner), amount
 *   Liquidate            id, to (owner), amount (paid to owner), penalty
 *   Merge                id (source), otherId (target), amount (combined), lockEnd
 *   Split                id (source), otherId (new), amount (source), penalty (new)
 *   Transfer             id, from, to (null side = mint or burn)
 *   DelegateChanged      from (delegator), to (new delegate), other (previous)
 *   DelegateVotesChanged to (delegate), amount (new votes), penalty (previous)
 *   Supply               amount (new supply), penalty (previous supply)
 */
struct EscrowEvent {
    EscrowEventType type{EscrowEventType::Deposit};
    DepositType depositType{DepositType::CreateLock};
    TokenId id{0};
    TokenId otherId{0};
    Address from;
    Address to;
    Address other;
    Amount amount{0};
    Amount penalty{0};
    Timestamp lockEnd{0};
    Timestamp ts{0};

    std::string ToString() const;
};

using EscrowListener = std::function<void(const EscrowEvent&)>;

// ============================================================================
// Snapshot
// ============================================================================

/// Complete ledger state, as exported for persistence
struct EscrowState {
    PositionLedger::State positions;
    DelegationIndex::State delegation;

    std::map<TokenId, Address> owners;
    std::map<TokenId, Address> approvals;
    std::map<Address, std::set<Address>> operators;
    std::map<TokenId, Timestamp> createdAt;
    std::set<TokenId> nonVoting;

    TokenId nextId{1};
    uint64_t sequence{0};

    bool liquidationsEnabled{false};
    Amount penaltyNumerator{DEFAULT_PENALTY_NUMERATOR};
    Address treasury;
};

// ============================================================================
// VotingEscrow
// ============================================================================

class VotingEscrow {
public:
    /**
     * @param config  Ledger settings
     * @param clock   Timestamp source, read once per mutation
     * @param asset   Custody view of the underlying token held by `self`
     * @param self    Address under which the escrow holds custody
     */
    VotingEscrow(const LedgerConfig& config, util::IClock& clock,
                 IFungibleAsset& asset, const Address& self);

    VotingEscrow(const VotingEscrow&) = delete;
    VotingEscrow& operator=(const VotingEscrow&) = delete;

    // ========================================================================
    // Lock lifecycle
    // ========================================================================

    /// Lock `value` for `duration` seconds (rounded down to a week); returns the new id
    TokenId CreateLock(const Address& caller, Amount value, Timestamp duration,
                       bool nonVoting = false);

    /// As CreateLock, minting the position to `recipient`
    TokenId CreateLockFor(const Address& caller, Amount value, Timestamp duration,
                          const Address& recipient, bool nonVoting = false);

    /// Top up any unexpired lock; the payer need not own it
    void DepositFor(const Address& payer, TokenId id, Amount value);

    void IncreaseAmount(const Address& caller, TokenId id, Amount value);

    /// Move the unlock time to floor_to_week(now + duration), which must be later
    void IncreaseUnlockTime(const Address& caller, TokenId id, Timestamp duration);

    /// Release an expired lock to its owner and destroy the position
    void Withdraw(const Address& caller, TokenId id);

    /**
     * Destroy a position before expiry. The owner receives the locked value
     * minus a penalty of penaltyNumerator/PENALTY_DENOMINATOR of the current
     * voting power; the treasury receives the penalty. An expired position
     * is withdrawn instead. Returns the penalty.
     */
    Amount Liquidate(const Address& caller, TokenId id);

    /// Fold `from` into `to`; the source is destroyed
    void Merge(const Address& caller, TokenId from, TokenId to);

    /// Carve `amount` out of `id` into a new position with the same end; returns the new id
    TokenId Split(const Address& caller, TokenId id, Amount amount);

    /// Bring the global point history up to now
    void Checkpoint();

    // ========================================================================
    // Ownership
    // ========================================================================

    void TransferFrom(const Address& caller, const Address& from, const Address& to, TokenId id);

    void Approve(const Address& caller, const Address& approved, TokenId id);

    void SetApprovalForAll(const Address& caller, const Address& op, bool approved);

    /// Owner of a live position; throws PreconditionError(NotFound)
    Address OwnerOf(TokenId id) const;

    bool Exists(TokenId id) const;

    Address GetApproved(TokenId id) const;

    bool IsApprovedForAll(const Address& owner, const Address& op) const;

    bool IsApprovedOrOwner(const Address& spender, TokenId id) const;

    /// Number of positions owned
    uint64_t BalanceOf(const Address& owner) const;

    std::vector<TokenId> TokensOf(const Address& owner) const;

    // ========================================================================
    // Delegation
    // ========================================================================

    /// Delegate the votes of every position the caller owns; null means self
    void Delegate(const Address& caller, const Address& delegatee);

    /// Delegate on behalf of the signer of `signature`
    void DelegateBySig(const crypto::PublicKey& signer, const Address& delegatee,
                       uint64_t nonce, Timestamp expiry, const std::vector<Byte>& signature);

    /// Digest signed by DelegateBySig callers
    Hash256 DelegationDigest(const Address& delegatee, uint64_t nonce, Timestamp expiry) const;

    Address Delegates(const Address& account) const;

    uint64_t Nonce(const Address& signer) const;

    std::vector<TokenId> CurrentDelegateSet(const Address& delegate) const;

    std::vector<TokenId> DelegateSetAt(const Address& delegate, Timestamp t) const;

    size_t NumDelegationCheckpoints(const Address& delegate) const;

    DelegationCheckpoint DelegationCheckpointAt(const Address& delegate, size_t index) const;

    /// Votes of a delegate now (non-voting positions excluded)
    Amount GetVotes(const Address& account) const;

    /// Votes of a delegate at time t (non-voting positions excluded)
    Amount GetPastVotes(const Address& account, Timestamp t) const;

    // ========================================================================
    // Voting power
    // ========================================================================

    Amount VotingPowerOf(TokenId id, Timestamp t) const;

    /// Current voting power of a position
    Amount BalanceOfNFT(TokenId id) const;

    Amount TotalPowerAt(Timestamp t) const;

    Amount TotalPower() const;

    // ========================================================================
    // Ledger state
    // ========================================================================

    LockedBalance Locked(TokenId id) const;
    /**
     * Latest epoch of a position's point history. Each mutation at a new
     * timestamp appends one point; a further mutation in the same second
     * replaces that point, so the epoch advances once per distinct instant
     * and history keys stay strictly increasing.
     */
    uint64_t UserPointEpoch(TokenId id) const;
    Point UserPointHistory(TokenId id, uint64_t epoch) const;
    /// Latest global epoch; same-second checkpoints share one point, as above
    uint64_t Epoch() const;
    Point PointHistory(uint64_t epoch) const;
    Amount SlopeChange(Timestamp ts) const;
    Amount TotalLocked() const;

    /// Creation time of a position (0 if never created)
    Timestamp CreatedAt(TokenId id) const;

    bool IsNonVoting(TokenId id) const;

    /// Next id to be allocated
    TokenId NextId() const;

    // ========================================================================
    // Metadata
    // ========================================================================

    const std::string& Name() const { return config_.name; }
    const std::string& Symbol() const { return config_.symbol; }
    const std::string& Version() const { return config_.version; }
    int Decimals() const { return DECIMALS; }
    const Address& SelfAddress() const { return self_; }
    const Address& Governance() const { return config_.governance; }

    /// Base URI followed by the id
    std::string TokenURI(TokenId id) const;

    // ========================================================================
    // Governance
    // ========================================================================

    void SetLiquidationsEnabled(const Address& caller, bool enabled);
    void SetTreasury(const Address& caller, const Address& treasury);
    void SetPenaltyNumerator(const Address& caller, Amount numerator);
    void SetRewardsOracle(const Address& caller, const IRewardsOracle* oracle);
    void SetNodeProperties(const Address& caller, const INodeProperties* nodes);

    bool LiquidationsEnabled() const;
    Address Treasury() const;
    Amount PenaltyNumerator() const;

    // ========================================================================
    // Events and persistence
    // ========================================================================

    void AddListener(EscrowListener listener);

    EscrowState Snapshot() const;

    /// Replace the whole ledger state; throws InvariantError if inconsistent
    void Restore(EscrowState state);

    /// Ledger-wide lock shared with the reward engine
    std::recursive_mutex& LedgerMutex() const { return mutex_; }

    const IFungibleAsset& Asset() const { return asset_; }

private:
    // Operation plumbing
    Timestamp BeginOperation();
    void FlushEvents();
    void Emit(EscrowEvent event);

    // Preconditions
    void RequireGovernance(const Address& caller) const;
    void RequireApprovedOrOwner(const Address& caller, TokenId id) const;
    void RequireNoPendingRewards(TokenId id) const;
    void RequireNotAttached(TokenId id) const;
    void RequireNotFlashed(TokenId id, Timestamp now) const;
    Timestamp ValidatedUnlockTime(Timestamp duration, Timestamp now) const;

    // Internals (called with the lock held and a transaction open)
    TokenId CreateLockInternal(const Address& payer, Amount value, Timestamp unlockTime,
                               const Address& recipient, bool nonVoting,
                               DepositType type, Timestamp now);
    void DepositInternal(const Address& payer, TokenId id, Amount value, Timestamp unlockTime,
                         DepositType type, Timestamp now);
    void WithdrawInternal(TokenId id, Timestamp now);
    TokenId Mint(const Address& to, Timestamp now);
    void Burn(TokenId id, Timestamp now);
    void TransferInternal(const Address& from, const Address& to, TokenId id, Timestamp now);
    void DelegateInternal(const Address& delegator, const Address& delegatee, Timestamp now);
    void SetOwner(TokenId id, const Address& owner);
    void ClearOwner(TokenId id);
    Amount VotesOfSet(const std::vector<TokenId>& ids, Timestamp t) const;

    // Custody
    void PullAsset(const Address& payer, Amount value);
    void PayAsset(const Address& payee, Amount value);

    LedgerConfig config_;
    util::IClock& clock_;
    IFungibleAsset& asset_;
    Address self_;

    const IRewardsOracle* rewards_{nullptr};
    const INodeProperties* nodes_{nullptr};

    mutable std::recursive_mutex mutex_;
    bool entered_{false};
    Journal journal_;

    PositionLedger positions_;
    DelegationIndex delegation_;

    std::map<TokenId, Address> owners_;
    std::map<Address, std::set<TokenId>> ownerTokens_;
    std::map<TokenId, Address> approvals_;
    std::map<Address, std::set<Address>> operators_;
    std::map<TokenId, Timestamp> createdAt_;
    std::set<TokenId> nonVoting_;

    /// Last instant at which each id was minted, transferred, merged or split
    std::map<TokenId, Timestamp> lastStructural_;

    TokenId nextId_{1};
    uint64_t sequence_{0};

    std::vector<EscrowEvent> pendingEvents_;
    std::vector<EscrowListener> listeners_;
};

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_VOTING_ESCROW_H
