// VELEDGER - Error Types
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Exception hierarchy for ledger operations. Every failure aborts the whole
// operation; the code lets governance and UI layers tell an authorization
// problem from a state problem from an arithmetic problem.

#ifndef VELEDGER_CORE_ERRORS_H
#define VELEDGER_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace veledger {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    // Precondition violations
    NotAuthorized,          // Caller is not owner / approved / governance
    InvalidArgument,        // Zero amount, bad duration, self-merge, ...
    InvalidState,           // Expired, not expired, attached, pending rewards, ...
    NotFound,               // Unknown position
    FlashProtected,         // Second structural mutation in the same instant
    Reentrancy,             // Nested mutating call
    SignatureInvalid,       // Bad signature, nonce or expiry
    LiquidationsDisabled,
    PendingRewards,
    NodeAttached,
    EmissionRateTooHigh,
    NoUnclaimedRewards,

    // Arithmetic range violations
    ArithmeticOverflow,

    // Invariant violations
    InvariantViolation,
    CheckpointUnorderedInsertion,

    // External-call failures
    TransferFailed,
    InsufficientBalance,

    // Persistence
    StorageError,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Exceptions
// ============================================================================

/// Base class for all ledger failures
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Caller-side precondition not met (no state was written)
class PreconditionError : public LedgerError {
public:
    PreconditionError(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {}
};

/// Value did not fit the target width
class ArithmeticError : public LedgerError {
public:
    explicit ArithmeticError(const std::string& msg)
        : LedgerError(ErrorCode::ArithmeticOverflow, msg) {}
};

/// Modeling bug: state would break a ledger invariant
class InvariantError : public LedgerError {
public:
    explicit InvariantError(const std::string& msg,
                            ErrorCode code = ErrorCode::InvariantViolation)
        : LedgerError(code, msg) {}
};

/// Asset collaborator refused or short-delivered a transfer
class TransferError : public LedgerError {
public:
    TransferError(ErrorCode code, const std::string& msg) : LedgerError(code, msg) {}
};

/// Database layer failure
class StorageError : public LedgerError {
public:
    explicit StorageError(const std::string& msg) : LedgerError(ErrorCode::StorageError, msg) {}
};

} // namespace veledger

#endif // VELEDGER_CORE_ERRORS_H
