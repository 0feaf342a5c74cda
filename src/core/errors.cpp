// VELEDGER - Error Types Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/core/errors.h"

namespace veledger {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        case ErrorCode::NotAuthorized: return "Not authorized";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::FlashProtected: return "Flash protected";
        case ErrorCode::Reentrancy: return "Reentrant call";
        case ErrorCode::SignatureInvalid: return "Invalid signature";
        case ErrorCode::LiquidationsDisabled: return "Liquidations disabled";
        case ErrorCode::PendingRewards: return "Unclaimed rewards pending";
        case ErrorCode::NodeAttached: return "Attached to node";
        case ErrorCode::EmissionRateTooHigh: return "Emission rate change too high";
        case ErrorCode::NoUnclaimedRewards: return "No unclaimed rewards";

        case ErrorCode::ArithmeticOverflow: return "Arithmetic overflow";

        case ErrorCode::InvariantViolation: return "Invariant violation";
        case ErrorCode::CheckpointUnorderedInsertion: return "Checkpoint unordered insertion";

        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::InsufficientBalance: return "Insufficient balance";

        case ErrorCode::StorageError: return "Storage error";

        default: return "Unknown error";
    }
}

} // namespace veledger
