// VELEDGER - Escrow Collaborator Interfaces
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Abstract collaborators injected into the escrow and reward engines.
// Test doubles and the in-memory implementations in asset/ and node/
// implement these.

#ifndef VELEDGER_ESCROW_INTERFACES_H
#define VELEDGER_ESCROW_INTERFACES_H

#include "veledger/core/types.h"

#include <string>

namespace veledger {
namespace escrow {

/**
 * Custody view of a fungible asset, bound to one holder (the escrow or the
 * reward engine). Returning false is a hard failure for the caller.
 */
class IFungibleAsset {
public:
    virtual ~IFungibleAsset() = default;

    /// Pull `amount` from payer into this holder's custody
    virtual bool TransferFrom(const Address& payer, Amount amount) = 0;

    /// Pay `amount` out of this holder's custody
    virtual bool Transfer(const Address& payee, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder) const = 0;

    /// Identifier of the underlying asset (two views of one asset share it)
    virtual std::string AssetId() const = 0;
};

/// Node attachment and quality scores
class INodeProperties {
public:
    virtual ~INodeProperties() = default;

    virtual bool IsAttached(TokenId id) const = 0;

    /// Quality score 0..10 in effect at time t
    virtual int QualityOf(TokenId id, Timestamp t) const = 0;
};

/// Outstanding rewards; positions with unclaimed rewards cannot be restructured
class IRewardsOracle {
public:
    virtual ~IRewardsOracle() = default;

    virtual Amount Unclaimed(TokenId id) const = 0;
};

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_INTERFACES_H
