// VELEDGER - Fungible Token Ledger
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// In-memory balance table for the underlying and reward tokens. Custody()
// hands out IFungibleAsset views bound to one holder, which is how the
// escrow and the reward engine move tokens in and out of their custody.

#ifndef VELEDGER_ASSET_TOKEN_LEDGER_H
#define VELEDGER_ASSET_TOKEN_LEDGER_H

#include "veledger/core/types.h"
#include "veledger/escrow/interfaces.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace veledger {
namespace asset {

class TokenLedger {
public:
    /**
     * Transfer hook consulted before every transfer. Returning nullopt
     * refuses the transfer; returning a smaller amount delivers only that
     * much. Used to model misbehaving tokens.
     */
    using TransferHook = std::function<std::optional<Amount>(const Address& from,
                                                             const Address& to,
                                                             Amount requested)>;

    explicit TokenLedger(std::string symbol);

    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    const std::string& Symbol() const { return symbol_; }

    /// Create `amount` new tokens for `to`
    void Mint(const Address& to, Amount amount);

    /// Move tokens; false if the balance is insufficient or the hook refuses
    bool Transfer(const Address& from, const Address& to, Amount amount);

    Amount BalanceOf(const Address& holder) const;

    Amount TotalSupply() const;

    void SetTransferHook(TransferHook hook);
    void ClearTransferHook() { SetTransferHook(nullptr); }

    /// IFungibleAsset view holding custody as `holder`
    std::shared_ptr<escrow::IFungibleAsset> Custody(const Address& holder);

private:
    std::string symbol_;
    std::map<Address, Amount> balances_;
    Amount totalSupply_{0};
    TransferHook hook_;
    mutable std::mutex mutex_;
};

} // namespace asset
} // namespace veledger

#endif // VELEDGER_ASSET_TOKEN_LEDGER_H
