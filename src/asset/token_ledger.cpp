// VELEDGER - Fungible Token Ledger Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/asset/token_ledger.h"
#include "veledger/core/errors.h"
#include "veledger/util/logging.h"

namespace veledger {
namespace asset {

namespace {

/// IFungibleAsset bound to one holder of a TokenLedger
class CustodyView : public escrow::IFungibleAsset {
public:
    CustodyView(TokenLedger& ledger, const Address& holder)
        : ledger_(ledger), holder_(holder) {}

    bool TransferFrom(const Address& payer, Amount amount) override {
        return ledger_.Transfer(payer, holder_, amount);
    }

    bool Transfer(const Address& payee, Amount amount) override {
        return ledger_.Transfer(holder_, payee, amount);
    }

    Amount BalanceOf(const Address& holder) const override {
        return ledger_.BalanceOf(holder);
    }

    std::string AssetId() const override { return ledger_.Symbol(); }

private:
    TokenLedger& ledger_;
    Address holder_;
};

} // namespace

TokenLedger::TokenLedger(std::string symbol) : symbol_(std::move(symbol)) {}

void TokenLedger::Mint(const Address& to, Amount amount) {
    if (amount <= 0) {
        throw PreconditionError(ErrorCode::InvalidArgument, "mint amount must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ = CheckedAdd(totalSupply_, amount);
    balances_[to] = CheckedAdd(balances_[to], amount);
    LOG_DEBUG(util::LogCategory::ASSET) << "Minted " << FormatAmount(amount, symbol_) << " to " << to;
}

bool TokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    TransferHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hook_;
    }

    Amount delivered = amount;
    if (hook) {
        std::optional<Amount> decision = hook(from, to, amount);
        if (!decision) {
            LOG_DEBUG(util::LogCategory::ASSET) << "Transfer hook refused " << FormatAmount(amount, symbol_);
            return false;
        }
        delivered = *decision;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0 || delivered < 0 || delivered > amount) {
        return false;
    }
    auto it = balances_.find(from);
    Amount balance = (it == balances_.end()) ? 0 : it->second;
    if (balance < amount) {
        LOG_DEBUG(util::LogCategory::ASSET)
            << "Insufficient balance: " << from << " has " << FormatAmount(balance, symbol_)
            << ", needs " << FormatAmount(amount, symbol_);
        return false;
    }

    // A short delivery still debits only what actually moved
    balances_[from] = balance - delivered;
    balances_[to] = CheckedAdd(balances_[to], delivered);
    return true;
}

Amount TokenLedger::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

void TokenLedger::SetTransferHook(TransferHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::shared_ptr<escrow::IFungibleAsset> TokenLedger::Custody(const Address& holder) {
    return std::make_shared<CustodyView>(*this, holder);
}

} // namespace asset
} // namespace veledger
