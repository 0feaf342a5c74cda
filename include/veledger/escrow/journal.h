// VELEDGER - Undo Journal
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Every ledger table write inside an operation records how to undo itself.
// If the operation throws, the Transaction guard replays the undo log in
// reverse, so a failed operation leaves no partial state behind.

#ifndef VELEDGER_ESCROW_JOURNAL_H
#define VELEDGER_ESCROW_JOURNAL_H

#include "veledger/core/errors.h"

#include <functional>
#include <utility>
#include <vector>

namespace veledger {
namespace escrow {

class Journal {
public:
    using UndoFn = std::function<void()>;

    bool IsOpen() const { return open_; }

    /// Number of recorded writes in the open transaction
    size_t Size() const { return undo_.size(); }

    void Begin() {
        if (open_) {
            throw InvariantError("journal transaction already open");
        }
        open_ = true;
        undo_.clear();
    }

    void Commit() {
        undo_.clear();
        open_ = false;
    }

    /// Undo every recorded write, newest first
    void Rollback() {
        while (!undo_.empty()) {
            UndoFn fn = std::move(undo_.back());
            undo_.pop_back();
            fn();
        }
        open_ = false;
    }

    void Record(UndoFn fn) {
        if (!open_) {
            throw InvariantError("ledger write outside of a transaction");
        }
        undo_.push_back(std::move(fn));
    }

    // ========================================================================
    // Journaled container writes
    // ========================================================================

    /// map[key] = value
    template<typename Map>
    void Put(Map& map, const typename Map::key_type& key, typename Map::mapped_type value) {
        auto it = map.find(key);
        if (it == map.end()) {
            Record([&map, key]() { map.erase(key); });
            map.emplace(key, std::move(value));
        } else {
            Record([&map, key, old = it->second]() { map[key] = old; });
            it->second = std::move(value);
        }
    }

    /// map.erase(key)
    template<typename Map>
    void Erase(Map& map, const typename Map::key_type& key) {
        auto it = map.find(key);
        if (it == map.end()) {
            return;
        }
        Record([&map, key, old = it->second]() { map.emplace(key, old); });
        map.erase(it);
    }

    /// set.insert(key)
    template<typename Set>
    void Insert(Set& set, const typename Set::key_type& key) {
        if (set.count(key) > 0) {
            return;
        }
        Record([&set, key]() { set.erase(key); });
        set.insert(key);
    }

    /// set.erase(key)
    template<typename Set>
    void Remove(Set& set, const typename Set::key_type& key) {
        if (set.count(key) == 0) {
            return;
        }
        Record([&set, key]() { set.insert(key); });
        set.erase(key);
    }

    /// vec.push_back(value)
    template<typename Vec>
    void PushBack(Vec& vec, typename Vec::value_type value) {
        Record([&vec]() { vec.pop_back(); });
        vec.push_back(std::move(value));
    }

    /// target = value
    template<typename T>
    void Assign(T& target, T value) {
        Record([&target, old = target]() { target = old; });
        target = std::move(value);
    }

private:
    std::vector<UndoFn> undo_;
    bool open_{false};
};

/// RAII transaction: rolls the journal back unless Commit() was called
class Transaction {
public:
    explicit Transaction(Journal& journal) : journal_(journal) {
        journal_.Begin();
    }

    ~Transaction() {
        if (!committed_) {
            journal_.Rollback();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void Commit() {
        journal_.Commit();
        committed_ = true;
    }

private:
    Journal& journal_;
    bool committed_{false};
};

/// Enter/exit flag rejecting nested mutating calls
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& entered) : entered_(entered) {
        if (entered_) {
            throw PreconditionError(ErrorCode::Reentrancy, "reentrant call");
        }
        entered_ = true;
    }

    ~ReentrancyGuard() { entered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& entered_;
};

} // namespace escrow
} // namespace veledger

#endif // VELEDGER_ESCROW_JOURNAL_H
