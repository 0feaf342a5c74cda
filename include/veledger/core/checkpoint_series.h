// VELEDGER - Checkpointed Scalar Series
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// A step function over time: an ordered list of (key, value) checkpoints
// answering "most recent value at or before t" in O(log n).

#ifndef VELEDGER_CORE_CHECKPOINT_SERIES_H
#define VELEDGER_CORE_CHECKPOINT_SERIES_H

#include "veledger/core/errors.h"
#include "veledger/core/types.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace veledger {

template<typename V>
class CheckpointSeries {
public:
    using Entry = std::pair<Timestamp, V>;

    /**
     * Record `value` from `key` onwards. A key equal to the latest key
     * overwrites it; an earlier key throws CheckpointUnorderedInsertion.
     */
    void Push(Timestamp key, V value) {
        if (!entries_.empty()) {
            Entry& last = entries_.back();
            if (key < last.first) {
                throw InvariantError("checkpoint key " + std::to_string(key) +
                                     " precedes latest key " + std::to_string(last.first),
                                     ErrorCode::CheckpointUnorderedInsertion);
            }
            if (key == last.first) {
                last.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(key, std::move(value));
    }

    /// Value of the latest checkpoint with key <= t; V{} if none
    V UpperLookup(Timestamp t) const {
        auto it = std::upper_bound(entries_.begin(), entries_.end(), t,
                                   [](Timestamp lhs, const Entry& rhs) { return lhs < rhs.first; });
        if (it == entries_.begin()) {
            return V{};
        }
        return std::prev(it)->second;
    }

    /// Value of the latest checkpoint; V{} if empty
    V Latest() const {
        return entries_.empty() ? V{} : entries_.back().second;
    }

    size_t Length() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

    const std::vector<Entry>& Entries() const { return entries_; }

    /// Replace the contents (restore from storage); keys must be strictly increasing
    void Assign(std::vector<Entry> entries) {
        for (size_t i = 1; i < entries.size(); ++i) {
            if (entries[i].first <= entries[i - 1].first) {
                throw InvariantError("checkpoint series keys not strictly increasing",
                                     ErrorCode::CheckpointUnorderedInsertion);
            }
        }
        entries_ = std::move(entries);
    }

private:
    std::vector<Entry> entries_;
};

} // namespace veledger

#endif // VELEDGER_CORE_CHECKPOINT_SERIES_H
