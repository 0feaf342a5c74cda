// VELEDGER - Node Registry
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// In-memory node-properties collaborator: which positions are attached to
// a node, and each position's checkpointed quality score (0..10).

#ifndef VELEDGER_NODE_NODE_REGISTRY_H
#define VELEDGER_NODE_NODE_REGISTRY_H

#include "veledger/core/checkpoint_series.h"
#include "veledger/core/types.h"
#include "veledger/escrow/interfaces.h"

#include <map>
#include <mutex>
#include <set>

namespace veledger {
namespace node {

class NodeRegistry : public escrow::INodeProperties {
public:
    NodeRegistry() = default;

    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    void Attach(TokenId id);
    void Detach(TokenId id);

    bool IsAttached(TokenId id) const override;

    /// Record a quality score effective from t; throws PreconditionError outside 0..10
    void SetQuality(TokenId id, int quality, Timestamp t);

    int QualityOf(TokenId id, Timestamp t) const override;

    size_t AttachedCount() const;

private:
    std::set<TokenId> attached_;
    std::map<TokenId, CheckpointSeries<int>> quality_;
    mutable std::mutex mutex_;
};

} // namespace node
} // namespace veledger

#endif // VELEDGER_NODE_NODE_REGISTRY_H
