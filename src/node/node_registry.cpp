// VELEDGER - Node Registry Implementation
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include "veledger/node/node_registry.h"
#include "veledger/util/logging.h"

namespace veledger {
namespace node {

void NodeRegistry::Attach(TokenId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!attached_.insert(id).second) {
        throw PreconditionError(ErrorCode::NodeAttached,
                                "position " + std::to_string(id) + " is already attached");
    }
    LOG_INFO(util::LogCategory::NODE) << "Attached position " << id;
}

void NodeRegistry::Detach(TokenId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attached_.erase(id) == 0) {
        throw PreconditionError(ErrorCode::InvalidState,
                                "position " + std::to_string(id) + " is not attached");
    }
    LOG_INFO(util::LogCategory::NODE) << "Detached position " << id;
}

bool NodeRegistry::IsAttached(TokenId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_.count(id) > 0;
}

void NodeRegistry::SetQuality(TokenId id, int quality, Timestamp t) {
    if (quality < 0 || quality > 10) {
        throw PreconditionError(ErrorCode::InvalidArgument,
                                "quality " + std::to_string(quality) + " outside 0..10");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    quality_[id].Push(t, quality);
    LOG_DEBUG(util::LogCategory::NODE)
        << "Quality of position " << id << " set to " << quality << " from " << t;
}

int NodeRegistry::QualityOf(TokenId id, Timestamp t) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quality_.find(id);
    return it == quality_.end() ? 0 : it->second.UpperLookup(t);
}

size_t NodeRegistry::AttachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_.size();
}

} // namespace node
} // namespace veledger
