// =============================================================================
// zseek - Frame Cache Implementation
// =============================================================================

#include "zseek/reader/frame_cache.h"

#include "zseek/common/logger.h"

namespace zseek::reader {

FrameCache::FrameCache(std::size_t capacityBytes, std::size_t maxFrames)
    : capacityBytes_(capacityBytes), maxFrames_(maxFrames) {}

FramePayload FrameCache::get(FrameId frameId) {
    auto it = entries_.find(frameId);
    if (it == entries_.end()) {
        ++stats_.misses;
        return nullptr;
    }

    lru_.splice(lru_.begin(), lru_, it->second.lruPos);
    ++stats_.hits;
    return it->second.payload;
}

void FrameCache::put(FrameId frameId, FramePayload payload) {
    if (!payload) {
        return;
    }

    // Replacing drops the old entry first so it never counts twice
    erase(frameId);

    const std::size_t payloadSize = payload->size();
    if (!enabled() || payloadSize > capacityBytes_) {
        ++stats_.rejected;
        return;
    }

    while (!entries_.empty() &&
           (entries_.size() >= maxFrames_ || bytesUsed_ + payloadSize > capacityBytes_)) {
        evictOne();
    }

    lru_.push_front(frameId);
    entries_.emplace(frameId, Entry{std::move(payload), lru_.begin()});
    bytesUsed_ += payloadSize;
    ++stats_.insertions;
}

bool FrameCache::contains(FrameId frameId) const noexcept {
    return entries_.find(frameId) != entries_.end();
}

bool FrameCache::erase(FrameId frameId) {
    auto it = entries_.find(frameId);
    if (it == entries_.end()) {
        return false;
    }

    bytesUsed_ -= it->second.payload->size();
    lru_.erase(it->second.lruPos);
    entries_.erase(it);
    return true;
}

void FrameCache::clear() noexcept {
    entries_.clear();
    lru_.clear();
    bytesUsed_ = 0;
}

void FrameCache::evictOne() {
    const FrameId victim = lru_.back();
    ZSEEK_LOG_TRACE("Evicting frame {} from cache ({} bytes in use)", victim, bytesUsed_);
    erase(victim);
    ++stats_.evictions;
}

}  // namespace zseek::reader
