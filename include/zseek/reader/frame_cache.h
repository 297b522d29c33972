// =============================================================================
// zseek - Frame Cache
// =============================================================================
// Least-recently-used cache of decompressed frame payloads.
//
// The cache is bounded by total payload bytes and by entry count. Payloads are
// immutable once inserted and are handed out as shared pointers, so an entry
// evicted while a caller still copies from it stays alive until the copy ends.
// A miss only costs a re-fetch; correctness never depends on a hit.
//
// Thread Safety:
// - Not thread-safe. Each reader owns its cache.
// =============================================================================

#ifndef ZSEEK_READER_FRAME_CACHE_H
#define ZSEEK_READER_FRAME_CACHE_H

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <unordered_map>

#include "zseek/common/types.h"

namespace zseek::reader {

/// @brief Shared, immutable decompressed frame payload.
using FramePayload = std::shared_ptr<const ByteBuffer>;

// =============================================================================
// Cache Statistics
// =============================================================================

/// @brief Counters maintained by FrameCache.
struct FrameCacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t insertions = 0;
    std::uint64_t evictions = 0;

    /// @brief Payloads not retained because they exceed the whole capacity.
    std::uint64_t rejected = 0;
};

// =============================================================================
// FrameCache Class
// =============================================================================

class FrameCache {
public:
    /// @brief Construct a cache.
    /// @param capacityBytes Budget for the sum of payload sizes (0 disables caching).
    /// @param maxFrames Maximum number of entries (0 disables caching).
    explicit FrameCache(std::size_t capacityBytes = kDefaultCacheCapacityBytes,
                        std::size_t maxFrames = kDefaultMaxCachedFrames);

    /// @brief Look up a frame and mark it most recently used.
    /// @return The payload, or nullptr on a miss.
    [[nodiscard]] FramePayload get(FrameId frameId);

    /// @brief Insert or replace a frame's payload.
    /// @note Evicts least recently used entries until the new entry fits.
    ///       A payload larger than capacityBytes() is not retained.
    void put(FrameId frameId, FramePayload payload);

    /// @brief Check for an entry without touching recency or counters.
    [[nodiscard]] bool contains(FrameId frameId) const noexcept;

    /// @brief Remove one entry.
    /// @return true if an entry was removed.
    bool erase(FrameId frameId);

    /// @brief Remove all entries. Counters are kept.
    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief Sum of cached payload sizes.
    [[nodiscard]] std::size_t bytesUsed() const noexcept { return bytesUsed_; }

    [[nodiscard]] std::size_t capacityBytes() const noexcept { return capacityBytes_; }

    [[nodiscard]] std::size_t maxFrames() const noexcept { return maxFrames_; }

    [[nodiscard]] bool enabled() const noexcept { return capacityBytes_ > 0 && maxFrames_ > 0; }

    [[nodiscard]] const FrameCacheStats& stats() const noexcept { return stats_; }

private:
    struct Entry {
        FramePayload payload;
        std::list<FrameId>::iterator lruPos;
    };

    /// @brief Drop the least recently used entry.
    void evictOne();

    std::size_t capacityBytes_;
    std::size_t maxFrames_;
    std::size_t bytesUsed_ = 0;

    /// @brief Recency order, most recently used at the front.
    std::list<FrameId> lru_;

    std::unordered_map<FrameId, Entry> entries_;

    FrameCacheStats stats_;
};

}  // namespace zseek::reader

#endif  // ZSEEK_READER_FRAME_CACHE_H
