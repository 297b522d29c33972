// =============================================================================
// zseek - Frame Index
// =============================================================================
// Table of frame boundaries in both coordinate spaces.
//
// This module provides:
// - FrameDescriptor: extents of one independently decodable frame
// - FrameIndex: validated, immutable sequence of descriptors
// - Logical-to-physical mapping via binary search
//
// Invariants of a constructed FrameIndex:
// - descriptors are ordered and contiguous in both spaces, starting at 0
// - the last descriptor's decompressed end equals totalLogicalSize()
// - the last descriptor's compressed end does not exceed totalPhysicalSize()
//
// Usage:
//   auto index = FrameIndex::build(source);
//   const auto& frame = index->locate(logicalOffset);
//   auto bytes = source.readRange(frame.compressedOffset, frame.compressedSize);
// =============================================================================

#ifndef ZSEEK_FORMAT_FRAME_INDEX_H
#define ZSEEK_FORMAT_FRAME_INDEX_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "zseek/common/error.h"
#include "zseek/common/types.h"
#include "zseek/io/range_source.h"

namespace zseek::format {

// =============================================================================
// FrameDescriptor Structure
// =============================================================================

/// @brief Extents of one frame in the compressed and decompressed spaces.
struct FrameDescriptor {
    /// @brief Offset of the frame's first compressed byte.
    PhysicalOffset compressedOffset = 0;

    /// @brief Compressed size of the frame.
    std::uint32_t compressedSize = 0;

    /// @brief Logical offset of the frame's first decompressed byte.
    LogicalOffset decompressedOffset = 0;

    /// @brief Decompressed size of the frame.
    std::uint32_t decompressedSize = 0;

    /// @brief Low 32 bits of XXH64 over the decompressed bytes.
    /// @note Meaningful only when hasChecksum is set.
    FrameChecksum checksum = 0;

    /// @brief Whether the seek table carried a checksum for this frame.
    bool hasChecksum = false;

    /// @brief One past the frame's last compressed byte.
    [[nodiscard]] PhysicalOffset compressedEnd() const noexcept {
        return compressedOffset + compressedSize;
    }

    /// @brief One past the frame's last decompressed byte.
    [[nodiscard]] LogicalOffset decompressedEnd() const noexcept {
        return decompressedOffset + decompressedSize;
    }

    /// @brief Check if a logical offset falls within this frame.
    [[nodiscard]] bool containsLogical(LogicalOffset offset) const noexcept {
        return offset >= decompressedOffset && offset < decompressedEnd();
    }

    [[nodiscard]] bool operator==(const FrameDescriptor& other) const noexcept = default;
};

// =============================================================================
// FrameIndex Class
// =============================================================================

/// @brief Immutable frame index of one archive.
///
/// Thread Safety:
/// - Immutable after construction; safe to share between readers through
///   std::shared_ptr<const FrameIndex>.
class FrameIndex {
public:
    /// @brief Fetch and parse the seek table at the tail of an archive.
    /// @param source Archive source.
    /// @param trailerPrefetch Size of the tail fetched by the first request.
    /// @param allowEmpty Accept archives with zero frames.
    /// @return Validated index.
    /// @throws TruncatedIndexError if the object is too small for its seek table.
    /// @throws CorruptIndexError on format or contiguity violations.
    /// @throws EmptyArchiveError if the archive has no frames and !allowEmpty.
    /// @throws TransportError propagated from the source.
    /// @note Issues one range request, or two when the seek table does not fit
    ///       in the prefetched tail.
    [[nodiscard]] static std::shared_ptr<const FrameIndex> build(
        io::RangeSource& source, std::size_t trailerPrefetch = kDefaultTrailerPrefetchBytes,
        bool allowEmpty = true);

    /// @brief Validate an explicit descriptor sequence.
    /// @param frames Descriptors in logical order.
    /// @param totalPhysicalSize Size of the whole object.
    /// @param sourceName Name used in error context.
    /// @throws CorruptIndexError on gaps, overlaps, empty compressed frames,
    ///         overflow, or frames extending past totalPhysicalSize.
    [[nodiscard]] static std::shared_ptr<const FrameIndex> fromDescriptors(
        std::vector<FrameDescriptor> frames, std::uint64_t totalPhysicalSize,
        std::string sourceName = {});

    // =========================================================================
    // Metadata Access
    // =========================================================================

    [[nodiscard]] std::size_t frameCount() const noexcept { return frames_.size(); }

    [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }

    [[nodiscard]] const std::vector<FrameDescriptor>& frames() const noexcept { return frames_; }

    /// @brief Get a descriptor by ID.
    /// @throws OutOfRangeError if the ID is invalid.
    [[nodiscard]] const FrameDescriptor& frame(FrameId frameId) const;

    /// @brief Size of the decompressed stream.
    [[nodiscard]] std::uint64_t totalLogicalSize() const noexcept { return totalLogicalSize_; }

    /// @brief Size of the whole compressed object, seek table included.
    [[nodiscard]] std::uint64_t totalPhysicalSize() const noexcept { return totalPhysicalSize_; }

    /// @brief Whether every frame carries a checksum.
    [[nodiscard]] bool hasChecksums() const noexcept { return hasChecksums_; }

    /// @brief Name of the source the index was built from.
    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

    // =========================================================================
    // Logical-to-Physical Mapping
    // =========================================================================

    /// @brief Find the frame containing a logical offset.
    /// @return Frame ID, or kInvalidFrameId if offset >= totalLogicalSize().
    [[nodiscard]] FrameId findFrame(LogicalOffset offset) const noexcept;

    /// @brief Find the frame containing a logical offset.
    /// @throws OutOfRangeError if offset >= totalLogicalSize().
    [[nodiscard]] const FrameDescriptor& locate(LogicalOffset offset) const;

private:
    FrameIndex(std::vector<FrameDescriptor> frames, std::uint64_t totalLogicalSize,
               std::uint64_t totalPhysicalSize, bool hasChecksums, std::string sourceName);

    std::vector<FrameDescriptor> frames_;
    std::uint64_t totalLogicalSize_ = 0;
    std::uint64_t totalPhysicalSize_ = 0;
    bool hasChecksums_ = false;
    std::string sourceName_;
};

}  // namespace zseek::format

#endif  // ZSEEK_FORMAT_FRAME_INDEX_H
