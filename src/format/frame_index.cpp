// =============================================================================
// zseek - Frame Index Implementation
// =============================================================================

#include "zseek/format/frame_index.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <span>

#include <fmt/format.h>

#include "zseek/common/logger.h"
#include "zseek/format/seek_table.h"

namespace zseek::format {

namespace {

/// @brief Add two offsets, returning false on u64 overflow.
[[nodiscard]] bool checkedAdd(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
    if (a > std::numeric_limits<std::uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

/// @brief Validate contiguity and bounds, returning the logical size.
std::uint64_t validateDescriptors(const std::vector<FrameDescriptor>& frames,
                                  std::uint64_t totalPhysicalSize,
                                  const std::string& sourceName) {
    if (frames.size() > std::numeric_limits<FrameId>::max() - 1) {
        throw CorruptIndexError(fmt::format("Too many frames: {}", frames.size()),
                                ErrorContext(sourceName));
    }

    std::uint64_t expectedLogical = 0;
    std::uint64_t expectedPhysical = frames.empty() ? 0 : frames.front().compressedOffset;

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto& frame = frames[i];
        const auto frameId = static_cast<FrameId>(i);

        if (frame.decompressedOffset != expectedLogical) {
            throw CorruptIndexError(
                fmt::format("Frame starts at logical offset {}, previous frame ends at {}",
                            frame.decompressedOffset, expectedLogical),
                ErrorContext(sourceName).withFrame(frameId).withLogicalOffset(
                    frame.decompressedOffset));
        }

        if (frame.compressedOffset != expectedPhysical) {
            throw CorruptIndexError(
                fmt::format("Frame starts at physical offset {}, previous frame ends at {}",
                            frame.compressedOffset, expectedPhysical),
                ErrorContext(sourceName).withFrame(frameId).withPhysicalOffset(
                    frame.compressedOffset));
        }

        if (frame.compressedSize == 0) {
            throw CorruptIndexError("Frame has zero compressed size",
                                    ErrorContext(sourceName).withFrame(frameId));
        }

        if (!checkedAdd(expectedLogical, frame.decompressedSize, expectedLogical) ||
            !checkedAdd(expectedPhysical, frame.compressedSize, expectedPhysical)) {
            throw CorruptIndexError("Frame offsets overflow 64 bits",
                                    ErrorContext(sourceName).withFrame(frameId));
        }

        if (expectedPhysical > totalPhysicalSize) {
            throw CorruptIndexError(
                fmt::format("Frame ends at physical offset {}, past object size {}",
                            expectedPhysical, totalPhysicalSize),
                ErrorContext(sourceName).withFrame(frameId).withPhysicalOffset(
                    frame.compressedOffset));
        }
    }

    return expectedLogical;
}

}  // namespace

// =============================================================================
// FrameIndex Construction
// =============================================================================

FrameIndex::FrameIndex(std::vector<FrameDescriptor> frames, std::uint64_t totalLogicalSize,
                       std::uint64_t totalPhysicalSize, bool hasChecksums, std::string sourceName)
    : frames_(std::move(frames)),
      totalLogicalSize_(totalLogicalSize),
      totalPhysicalSize_(totalPhysicalSize),
      hasChecksums_(hasChecksums),
      sourceName_(std::move(sourceName)) {}

std::shared_ptr<const FrameIndex> FrameIndex::fromDescriptors(std::vector<FrameDescriptor> frames,
                                                              std::uint64_t totalPhysicalSize,
                                                              std::string sourceName) {
    const auto logicalSize = validateDescriptors(frames, totalPhysicalSize, sourceName);
    const bool hasChecksums =
        !frames.empty() && std::all_of(frames.begin(), frames.end(),
                                       [](const FrameDescriptor& f) { return f.hasChecksum; });

    return std::shared_ptr<const FrameIndex>(new FrameIndex(
        std::move(frames), logicalSize, totalPhysicalSize, hasChecksums, std::move(sourceName)));
}

std::shared_ptr<const FrameIndex> FrameIndex::build(io::RangeSource& source,
                                                    std::size_t trailerPrefetch,
                                                    bool allowEmpty) {
    const std::string name = source.name();
    const std::uint64_t objectSize = source.size();

    if (objectSize < SeekTableFooter::kSize) {
        throw TruncatedIndexError(
            fmt::format("Object of {} bytes cannot hold a seek table footer", objectSize),
            ErrorContext(name));
    }

    // Fetch the tail; for typical archives it holds the whole seek table
    const std::uint64_t tailSize = std::min<std::uint64_t>(
        objectSize, std::max<std::uint64_t>(trailerPrefetch, SeekTableFooter::kSize));
    const ByteBuffer tail = source.readRange(objectSize - tailSize, tailSize);
    if (tail.size() != tailSize) {
        throw TransportError(
            fmt::format("Trailer fetch returned {} bytes, expected {}", tail.size(), tailSize),
            ErrorContext(name).withPhysicalOffset(objectSize - tailSize));
    }

    const std::span<const std::uint8_t> tailSpan(tail);
    const SeekTableFooter footer = parseFooter(tailSpan.last(SeekTableFooter::kSize), name);

    const std::uint64_t tableSize = footer.tableSize();
    if (tableSize > objectSize) {
        throw TruncatedIndexError(
            fmt::format("Seek table of {} frames needs {} bytes, object has {}", footer.numFrames,
                        tableSize, objectSize),
            ErrorContext(name));
    }

    ByteBuffer tableBytes;
    std::span<const std::uint8_t> table;
    if (tableSize <= tailSize) {
        table = tailSpan.last(static_cast<std::size_t>(tableSize));
    } else {
        ZSEEK_LOG_DEBUG("Seek table of {} bytes exceeds prefetched tail of {} bytes: {}",
                        tableSize, tailSize, name);
        tableBytes = source.readRange(objectSize - tableSize, tableSize);
        if (tableBytes.size() != tableSize) {
            throw TransportError(
                fmt::format("Seek table fetch returned {} bytes, expected {}", tableBytes.size(),
                            tableSize),
                ErrorContext(name).withPhysicalOffset(objectSize - tableSize));
        }
        table = tableBytes;
    }

    const auto entries = parseEntries(table, footer, name);

    if (entries.empty() && !allowEmpty) {
        throw EmptyArchiveError("No frames found in the archive", ErrorContext(name));
    }

    std::vector<FrameDescriptor> frames;
    frames.reserve(entries.size());

    std::uint64_t compressedOffset = 0;
    std::uint64_t decompressedOffset = 0;
    for (const auto& entry : entries) {
        FrameDescriptor frame;
        frame.compressedOffset = compressedOffset;
        frame.compressedSize = entry.compressedSize;
        frame.decompressedOffset = decompressedOffset;
        frame.decompressedSize = entry.decompressedSize;
        frame.checksum = entry.checksum;
        frame.hasChecksum = footer.hasChecksums();
        frames.push_back(frame);

        if (!checkedAdd(compressedOffset, entry.compressedSize, compressedOffset) ||
            !checkedAdd(decompressedOffset, entry.decompressedSize, decompressedOffset)) {
            throw CorruptIndexError("Frame offsets overflow 64 bits",
                                    ErrorContext(name).withFrame(
                                        static_cast<FrameId>(frames.size() - 1)));
        }
    }

    // Frames must fill everything before the seek table, no more, no less
    const std::uint64_t dataEnd = objectSize - tableSize;
    if (compressedOffset != dataEnd) {
        throw CorruptIndexError(
            fmt::format("Frames cover {} compressed bytes, seek table starts at {}",
                        compressedOffset, dataEnd),
            ErrorContext(name).withPhysicalOffset(dataEnd));
    }

    const auto logicalSize = validateDescriptors(frames, objectSize, name);

    ZSEEK_LOG_DEBUG("Frame index loaded: {}, frames={}, logical={}, physical={}, checksums={}",
                    name, frames.size(), logicalSize, objectSize, footer.hasChecksums());

    return std::shared_ptr<const FrameIndex>(new FrameIndex(
        std::move(frames), logicalSize, objectSize, footer.hasChecksums(), name));
}

// =============================================================================
// Lookup
// =============================================================================

const FrameDescriptor& FrameIndex::frame(FrameId frameId) const {
    if (frameId >= frames_.size()) {
        throw OutOfRangeError(fmt::format("Invalid frame ID: {}", frameId),
                              ErrorContext(sourceName_).withFrame(frameId));
    }
    return frames_[frameId];
}

FrameId FrameIndex::findFrame(LogicalOffset offset) const noexcept {
    if (offset >= totalLogicalSize_) {
        return kInvalidFrameId;
    }

    // Last frame starting at or before offset; zero-sized frames sharing that
    // start sort before the frame that actually holds the byte.
    auto it = std::upper_bound(frames_.begin(), frames_.end(), offset,
                               [](LogicalOffset value, const FrameDescriptor& frame) {
                                   return value < frame.decompressedOffset;
                               });
    --it;
    return static_cast<FrameId>(std::distance(frames_.begin(), it));
}

const FrameDescriptor& FrameIndex::locate(LogicalOffset offset) const {
    const FrameId frameId = findFrame(offset);
    if (frameId == kInvalidFrameId) {
        throw OutOfRangeError(
            fmt::format("Logical offset {} outside stream of {} bytes", offset,
                        totalLogicalSize_),
            ErrorContext(sourceName_).withLogicalOffset(offset));
    }
    return frames_[frameId];
}

}  // namespace zseek::format
