// =============================================================================
// zseek - Common Type Definitions
// =============================================================================
// Core type definitions shared by the index, cache and reader modules.
//
// Two coordinate spaces appear throughout the library:
// - physical: byte positions in the compressed object as stored remotely
// - logical:  byte positions in the fully decompressed stream
// =============================================================================

#ifndef ZSEEK_COMMON_TYPES_H
#define ZSEEK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace zseek {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Index of a frame within the frame index (0-based).
using FrameId = std::uint32_t;

/// @brief Byte position in the compressed object.
using PhysicalOffset = std::uint64_t;

/// @brief Byte position in the decompressed stream.
using LogicalOffset = std::uint64_t;

/// @brief Frame checksum (low 32 bits of XXH64).
using FrameChecksum = std::uint32_t;

/// @brief Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Invalid frame ID sentinel value.
inline constexpr FrameId kInvalidFrameId = std::numeric_limits<FrameId>::max();

/// @brief Default decompressed-payload budget of the frame cache.
inline constexpr std::size_t kDefaultCacheCapacityBytes = 64 * 1024 * 1024;  // 64MB

/// @brief Default maximum number of cached frames.
inline constexpr std::size_t kDefaultMaxCachedFrames = 1024;

/// @brief Default size of the tail fetched to locate the seek table.
/// @note Covers the whole seek table of archives up to ~8000 frames in one request.
inline constexpr std::size_t kDefaultTrailerPrefetchBytes = 64 * 1024;  // 64KB

/// @brief Upper bound accepted for the trailer prefetch.
inline constexpr std::size_t kMaxTrailerPrefetchBytes = 64 * 1024 * 1024;  // 64MB

// =============================================================================
// Seek Origin
// =============================================================================

/// @brief Origin of a seek request.
enum class SeekWhence : std::uint8_t {
    /// @brief Offset is absolute.
    kStart = 0,

    /// @brief Offset is relative to the cursor.
    kCurrent = 1,

    /// @brief Offset is relative to the logical size.
    kEnd = 2
};

[[nodiscard]] constexpr std::string_view seekWhenceToString(SeekWhence whence) noexcept {
    switch (whence) {
        case SeekWhence::kStart:
            return "start";
        case SeekWhence::kCurrent:
            return "current";
        case SeekWhence::kEnd:
            return "end";
    }
    return "unknown";
}

}  // namespace zseek

#endif  // ZSEEK_COMMON_TYPES_H
