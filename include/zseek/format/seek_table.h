// =============================================================================
// zseek - Seek Table Format Definitions
// =============================================================================
// Binary layout of the Zstandard seekable format's seek table.
//
// Archive Layout:
// +----------------+
// |  zstd frame 0  |
// +----------------+
// |  zstd frame 1  |
// +----------------+
// |      ...       |
// +----------------+
// |   Seek Table   |  (zstd skippable frame)
// +----------------+
//
// Seek Table Layout (little-endian):
// +----------------------+
// | Skippable magic (4)  |  0x184D2A5E
// | Frame size (4)       |  entries + footer
// +----------------------+
// | Entry 0 .. N-1       |  compressedSize:u32, decompressedSize:u32 [, checksum:u32]
// +----------------------+
// | Number of frames (4) |
// | Descriptor (1)       |  bit 7 = checksum flag, bits 2-6 reserved
// | Seekable magic (4)   |  0x8F92EAB1
// +----------------------+
//
// Frame offsets are implicit: each frame begins where the previous one ends,
// in both the compressed and the decompressed space.
// =============================================================================

#ifndef ZSEEK_FORMAT_SEEK_TABLE_H
#define ZSEEK_FORMAT_SEEK_TABLE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "zseek/common/types.h"

namespace zseek::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief Magic number closing the seek table footer.
inline constexpr std::uint32_t kSeekableMagic = 0x8F92EAB1;

/// @brief Magic number opening the skippable frame that holds the seek table.
inline constexpr std::uint32_t kSkippableFrameMagic = 0x184D2A5E;

/// @brief Skippable frame header size (magic + frame size).
inline constexpr std::size_t kSkippableHeaderSize = 8;

/// @brief Maximum number of frames a seek table may declare.
inline constexpr std::uint32_t kMaxFrames = 0x8000000;

/// @brief Checksum flag in the descriptor byte.
inline constexpr std::uint8_t kChecksumFlag = 0x80;

/// @brief Reserved descriptor bits, must be zero.
inline constexpr std::uint8_t kReservedDescriptorMask = 0x7C;

// =============================================================================
// SeekTableFooter Structure
// =============================================================================

/// @brief Fixed-size footer at the very end of a seekable archive.
struct SeekTableFooter {
    /// @brief Number of frames described by the table.
    std::uint32_t numFrames = 0;

    /// @brief Seek table descriptor byte.
    std::uint8_t descriptor = 0;

    /// @brief Seekable magic number.
    std::uint32_t magic = 0;

    /// @brief Fixed footer size.
    static constexpr std::size_t kSize = 9;

    [[nodiscard]] bool hasChecksums() const noexcept {
        return (descriptor & kChecksumFlag) != 0;
    }

    /// @brief Size of one seek table entry.
    [[nodiscard]] std::size_t entrySize() const noexcept { return hasChecksums() ? 12 : 8; }

    /// @brief Value the skippable frame's size field must hold.
    [[nodiscard]] std::uint64_t expectedFrameSize() const noexcept {
        return static_cast<std::uint64_t>(numFrames) * entrySize() + kSize;
    }

    /// @brief Total seek table size, skippable header included.
    [[nodiscard]] std::uint64_t tableSize() const noexcept {
        return kSkippableHeaderSize + expectedFrameSize();
    }
};

// =============================================================================
// SeekTableEntry Structure
// =============================================================================

/// @brief One frame record of the seek table.
struct SeekTableEntry {
    std::uint32_t compressedSize = 0;
    std::uint32_t decompressedSize = 0;
    FrameChecksum checksum = 0;
};

// =============================================================================
// Parsing Functions
// =============================================================================

/// @brief Parse the 9-byte footer.
/// @param bytes Exactly SeekTableFooter::kSize bytes.
/// @param sourceName Name used in error context.
/// @return Parsed footer.
/// @throws CorruptIndexError on bad magic, reserved bits or frame count.
[[nodiscard]] SeekTableFooter parseFooter(std::span<const std::uint8_t> bytes,
                                          const std::string& sourceName);

/// @brief Parse the complete seek table.
/// @param table Exactly footer.tableSize() bytes, skippable header first.
/// @param footer Footer already parsed from the end of `table`.
/// @param sourceName Name used in error context.
/// @return One entry per frame, in archive order.
/// @throws CorruptIndexError if the skippable header disagrees with the footer.
[[nodiscard]] std::vector<SeekTableEntry> parseEntries(std::span<const std::uint8_t> table,
                                                       const SeekTableFooter& footer,
                                                       const std::string& sourceName);

/// @brief Read a little-endian integer at `pos`.
/// @note Caller guarantees pos + sizeof(T) <= bytes.size().
template <typename T>
[[nodiscard]] T readLE(std::span<const std::uint8_t> bytes, std::size_t pos) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(bytes[pos + i]) << (8 * i));
    }
    return value;
}

}  // namespace zseek::format

#endif  // ZSEEK_FORMAT_SEEK_TABLE_H
