// =============================================================================
// zseek - Seek Table Parsing Implementation
// =============================================================================

#include "zseek/format/seek_table.h"

#include <fmt/format.h>

#include "zseek/common/error.h"

namespace zseek::format {

SeekTableFooter parseFooter(std::span<const std::uint8_t> bytes, const std::string& sourceName) {
    if (bytes.size() != SeekTableFooter::kSize) {
        throw TruncatedIndexError(
            fmt::format("Seek table footer needs {} bytes, got {}", SeekTableFooter::kSize,
                        bytes.size()),
            ErrorContext(sourceName));
    }

    SeekTableFooter footer;
    footer.numFrames = readLE<std::uint32_t>(bytes, 0);
    footer.descriptor = bytes[4];
    footer.magic = readLE<std::uint32_t>(bytes, 5);

    if (footer.magic != kSeekableMagic) {
        throw CorruptIndexError(
            fmt::format("Invalid seekable magic 0x{:08x} - not a seekable archive", footer.magic),
            ErrorContext(sourceName));
    }

    if ((footer.descriptor & kReservedDescriptorMask) != 0) {
        throw CorruptIndexError(
            fmt::format("Reserved seek table descriptor bits set: 0x{:02x}", footer.descriptor),
            ErrorContext(sourceName));
    }

    if (footer.numFrames > kMaxFrames) {
        throw CorruptIndexError(
            fmt::format("Seek table declares {} frames, limit is {}", footer.numFrames,
                        kMaxFrames),
            ErrorContext(sourceName));
    }

    return footer;
}

std::vector<SeekTableEntry> parseEntries(std::span<const std::uint8_t> table,
                                         const SeekTableFooter& footer,
                                         const std::string& sourceName) {
    if (table.size() != footer.tableSize()) {
        throw TruncatedIndexError(
            fmt::format("Seek table needs {} bytes, got {}", footer.tableSize(), table.size()),
            ErrorContext(sourceName));
    }

    const auto skippableMagic = readLE<std::uint32_t>(table, 0);
    if (skippableMagic != kSkippableFrameMagic) {
        throw CorruptIndexError(
            fmt::format("Invalid skippable frame magic 0x{:08x}", skippableMagic),
            ErrorContext(sourceName));
    }

    const auto frameSize = readLE<std::uint32_t>(table, 4);
    if (frameSize != footer.expectedFrameSize()) {
        throw CorruptIndexError(
            fmt::format("Seek table frame size {} does not match {} entries (expected {})",
                        frameSize, footer.numFrames, footer.expectedFrameSize()),
            ErrorContext(sourceName));
    }

    std::vector<SeekTableEntry> entries;
    entries.reserve(footer.numFrames);

    std::size_t pos = kSkippableHeaderSize;
    for (std::uint32_t i = 0; i < footer.numFrames; ++i) {
        SeekTableEntry entry;
        entry.compressedSize = readLE<std::uint32_t>(table, pos);
        entry.decompressedSize = readLE<std::uint32_t>(table, pos + 4);
        if (footer.hasChecksums()) {
            entry.checksum = readLE<std::uint32_t>(table, pos + 8);
        }
        entries.push_back(entry);
        pos += footer.entrySize();
    }

    return entries;
}

}  // namespace zseek::format
