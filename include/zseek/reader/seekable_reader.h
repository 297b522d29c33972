// =============================================================================
// zseek - Seekable Reader
// =============================================================================
// Random-access reads over the decompressed stream of a seekable archive.
//
// This module provides:
// - SeekableReader: seek/read over the logical address space, fetching and
//   decoding only the frames a read touches
// - ReaderStats: request and cache counters
//
// Read Pipeline (per frame touched):
//   locate -> cache lookup -> readRange(compressed span) -> decode
//          -> length/checksum check -> cache insert -> copy out
//
// Usage:
//   SeekableReader reader(std::make_unique<io::FileRangeSource>(path));
//   reader.seek(1'000'000, SeekWhence::kStart);
//   auto bytes = reader.read(4096);
//
// Thread Safety:
// - Not thread-safe. Use one reader per thread; readers may share a
//   FrameIndex through frameIndex().
// =============================================================================

#ifndef ZSEEK_READER_SEEKABLE_READER_H
#define ZSEEK_READER_SEEKABLE_READER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "zseek/codec/frame_decoder.h"
#include "zseek/common/error.h"
#include "zseek/common/types.h"
#include "zseek/format/frame_index.h"
#include "zseek/io/range_source.h"
#include "zseek/reader/frame_cache.h"
#include "zseek/reader/reader_options.h"

namespace zseek::reader {

// =============================================================================
// Reader Statistics
// =============================================================================

/// @brief Counters for one reader, index construction excluded.
struct ReaderStats {
    /// @brief readRange calls issued for frame payloads.
    std::uint64_t rangeRequests = 0;

    /// @brief Compressed bytes received from the source.
    std::uint64_t compressedBytesFetched = 0;

    /// @brief Frames successfully decompressed.
    std::uint64_t framesDecoded = 0;

    std::uint64_t cacheHits = 0;
    std::uint64_t cacheMisses = 0;

    /// @brief Logical bytes returned to callers.
    std::uint64_t bytesRead = 0;
};

// =============================================================================
// SeekableReader Class
// =============================================================================

class SeekableReader {
public:
    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    /// @brief Open an archive with the Zstandard decoder.
    /// @param source Archive source, owned by the reader.
    /// @param options Reader options.
    /// @throws InvalidArgumentError on invalid options or a null source.
    /// @throws TruncatedIndexError, CorruptIndexError, EmptyArchiveError,
    ///         TransportError from index construction.
    explicit SeekableReader(std::unique_ptr<io::RangeSource> source,
                            ReaderOptions options = {});

    /// @brief Open an archive with a caller-supplied decoder.
    SeekableReader(std::unique_ptr<io::RangeSource> source,
                   std::unique_ptr<codec::FrameDecoder> decoder, ReaderOptions options = {});

    /// @brief Open an archive reusing an index built by another reader.
    /// @throws InvalidArgumentError if the source size differs from the
    ///         index's physical size.
    SeekableReader(std::unique_ptr<io::RangeSource> source,
                   std::shared_ptr<const format::FrameIndex> index,
                   std::unique_ptr<codec::FrameDecoder> decoder, ReaderOptions options = {});

    /// @brief Non-throwing variant of the Zstandard constructor.
    [[nodiscard]] static Result<SeekableReader> tryOpen(std::unique_ptr<io::RangeSource> source,
                                                        ReaderOptions options = {});

    ~SeekableReader();

    // Non-copyable, movable. A moved-from reader reports an empty stream and
    // may be destroyed or assigned to; source() must not be called on it.
    SeekableReader(const SeekableReader&) = delete;
    SeekableReader& operator=(const SeekableReader&) = delete;
    SeekableReader(SeekableReader&&) noexcept;
    SeekableReader& operator=(SeekableReader&&) noexcept;

    // =========================================================================
    // Positioning
    // =========================================================================

    /// @brief Move the cursor.
    /// @param offset Signed offset relative to `whence`.
    /// @param whence Seek origin.
    /// @return New absolute cursor.
    /// @throws InvalidSeekError if the result is negative or overflows; the
    ///         cursor is left unchanged.
    /// @note Positions past size() are allowed; reads there return 0 bytes.
    ///       Performs no I/O.
    std::uint64_t seek(std::int64_t offset, SeekWhence whence = SeekWhence::kStart);

    [[nodiscard]] std::uint64_t tell() const noexcept { return cursor_; }

    /// @brief Logical (decompressed) size of the archive.
    [[nodiscard]] std::uint64_t size() const noexcept {
        return index_ ? index_->totalLogicalSize() : 0;
    }

    /// @brief Logical bytes between the cursor and the end of the stream.
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return cursor_ < size() ? size() - cursor_ : 0;
    }

    [[nodiscard]] bool eof() const noexcept { return cursor_ >= size(); }

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Read at the cursor into a caller buffer.
    /// @return Bytes copied: min(buffer.size(), remaining()). 0 only at or past
    ///         the end of the stream.
    /// @throws TransportError, DecodeError for the first frame that cannot be
    ///         fetched or decoded. The cursor is left unchanged and the
    ///         buffer contents are unspecified.
    std::size_t read(std::span<std::uint8_t> buffer);

    /// @brief Read up to `length` bytes at the cursor.
    [[nodiscard]] ByteBuffer read(std::size_t length);

    /// @brief Positional read; same semantics as read() without moving the cursor.
    std::size_t readAt(std::uint64_t offset, std::span<std::uint8_t> buffer);

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] const std::shared_ptr<const format::FrameIndex>& frameIndex() const noexcept {
        return index_;
    }

    [[nodiscard]] const ReaderStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const FrameCache& cache() const noexcept { return cache_; }

    [[nodiscard]] const ReaderOptions& options() const noexcept { return options_; }

    [[nodiscard]] io::RangeSource& source() noexcept { return *source_; }

private:
    /// @brief Source name for error contexts; empty once moved from.
    [[nodiscard]] std::string sourceName() const;

    /// @brief Copy logical bytes starting at `offset` into `buffer`.
    std::size_t copyOut(std::uint64_t offset, std::span<std::uint8_t> buffer);

    /// @brief Get a frame's payload from the cache, fetching it on a miss.
    [[nodiscard]] FramePayload loadFrame(FrameId frameId, const format::FrameDescriptor& frame);

    /// @brief Fetch, decode and verify one frame.
    [[nodiscard]] ByteBuffer fetchFrame(FrameId frameId, const format::FrameDescriptor& frame);

    /// @brief Error context for a frame.
    [[nodiscard]] ErrorContext frameContext(FrameId frameId,
                                            const format::FrameDescriptor& frame) const;

    ReaderOptions options_;
    std::unique_ptr<io::RangeSource> source_;
    std::unique_ptr<codec::FrameDecoder> decoder_;
    std::shared_ptr<const format::FrameIndex> index_;
    FrameCache cache_;
    std::uint64_t cursor_ = 0;
    ReaderStats stats_;
};

}  // namespace zseek::reader

#endif  // ZSEEK_READER_SEEKABLE_READER_H
