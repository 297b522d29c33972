// =============================================================================
// zseek - Seekable Reader Implementation
// =============================================================================
// Reads never return partial data on failure: the cursor only advances once
// every frame a read touches has been fetched, decoded and copied. Frames
// decoded before the failing one stay in the cache.
// =============================================================================

#include "zseek/reader/seekable_reader.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <utility>

#include <fmt/format.h>
#include <xxhash.h>

#include "zseek/common/logger.h"

namespace zseek::reader {

namespace {

[[nodiscard]] const ReaderOptions& validated(const ReaderOptions& options) {
    unwrapOrThrow(options.validate());
    return options;
}

[[nodiscard]] std::unique_ptr<io::RangeSource> requireSource(
    std::unique_ptr<io::RangeSource> source) {
    if (!source) {
        throw InvalidArgumentError("Range source must not be null");
    }
    return source;
}

/// @brief Seek table checksum: low 32 bits of XXH64 with seed 0.
[[nodiscard]] FrameChecksum frameChecksum(const ByteBuffer& data) noexcept {
    return static_cast<FrameChecksum>(XXH64(data.data(), data.size(), 0) & 0xFFFFFFFFULL);
}

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

SeekableReader::SeekableReader(std::unique_ptr<io::RangeSource> source, ReaderOptions options)
    : SeekableReader(std::move(source), std::make_unique<codec::ZstdFrameDecoder>(),
                     std::move(options)) {}

SeekableReader::SeekableReader(std::unique_ptr<io::RangeSource> source,
                               std::unique_ptr<codec::FrameDecoder> decoder,
                               ReaderOptions options)
    : options_(validated(options)),
      source_(requireSource(std::move(source))),
      decoder_(std::move(decoder)),
      cache_(options_.cacheCapacityBytes, options_.maxCachedFrames) {
    if (!decoder_) {
        throw InvalidArgumentError("Frame decoder must not be null");
    }

    index_ = format::FrameIndex::build(*source_, options_.trailerPrefetchBytes,
                                       options_.allowEmptyArchive);

    ZSEEK_LOG_DEBUG("SeekableReader opened: {}, frames={}, size={}, cache={} bytes/{} frames",
                    source_->name(), index_->frameCount(), index_->totalLogicalSize(),
                    options_.cacheCapacityBytes, options_.maxCachedFrames);
}

SeekableReader::SeekableReader(std::unique_ptr<io::RangeSource> source,
                               std::shared_ptr<const format::FrameIndex> index,
                               std::unique_ptr<codec::FrameDecoder> decoder,
                               ReaderOptions options)
    : options_(validated(options)),
      source_(requireSource(std::move(source))),
      decoder_(std::move(decoder)),
      index_(std::move(index)),
      cache_(options_.cacheCapacityBytes, options_.maxCachedFrames) {
    if (!decoder_) {
        throw InvalidArgumentError("Frame decoder must not be null");
    }
    if (!index_) {
        throw InvalidArgumentError("Frame index must not be null");
    }

    const std::uint64_t objectSize = source_->size();
    if (objectSize != index_->totalPhysicalSize()) {
        throw InvalidArgumentError(
            fmt::format("Frame index describes a {} byte object, source has {} bytes",
                        index_->totalPhysicalSize(), objectSize),
            ErrorContext(source_->name()));
    }

    if (index_->empty() && !options_.allowEmptyArchive) {
        throw EmptyArchiveError("No frames found in the archive", ErrorContext(source_->name()));
    }

    ZSEEK_LOG_DEBUG("SeekableReader attached to shared index: {}, frames={}, size={}",
                    source_->name(), index_->frameCount(), index_->totalLogicalSize());
}

Result<SeekableReader> SeekableReader::tryOpen(std::unique_ptr<io::RangeSource> source,
                                               ReaderOptions options) {
    return tryExecute([&]() { return SeekableReader(std::move(source), std::move(options)); });
}

SeekableReader::~SeekableReader() = default;

SeekableReader::SeekableReader(SeekableReader&&) noexcept = default;

SeekableReader& SeekableReader::operator=(SeekableReader&&) noexcept = default;

// =============================================================================
// Positioning
// =============================================================================

std::uint64_t SeekableReader::seek(std::int64_t offset, SeekWhence whence) {
    std::uint64_t base = 0;
    switch (whence) {
        case SeekWhence::kStart:
            base = 0;
            break;
        case SeekWhence::kCurrent:
            base = cursor_;
            break;
        case SeekWhence::kEnd:
            base = size();
            break;
    }

    std::uint64_t target = 0;
    if (offset >= 0) {
        const auto delta = static_cast<std::uint64_t>(offset);
        if (base > std::numeric_limits<std::uint64_t>::max() - delta) {
            throw InvalidSeekError(
                fmt::format("Seek from {} by {} overflows", seekWhenceToString(whence), offset),
                ErrorContext(sourceName()).withLogicalOffset(base));
        }
        target = base + delta;
    } else {
        // Magnitude of a negative int64 without overflowing on INT64_MIN
        const std::uint64_t delta = static_cast<std::uint64_t>(-(offset + 1)) + 1;
        if (delta > base) {
            throw InvalidSeekError(
                fmt::format("Seek from {} by {} lands before the start of the stream",
                            seekWhenceToString(whence), offset),
                ErrorContext(sourceName()).withLogicalOffset(base));
        }
        target = base - delta;
    }

    cursor_ = target;
    return cursor_;
}

// =============================================================================
// Reading
// =============================================================================

std::size_t SeekableReader::read(std::span<std::uint8_t> buffer) {
    const std::size_t copied = copyOut(cursor_, buffer);
    cursor_ += copied;
    return copied;
}

ByteBuffer SeekableReader::read(std::size_t length) {
    const std::uint64_t available = remaining();
    if (available == 0 || length == 0) {
        return {};
    }

    ByteBuffer out(static_cast<std::size_t>(std::min<std::uint64_t>(length, available)));
    const std::size_t copied = copyOut(cursor_, out);
    out.resize(copied);
    cursor_ += copied;
    return out;
}

std::size_t SeekableReader::readAt(std::uint64_t offset, std::span<std::uint8_t> buffer) {
    return copyOut(offset, buffer);
}

std::string SeekableReader::sourceName() const {
    return source_ ? source_->name() : std::string{};
}

std::size_t SeekableReader::copyOut(std::uint64_t offset, std::span<std::uint8_t> buffer) {
    const std::uint64_t logicalSize = size();
    if (offset >= logicalSize || buffer.empty()) {
        return 0;
    }

    const std::size_t toCopy =
        static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), logicalSize - offset));

    std::size_t copied = 0;
    while (copied < toCopy) {
        const std::uint64_t position = offset + copied;
        const FrameId frameId = index_->findFrame(position);
        if (frameId == kInvalidFrameId) {
            throw OutOfRangeError("No frame covers an in-range logical offset",
                                  ErrorContext(source_->name()).withLogicalOffset(position));
        }

        const auto& frame = index_->frame(frameId);
        const FramePayload payload = loadFrame(frameId, frame);

        const std::uint64_t inFrame = position - frame.decompressedOffset;
        const std::size_t chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>(toCopy - copied, frame.decompressedSize - inFrame));

        std::memcpy(buffer.data() + copied, payload->data() + inFrame, chunk);
        copied += chunk;
    }

    stats_.bytesRead += copied;
    return copied;
}

// =============================================================================
// Frame Loading
// =============================================================================

FramePayload SeekableReader::loadFrame(FrameId frameId, const format::FrameDescriptor& frame) {
    if (FramePayload cached = cache_.get(frameId)) {
        ++stats_.cacheHits;
        return cached;
    }
    ++stats_.cacheMisses;

    auto payload = std::make_shared<const ByteBuffer>(fetchFrame(frameId, frame));
    cache_.put(frameId, payload);
    return payload;
}

ByteBuffer SeekableReader::fetchFrame(FrameId frameId, const format::FrameDescriptor& frame) {
    ZSEEK_LOG_TRACE("Fetching frame {} of {}: physical [{}, +{}), logical [{}, +{})", frameId,
                    source_->name(), frame.compressedOffset, frame.compressedSize,
                    frame.decompressedOffset, frame.decompressedSize);

    ++stats_.rangeRequests;
    const ByteBuffer compressed = source_->readRange(frame.compressedOffset, frame.compressedSize);
    stats_.compressedBytesFetched += compressed.size();

    if (compressed.size() != frame.compressedSize) {
        throw TransportError(fmt::format("Frame fetch returned {} bytes, expected {}",
                                         compressed.size(), frame.compressedSize),
                             frameContext(frameId, frame));
    }

    ByteBuffer decoded;
    try {
        decoded = decoder_->decodeFrame(compressed, frame.decompressedSize);
    } catch (const DecodeError& ex) {
        // Decoders know nothing about frames, attach where it happened
        throw DecodeError(ex.message(), frameContext(frameId, frame));
    }

    if (decoded.size() != frame.decompressedSize) {
        throw DecodeError(fmt::format("Frame decoded to {} bytes, index expects {}",
                                      decoded.size(), frame.decompressedSize),
                          frameContext(frameId, frame));
    }

    if (options_.verifyChecksums && frame.hasChecksum) {
        const FrameChecksum actual = frameChecksum(decoded);
        if (actual != frame.checksum) {
            ZSEEK_LOG_WARNING("Frame {} checksum mismatch in {}: expected {:08x}, got {:08x}",
                              frameId, source_->name(), frame.checksum, actual);
            throw DecodeError(frame.checksum, actual, frameContext(frameId, frame));
        }
    }

    ++stats_.framesDecoded;
    return decoded;
}

ErrorContext SeekableReader::frameContext(FrameId frameId,
                                          const format::FrameDescriptor& frame) const {
    return ErrorContext(source_->name())
        .withFrame(frameId)
        .withPhysicalOffset(frame.compressedOffset)
        .withLogicalOffset(frame.decompressedOffset);
}

}  // namespace zseek::reader
