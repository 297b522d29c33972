// =============================================================================
// zseek - Frame Decoders
// =============================================================================
// Decompression of single, independently decodable frames.
//
// This module provides:
// - FrameDecoder: abstract capability consumed by the reader
// - ZstdFrameDecoder: libzstd implementation with a reusable context
//
// Decoders only decompress. Checking the output length against the frame index
// and verifying checksums is the reader's job.
// =============================================================================

#ifndef ZSEEK_CODEC_FRAME_DECODER_H
#define ZSEEK_CODEC_FRAME_DECODER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "zseek/common/error.h"
#include "zseek/common/types.h"

// Forward declaration of the libzstd context to keep zstd.h out of the header
struct ZSTD_DCtx_s;

namespace zseek::codec {

// =============================================================================
// FrameDecoder Interface
// =============================================================================

/// @brief Decompresses one frame at a time.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    /// @brief Decompress a single frame.
    /// @param compressed The frame's compressed bytes.
    /// @param expectedSize Decompressed size recorded in the frame index.
    /// @return Decompressed bytes, never more than expectedSize.
    /// @throws DecodeError on malformed input or output exceeding expectedSize.
    [[nodiscard]] virtual ByteBuffer decodeFrame(std::span<const std::uint8_t> compressed,
                                                 std::size_t expectedSize) = 0;

protected:
    FrameDecoder() = default;
};

// =============================================================================
// ZstdFrameDecoder
// =============================================================================

/// @brief Zstandard frame decoder.
/// @note Reuses one ZSTD_DCtx across frames. Not thread-safe.
class ZstdFrameDecoder final : public FrameDecoder {
public:
    /// @throws DecodeError if the decompression context cannot be allocated.
    ZstdFrameDecoder();

    ~ZstdFrameDecoder() override;

    ZstdFrameDecoder(const ZstdFrameDecoder&) = delete;
    ZstdFrameDecoder& operator=(const ZstdFrameDecoder&) = delete;

    [[nodiscard]] ByteBuffer decodeFrame(std::span<const std::uint8_t> compressed,
                                         std::size_t expectedSize) override;

private:
    struct ContextDeleter {
        void operator()(ZSTD_DCtx_s* ctx) const noexcept;
    };

    std::unique_ptr<ZSTD_DCtx_s, ContextDeleter> ctx_;
};

}  // namespace zseek::codec

#endif  // ZSEEK_CODEC_FRAME_DECODER_H
