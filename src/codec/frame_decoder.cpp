// =============================================================================
// zseek - Frame Decoders Implementation
// =============================================================================

#include "zseek/codec/frame_decoder.h"

#include <cstdint>
#include <string>

#include <fmt/format.h>
#include <zstd.h>

namespace zseek::codec {

namespace {

/// @brief Largest decompressed size of a single Zstd block (RFC 8878).
constexpr std::uint64_t kMaxBlockSize = 128 * 1024;

}  // namespace

void ZstdFrameDecoder::ContextDeleter::operator()(ZSTD_DCtx_s* ctx) const noexcept {
    ZSTD_freeDCtx(ctx);
}

ZstdFrameDecoder::ZstdFrameDecoder() : ctx_(ZSTD_createDCtx()) {
    if (!ctx_) {
        throw DecodeError("Failed to create Zstd decompression context");
    }
}

ZstdFrameDecoder::~ZstdFrameDecoder() = default;

ByteBuffer ZstdFrameDecoder::decodeFrame(std::span<const std::uint8_t> compressed,
                                         std::size_t expectedSize) {
    if (compressed.empty()) {
        throw DecodeError("Empty compressed frame");
    }

    unsigned long long const contentSize =
        ZSTD_getFrameContentSize(compressed.data(), compressed.size());
    if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
        throw DecodeError("Invalid Zstd frame header");
    }
    if (contentSize != ZSTD_CONTENTSIZE_UNKNOWN && contentSize != expectedSize) {
        throw DecodeError(fmt::format("Zstd frame declares {} bytes, index expects {}",
                                      contentSize, expectedSize));
    }

    // Every block costs at least 4 input bytes and yields at most one maximum
    // block, so a larger expected size cannot come from this frame.
    const std::uint64_t maxOutput =
        (static_cast<std::uint64_t>(compressed.size()) / 4 + 1) * kMaxBlockSize;
    if (expectedSize > maxOutput) {
        throw DecodeError(fmt::format(
            "Index expects {} bytes from a {}-byte Zstd frame, at most {} are possible",
            expectedSize, compressed.size(), maxOutput));
    }

    ByteBuffer decompressed(expectedSize);
    std::size_t const dSize = ZSTD_decompressDCtx(ctx_.get(), decompressed.data(),
                                                  decompressed.size(), compressed.data(),
                                                  compressed.size());
    if (ZSTD_isError(dSize)) {
        throw DecodeError("Zstd decompression failed: " + std::string(ZSTD_getErrorName(dSize)));
    }

    decompressed.resize(dSize);
    return decompressed;
}

}  // namespace zseek::codec
