// =============================================================================
// zseek - Reader Options
// =============================================================================
// Tunables of a SeekableReader.
//
// The library does not load configuration from files or the environment; the
// embedding application fills a ReaderOptions and hands it to the reader,
// which validates it on construction.
// =============================================================================

#ifndef ZSEEK_READER_READER_OPTIONS_H
#define ZSEEK_READER_READER_OPTIONS_H

#include <cstddef>

#include "zseek/common/error.h"
#include "zseek/common/types.h"

namespace zseek::reader {

struct ReaderOptions {
    /// @brief Budget for cached decompressed payloads (0 disables the cache).
    std::size_t cacheCapacityBytes = kDefaultCacheCapacityBytes;

    /// @brief Maximum number of cached frames (0 disables the cache).
    std::size_t maxCachedFrames = kDefaultMaxCachedFrames;

    /// @brief Tail bytes fetched by the first index request.
    std::size_t trailerPrefetchBytes = kDefaultTrailerPrefetchBytes;

    /// @brief Verify per-frame checksums when the archive carries them.
    bool verifyChecksums = true;

    /// @brief Accept archives with zero frames as an empty stream.
    /// @note When false, construction fails with EmptyArchiveError.
    bool allowEmptyArchive = true;

    /// @brief Validate the option values.
    /// @return VoidResult holding kInvalidArgument on failure.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Options with caching turned off.
    [[nodiscard]] static ReaderOptions withoutCache() noexcept {
        ReaderOptions options;
        options.cacheCapacityBytes = 0;
        options.maxCachedFrames = 0;
        return options;
    }

    [[nodiscard]] bool operator==(const ReaderOptions& other) const noexcept = default;
};

}  // namespace zseek::reader

#endif  // ZSEEK_READER_READER_OPTIONS_H
