// =============================================================================
// zseek - Reader Options Implementation
// =============================================================================

#include "zseek/reader/reader_options.h"

#include <string>

#include "zseek/format/seek_table.h"

namespace zseek::reader {

VoidResult ReaderOptions::validate() const {
    if (trailerPrefetchBytes < format::SeekTableFooter::kSize) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "Trailer prefetch must be at least " +
                                 std::to_string(format::SeekTableFooter::kSize) + " bytes");
    }

    if (trailerPrefetchBytes > kMaxTrailerPrefetchBytes) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "Trailer prefetch must not exceed " +
                                 std::to_string(kMaxTrailerPrefetchBytes) + " bytes");
    }

    if ((cacheCapacityBytes == 0) != (maxCachedFrames == 0)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "Cache byte capacity and frame limit must both be zero to "
                             "disable caching");
    }

    return makeVoidSuccess();
}

}  // namespace zseek::reader
