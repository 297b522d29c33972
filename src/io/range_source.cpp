// =============================================================================
// zseek - Range Sources Implementation
// =============================================================================

#include "zseek/io/range_source.h"

#include <cerrno>
#include <system_error>

#include <fmt/format.h>

#include "zseek/common/logger.h"

namespace zseek::io {

void checkRange(std::uint64_t offset, std::uint64_t length, std::uint64_t objectSize,
                const std::string& sourceName) {
    if (offset > objectSize || length > objectSize - offset) {
        throw TransportError(
            fmt::format("Range [{}, +{}) exceeds object size {}", offset, length, objectSize),
            ErrorContext(sourceName).withPhysicalOffset(offset));
    }
}

// =============================================================================
// MemoryRangeSource Implementation
// =============================================================================

MemoryRangeSource::MemoryRangeSource(ByteBuffer data, std::string name)
    : data_(std::move(data)), name_(std::move(name)) {}

ByteBuffer MemoryRangeSource::readRange(std::uint64_t offset, std::uint64_t length) {
    checkRange(offset, length, data_.size(), name_);
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return ByteBuffer(first, first + static_cast<std::ptrdiff_t>(length));
}

// =============================================================================
// FileRangeSource Implementation
// =============================================================================

FileRangeSource::FileRangeSource(std::filesystem::path path) : path_(std::move(path)) {
    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        throw TransportError("Failed to open archive file",
                             std::error_code(errno, std::generic_category()),
                             ErrorContext(path_.string()));
    }

    stream_.seekg(0, std::ios::end);
    const auto end = stream_.tellg();
    if (end < 0) {
        throw TransportError("Failed to determine file size", ErrorContext(path_.string()));
    }
    fileSize_ = static_cast<std::uint64_t>(end);
    stream_.seekg(0, std::ios::beg);

    ZSEEK_LOG_DEBUG("FileRangeSource opened: {}, size={}", path_.string(), fileSize_);
}

FileRangeSource::~FileRangeSource() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

ByteBuffer FileRangeSource::readRange(std::uint64_t offset, std::uint64_t length) {
    checkRange(offset, length, fileSize_, path_.string());

    ByteBuffer buffer(static_cast<std::size_t>(length));
    if (length == 0) {
        return buffer;
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        throw TransportError("Failed to seek in file",
                             ErrorContext(path_.string()).withPhysicalOffset(offset));
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(stream_.gcount()) != length) {
        throw TransportError(fmt::format("Short read: expected {} bytes, got {}", length,
                                         stream_.gcount()),
                             ErrorContext(path_.string()).withPhysicalOffset(offset));
    }

    return buffer;
}

}  // namespace zseek::io
