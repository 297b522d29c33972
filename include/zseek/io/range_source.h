// =============================================================================
// zseek - Range Sources
// =============================================================================
// Byte-range access to a stored object.
//
// This module provides:
// - RangeSource: abstract capability consumed by the reader
// - MemoryRangeSource: object held in memory
// - FileRangeSource: object stored in a local file
//
// Remote stores (S3, HTTP) implement RangeSource outside the library. The
// contract every implementation must honour:
// - size() reports the total object size and is stable for the source lifetime
// - readRange(offset, length) returns exactly `length` bytes or throws
//   TransportError, including when offset + length exceeds size()
// - no retries are expected at this layer, though implementations may retry
//
// Usage:
//   auto source = std::make_unique<FileRangeSource>("/data/trace.zst");
//   auto bytes = source->readRange(source->size() - 9, 9);
// =============================================================================

#ifndef ZSEEK_IO_RANGE_SOURCE_H
#define ZSEEK_IO_RANGE_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "zseek/common/error.h"
#include "zseek/common/types.h"

namespace zseek::io {

// =============================================================================
// RangeSource Interface
// =============================================================================

/// @brief Random-access byte source for an immutable object.
///
/// Thread Safety:
/// - Implementations need not be thread-safe; a reader calls its source from
///   one thread at a time.
class RangeSource {
public:
    virtual ~RangeSource() = default;

    /// @brief Total object size in bytes.
    /// @throws TransportError if the size cannot be determined.
    [[nodiscard]] virtual std::uint64_t size() = 0;

    /// @brief Fetch bytes [offset, offset + length).
    /// @return Exactly `length` bytes.
    /// @throws TransportError on out-of-bounds requests or transport failure.
    [[nodiscard]] virtual ByteBuffer readRange(std::uint64_t offset, std::uint64_t length) = 0;

    /// @brief Human-readable object name used in errors and logs.
    [[nodiscard]] virtual std::string name() const = 0;

protected:
    RangeSource() = default;
    RangeSource(const RangeSource&) = default;
    RangeSource& operator=(const RangeSource&) = default;
};

/// @brief Throw TransportError unless [offset, offset + length) lies within objectSize.
/// @param offset First requested byte.
/// @param length Number of requested bytes.
/// @param objectSize Total object size.
/// @param sourceName Name used in the error context.
void checkRange(std::uint64_t offset, std::uint64_t length, std::uint64_t objectSize,
                const std::string& sourceName);

// =============================================================================
// MemoryRangeSource
// =============================================================================

/// @brief Range source over an owned in-memory buffer.
class MemoryRangeSource final : public RangeSource {
public:
    explicit MemoryRangeSource(ByteBuffer data, std::string name = "memory");

    [[nodiscard]] std::uint64_t size() override { return data_.size(); }

    [[nodiscard]] ByteBuffer readRange(std::uint64_t offset, std::uint64_t length) override;

    [[nodiscard]] std::string name() const override { return name_; }

    /// @brief Access the underlying bytes.
    [[nodiscard]] const ByteBuffer& data() const noexcept { return data_; }

private:
    ByteBuffer data_;
    std::string name_;
};

// =============================================================================
// FileRangeSource
// =============================================================================

/// @brief Range source over a local file.
/// @note The file is opened on construction and assumed immutable afterwards.
class FileRangeSource final : public RangeSource {
public:
    /// @brief Open the file for positioned reads.
    /// @throws TransportError if the file cannot be opened.
    explicit FileRangeSource(std::filesystem::path path);

    ~FileRangeSource() override;

    FileRangeSource(const FileRangeSource&) = delete;
    FileRangeSource& operator=(const FileRangeSource&) = delete;

    [[nodiscard]] std::uint64_t size() override { return fileSize_; }

    [[nodiscard]] ByteBuffer readRange(std::uint64_t offset, std::uint64_t length) override;

    [[nodiscard]] std::string name() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t fileSize_ = 0;
};

}  // namespace zseek::io

#endif  // ZSEEK_IO_RANGE_SOURCE_H
