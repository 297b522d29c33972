// =============================================================================
// zseek - Seekable Reader Tests
// =============================================================================
// Unit tests for cursor handling, frame-minimal fetching, caching, and the
// failure behavior of SeekableReader.
// =============================================================================

#include "zseek/reader/seekable_reader.h"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "test_support/seekable_archive.h"

namespace zseek::reader::test {
namespace {

using zseek::test::CountingRangeSource;
using zseek::test::FaultyRangeSource;
using zseek::test::makeArchive;
using zseek::test::memorySource;
using zseek::test::RequestLog;
using zseek::test::SeekableArchiveBuilder;

[[nodiscard]] ByteBuffer slice(const ByteBuffer& data, std::size_t from, std::size_t length) {
    return ByteBuffer(data.begin() + static_cast<std::ptrdiff_t>(from),
                      data.begin() + static_cast<std::ptrdiff_t>(from + length));
}

/// @brief Decoder that drops the last decoded byte.
class TruncatingDecoder final : public codec::FrameDecoder {
public:
    [[nodiscard]] ByteBuffer decodeFrame(std::span<const std::uint8_t> compressed,
                                         std::size_t expectedSize) override {
        ByteBuffer out = inner_.decodeFrame(compressed, expectedSize);
        if (!out.empty()) {
            out.pop_back();
        }
        return out;
    }

private:
    codec::ZstdFrameDecoder inner_;
};

// =============================================================================
// Fixture: three frames of 100, 200 and 150 logical bytes
// =============================================================================

class SeekableReaderTest : public ::testing::Test {
protected:
    void SetUp() override { archive_ = makeArchive({100, 200, 150}, &logical_); }

    /// @brief Reader over the archive, recording frame requests in log_.
    [[nodiscard]] SeekableReader openCounting(ReaderOptions options = {}) {
        SeekableReader reader(
            std::make_unique<CountingRangeSource>(memorySource(archive_), log_), options);
        log_->reset();
        return reader;
    }

    /// @brief Compressed offset of a frame.
    [[nodiscard]] std::uint64_t frameOffset(FrameId id) const {
        io::MemoryRangeSource source(archive_);
        return format::FrameIndex::build(source)->frame(id).compressedOffset;
    }

    ByteBuffer archive_;
    ByteBuffer logical_;
    std::shared_ptr<RequestLog> log_ = std::make_shared<RequestLog>();
};

// =============================================================================
// Reading
// =============================================================================

TEST_F(SeekableReaderTest, ReadAcrossFrameBoundary) {
    auto reader = openCounting();

    EXPECT_EQ(reader.seek(90), 90U);
    const ByteBuffer bytes = reader.read(30);

    EXPECT_EQ(bytes, slice(logical_, 90, 30));
    EXPECT_EQ(reader.tell(), 120U);
    EXPECT_EQ(log_->count(), 2U);
    EXPECT_EQ(reader.stats().framesDecoded, 2U);
}

TEST_F(SeekableReaderTest, ReadNearEndIsClamped) {
    auto reader = openCounting();

    reader.seek(449);
    EXPECT_EQ(reader.read(10), slice(logical_, 449, 1));
    EXPECT_EQ(reader.tell(), 450U);
    EXPECT_TRUE(reader.eof());
}

TEST_F(SeekableReaderTest, ReadAtEndReturnsNothing) {
    auto reader = openCounting();

    reader.seek(450);
    EXPECT_TRUE(reader.read(10).empty());
    EXPECT_EQ(reader.tell(), 450U);
    EXPECT_EQ(log_->count(), 0U);
}

TEST_F(SeekableReaderTest, SeekPastEndIsAllowed) {
    auto reader = openCounting();

    EXPECT_EQ(reader.seek(10'000), 10'000U);
    EXPECT_EQ(reader.remaining(), 0U);
    EXPECT_TRUE(reader.eof());

    std::vector<std::uint8_t> buffer(16);
    EXPECT_EQ(reader.read(buffer), 0U);
    EXPECT_EQ(reader.tell(), 10'000U);
}

TEST_F(SeekableReaderTest, ReadWholeStream) {
    auto reader = openCounting();

    EXPECT_EQ(reader.size(), 450U);
    EXPECT_EQ(reader.read(1000), logical_);
    EXPECT_EQ(log_->count(), 3U);
    EXPECT_EQ(reader.stats().bytesRead, 450U);
}

TEST_F(SeekableReaderTest, ReadIntoSpan) {
    auto reader = openCounting();

    std::vector<std::uint8_t> buffer(250);
    reader.seek(150);
    EXPECT_EQ(reader.read(buffer), 250U);
    EXPECT_EQ(ByteBuffer(buffer.begin(), buffer.end()), slice(logical_, 150, 250));

    // Only 50 bytes remain
    EXPECT_EQ(reader.read(buffer), 50U);
    EXPECT_TRUE(reader.eof());
}

TEST_F(SeekableReaderTest, ZeroLengthReadDoesNothing) {
    auto reader = openCounting();

    reader.seek(120);
    EXPECT_TRUE(reader.read(0).empty());
    EXPECT_EQ(reader.tell(), 120U);
    EXPECT_EQ(log_->count(), 0U);
}

TEST_F(SeekableReaderTest, ReadAtKeepsCursor) {
    auto reader = openCounting();
    reader.seek(5);

    std::vector<std::uint8_t> buffer(40);
    EXPECT_EQ(reader.readAt(290, buffer), 40U);
    EXPECT_EQ(ByteBuffer(buffer.begin(), buffer.end()), slice(logical_, 290, 40));
    EXPECT_EQ(reader.tell(), 5U);

    EXPECT_EQ(reader.readAt(450, buffer), 0U);
}

// =============================================================================
// Frame-Minimal Fetching and Caching
// =============================================================================

TEST_F(SeekableReaderTest, FetchesOnlyTouchedFrames) {
    auto reader = openCounting();

    reader.seek(150);
    (void)reader.read(100);

    ASSERT_EQ(log_->count(), 1U);
    EXPECT_EQ(log_->requests[0].offset, frameOffset(1));
    EXPECT_EQ(log_->requests[0].length, reader.frameIndex()->frame(1).compressedSize);
}

TEST_F(SeekableReaderTest, RepeatedReadHitsCache) {
    auto reader = openCounting();

    reader.seek(90);
    const ByteBuffer first = reader.read(30);
    reader.seek(90);
    const ByteBuffer second = reader.read(30);

    EXPECT_EQ(first, second);
    EXPECT_EQ(log_->count(), 2U);
    EXPECT_EQ(reader.stats().cacheHits, 2U);
    EXPECT_EQ(reader.cache().size(), 2U);
}

TEST_F(SeekableReaderTest, DisabledCacheRefetches) {
    auto reader = openCounting(ReaderOptions::withoutCache());

    reader.seek(10);
    (void)reader.read(10);
    reader.seek(10);
    (void)reader.read(10);

    EXPECT_EQ(log_->count(), 2U);
    EXPECT_TRUE(reader.cache().empty());
}

TEST_F(SeekableReaderTest, SmallCacheEvictsButStaysCorrect) {
    ReaderOptions options;
    options.maxCachedFrames = 1;
    auto reader = openCounting(options);

    for (int pass = 0; pass < 2; ++pass) {
        reader.seek(0);
        EXPECT_EQ(reader.read(450), logical_);
    }
    EXPECT_EQ(reader.cache().size(), 1U);
    EXPECT_EQ(log_->count(), 6U);
}

// =============================================================================
// Seeking
// =============================================================================

TEST_F(SeekableReaderTest, SeekWhenceVariants) {
    auto reader = openCounting();

    EXPECT_EQ(reader.seek(90, SeekWhence::kStart), 90U);
    EXPECT_EQ(reader.seek(10, SeekWhence::kCurrent), 100U);
    EXPECT_EQ(reader.seek(-40, SeekWhence::kCurrent), 60U);
    EXPECT_EQ(reader.seek(-10, SeekWhence::kEnd), 440U);
    EXPECT_EQ(reader.seek(5, SeekWhence::kEnd), 455U);
    EXPECT_EQ(reader.seek(-450, SeekWhence::kEnd), 0U);
}

TEST_F(SeekableReaderTest, NegativeSeekIsRejected) {
    auto reader = openCounting();
    reader.seek(42);

    EXPECT_THROW(reader.seek(-1), InvalidSeekError);
    EXPECT_THROW(reader.seek(-43, SeekWhence::kCurrent), InvalidSeekError);
    EXPECT_THROW(reader.seek(-451, SeekWhence::kEnd), InvalidSeekError);
    EXPECT_THROW(reader.seek(std::numeric_limits<std::int64_t>::min(), SeekWhence::kCurrent),
                 InvalidSeekError);
    EXPECT_EQ(reader.tell(), 42U);
}

TEST_F(SeekableReaderTest, OverflowingSeekIsRejected) {
    auto reader = openCounting();
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();

    reader.seek(kMax);
    const std::uint64_t twice = reader.seek(kMax, SeekWhence::kCurrent);
    EXPECT_EQ(twice, 2 * static_cast<std::uint64_t>(kMax));

    EXPECT_THROW(reader.seek(kMax, SeekWhence::kCurrent), InvalidSeekError);
    EXPECT_EQ(reader.tell(), twice);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(SeekableReaderTest, TransportFailureLeavesCursorAndCache) {
    auto failing = std::make_shared<FaultyRangeSource::Predicate>();
    SeekableReader reader(std::make_unique<FaultyRangeSource>(memorySource(archive_), failing));

    const std::uint64_t badOffset = frameOffset(1);
    *failing = [badOffset](std::uint64_t offset, std::uint64_t) { return offset == badOffset; };

    reader.seek(50);
    EXPECT_THROW((void)reader.read(100), TransportError);
    EXPECT_EQ(reader.tell(), 50U);
    EXPECT_TRUE(reader.cache().contains(0));
    EXPECT_FALSE(reader.cache().contains(1));

    // Frames outside the failing one keep working
    reader.seek(310);
    EXPECT_EQ(reader.read(20), slice(logical_, 310, 20));

    // Retrying once the source recovers succeeds
    *failing = nullptr;
    reader.seek(50);
    EXPECT_EQ(reader.read(100), slice(logical_, 50, 100));
    EXPECT_EQ(reader.tell(), 150U);
}

TEST_F(SeekableReaderTest, CorruptFrameIsDecodeError) {
    archive_[frameOffset(1)] ^= 0xFF;
    SeekableReader reader(memorySource(archive_));

    reader.seek(120);
    try {
        (void)reader.read(10);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->frameId, 1U);
        EXPECT_EQ(ex.context()->logicalOffset, 100U);
    }
    EXPECT_EQ(reader.tell(), 120U);

    reader.seek(0);
    EXPECT_EQ(reader.read(100), slice(logical_, 0, 100));
}

TEST_F(SeekableReaderTest, ShortFetchIsTransportError) {
    SeekableReader reader(
        std::make_unique<zseek::test::ShortReadRangeSource>(memorySource(archive_)));
    EXPECT_THROW((void)reader.read(10), TransportError);
    EXPECT_EQ(reader.tell(), 0U);
}

TEST_F(SeekableReaderTest, DecodedLengthMismatchIsDecodeError) {
    SeekableReader reader(memorySource(archive_), std::make_unique<TruncatingDecoder>());
    EXPECT_THROW((void)reader.read(10), DecodeError);
}

TEST_F(SeekableReaderTest, ChecksumMismatchIsDecodeError) {
    SeekableArchiveBuilder builder;
    builder.addFrames(logical_, {100, 200, 150});
    ByteBuffer archive = builder.finish();

    // Skippable header, one 12-byte entry, then frame 1's sizes
    const std::size_t checksumPos = builder.framesSize() + 8 + 12 + 8;
    archive[checksumPos] ^= 0x01;

    SeekableReader reader(memorySource(archive));
    reader.seek(150);
    try {
        (void)reader.read(10);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& ex) {
        ASSERT_TRUE(ex.expectedChecksum().has_value());
        ASSERT_TRUE(ex.actualChecksum().has_value());
        EXPECT_NE(*ex.expectedChecksum(), *ex.actualChecksum());
    }
    EXPECT_FALSE(reader.cache().contains(1));

    ReaderOptions options;
    options.verifyChecksums = false;
    SeekableReader lenient(memorySource(archive), options);
    lenient.seek(150);
    EXPECT_EQ(lenient.read(10), slice(logical_, 150, 10));
}

TEST_F(SeekableReaderTest, CorruptIndexFailsConstruction) {
    archive_.back() ^= 0xFF;
    EXPECT_THROW(SeekableReader reader(memorySource(archive_)), CorruptIndexError);
}

// =============================================================================
// Construction
// =============================================================================

TEST_F(SeekableReaderTest, InvalidOptionsRejected) {
    ReaderOptions options;
    options.trailerPrefetchBytes = 1;
    EXPECT_THROW(SeekableReader reader(memorySource(archive_), options), InvalidArgumentError);
}

TEST_F(SeekableReaderTest, NullSourceRejected) {
    EXPECT_THROW(SeekableReader reader(nullptr), InvalidArgumentError);
}

TEST_F(SeekableReaderTest, SharedIndexAcrossReaders) {
    SeekableReader first(memorySource(archive_));
    SeekableReader second(memorySource(archive_), first.frameIndex(),
                          std::make_unique<codec::ZstdFrameDecoder>());

    EXPECT_EQ(first.frameIndex(), second.frameIndex());

    first.seek(200);
    second.seek(200);
    EXPECT_EQ(first.read(50), second.read(50));
    EXPECT_EQ(second.tell(), 250U);
    EXPECT_EQ(first.cache().size(), 1U);
    EXPECT_EQ(second.cache().size(), 1U);
}

TEST_F(SeekableReaderTest, SharedIndexMustMatchSource) {
    SeekableReader first(memorySource(archive_));
    ByteBuffer other = makeArchive({10});

    EXPECT_THROW(SeekableReader reader(memorySource(other), first.frameIndex(),
                                       std::make_unique<codec::ZstdFrameDecoder>()),
                 InvalidArgumentError);
}

TEST_F(SeekableReaderTest, MovedReaderKeepsState) {
    SeekableReader reader(memorySource(archive_));
    reader.seek(300);
    (void)reader.read(10);

    SeekableReader moved(std::move(reader));
    EXPECT_EQ(moved.tell(), 310U);
    EXPECT_EQ(moved.read(10), slice(logical_, 310, 10));
}

TEST_F(SeekableReaderTest, MovedFromReaderReportsEmptyStream) {
    SeekableReader reader(memorySource(archive_));
    SeekableReader moved(std::move(reader));

    EXPECT_EQ(reader.size(), 0U);
    EXPECT_EQ(reader.remaining(), 0U);
    EXPECT_TRUE(reader.eof());
    EXPECT_TRUE(reader.read(10).empty());

    std::array<std::uint8_t, 4> buffer{};
    EXPECT_EQ(reader.readAt(0, buffer), 0U);

    EXPECT_THROW(reader.seek(-1), InvalidSeekError);
    EXPECT_THROW(reader.seek(-1, SeekWhence::kEnd), InvalidSeekError);
    EXPECT_EQ(reader.seek(5), 5U);

    EXPECT_EQ(moved.size(), 450U);
}

TEST_F(SeekableReaderTest, TryOpenSucceeds) {
    auto result = SeekableReader::tryOpen(memorySource(archive_));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 450U);
    EXPECT_EQ(result->read(5), slice(logical_, 0, 5));
}

TEST_F(SeekableReaderTest, TryOpenReportsIndexErrors) {
    ByteBuffer truncated(archive_.end() - 9, archive_.end());
    auto result = SeekableReader::tryOpen(memorySource(truncated));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kTruncatedIndex);
    EXPECT_TRUE(isIndexError(result.error().code()));
}

// =============================================================================
// Edge Archives
// =============================================================================

TEST(SeekableReaderEdgeTest, EmptyArchive) {
    const ByteBuffer archive = SeekableArchiveBuilder().finish();

    SeekableReader reader(memorySource(archive));
    EXPECT_EQ(reader.size(), 0U);
    EXPECT_TRUE(reader.eof());
    EXPECT_TRUE(reader.read(100).empty());
    EXPECT_EQ(reader.seek(0, SeekWhence::kEnd), 0U);
    EXPECT_THROW(reader.seek(-1, SeekWhence::kEnd), InvalidSeekError);
}

TEST(SeekableReaderEdgeTest, EmptyArchiveRejectedOnRequest) {
    const ByteBuffer archive = SeekableArchiveBuilder().finish();
    ReaderOptions options;
    options.allowEmptyArchive = false;

    auto result = SeekableReader::tryOpen(memorySource(archive), options);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kEmptyArchive);
}

TEST(SeekableReaderEdgeTest, ZeroSizedFrames) {
    ByteBuffer logical;
    const ByteBuffer archive = makeArchive({0, 50, 0, 0, 70, 0}, &logical);

    SeekableReader reader(memorySource(archive));
    EXPECT_EQ(reader.size(), 120U);
    EXPECT_EQ(reader.read(200), logical);

    reader.seek(50);
    EXPECT_EQ(reader.read(1), slice(logical, 50, 1));
}

TEST(SeekableReaderEdgeTest, ArchiveWithoutChecksums) {
    ByteBuffer logical;
    const ByteBuffer archive = makeArchive({300, 300}, &logical, false);

    SeekableReader reader(memorySource(archive));
    EXPECT_FALSE(reader.frameIndex()->hasChecksums());
    EXPECT_EQ(reader.read(600), logical);
}

TEST(SeekableReaderEdgeTest, LargeSeekTableNeedsSecondFetch) {
    ByteBuffer logical;
    std::vector<std::size_t> sizes(500, 20);
    const ByteBuffer archive = makeArchive(sizes, &logical);

    ReaderOptions options;
    options.trailerPrefetchBytes = 64;
    SeekableReader reader(memorySource(archive), options);

    EXPECT_EQ(reader.frameIndex()->frameCount(), 500U);
    reader.seek(4321);
    EXPECT_EQ(reader.read(100), slice(logical, 4321, 100));
}

TEST(SeekableReaderEdgeTest, FileBackedArchive) {
    ByteBuffer logical;
    const ByteBuffer archive = makeArchive({4096, 1000, 8192}, &logical);

    static std::atomic<int> counter{0};
    const auto path = std::filesystem::temp_directory_path() /
                      ("zseek_reader_test_" + std::to_string(counter++) + "_" +
                       std::to_string(std::random_device{}()) + ".zst");
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(archive.data()),
                  static_cast<std::streamsize>(archive.size()));
    }

    {
        SeekableReader reader(std::make_unique<io::FileRangeSource>(path));
        reader.seek(4000);
        EXPECT_EQ(reader.read(2000), slice(logical, 4000, 2000));
        EXPECT_EQ(reader.stats().rangeRequests, 3U);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace
}  // namespace zseek::reader::test
