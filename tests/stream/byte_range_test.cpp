#include "rms/stream/byte_range.hpp"

#include <gtest/gtest.h>

using rms::ErrorCode;
using rms::stream::ByteRange;
using rms::stream::ChunkSlice;
using rms::stream::chunk_span;
using rms::stream::content_range;
using rms::stream::parse_range;
using rms::stream::plan_slices;

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

ByteRange parsed_range(const std::string& header, std::uint64_t total, std::uint64_t cap = 0) {
    auto result = parse_range(header, total, cap);
    EXPECT_TRUE(result.is_ok());
    EXPECT_TRUE(result.is_ok() && result.value().has_value());
    return result.is_ok() && result.value() ? *result.value() : ByteRange{};
}

} // namespace

TEST(ParseRangeTest, ClosedRange) {
    auto range = parsed_range("bytes=0-1023", 483822037);
    EXPECT_EQ(range.start, 0u);
    EXPECT_EQ(range.end, 1023u);
    EXPECT_EQ(range.length(), 1024u);
    EXPECT_EQ(content_range(range, 483822037), "bytes 0-1023/483822037");
}

TEST(ParseRangeTest, EndIsClampedToLastByte) {
    auto range = parsed_range("bytes=90-5000", 100);
    EXPECT_EQ(range.start, 90u);
    EXPECT_EQ(range.end, 99u);
}

TEST(ParseRangeTest, OpenRangeHonorsCap) {
    auto uncapped = parsed_range("bytes=10-", 100);
    EXPECT_EQ(uncapped.end, 99u);

    auto capped = parsed_range("bytes=0-", 10 * kMiB, 2 * kMiB);
    EXPECT_EQ(capped.start, 0u);
    EXPECT_EQ(capped.end, 2 * kMiB - 1);

    auto near_end = parsed_range("bytes=95-", 100, 2 * kMiB);
    EXPECT_EQ(near_end.end, 99u);
}

TEST(ParseRangeTest, SuffixRange) {
    auto range = parsed_range("bytes=-500", 1000);
    EXPECT_EQ(range.start, 500u);
    EXPECT_EQ(range.end, 999u);

    auto larger_than_file = parsed_range("bytes=-5000", 1000);
    EXPECT_EQ(larger_than_file.start, 0u);
}

TEST(ParseRangeTest, AbsentOrUnknownFormsServeWholeFile) {
    for (const char* header : {"", "items=0-10", "bytes=0-10,20-30", "bytes=abc-def", "bytes=10-5", "bytes=5"}) {
        auto result = parse_range(header, 100, 0);
        ASSERT_TRUE(result.is_ok()) << header;
        EXPECT_FALSE(result.value().has_value()) << header;
    }
}

TEST(ParseRangeTest, StartPastEndIsNotSatisfiable) {
    for (const char* header : {"bytes=100-200", "bytes=100-", "bytes=-0"}) {
        auto result = parse_range(header, 100, 0);
        ASSERT_TRUE(result.is_error()) << header;
        EXPECT_EQ(result.error().code, ErrorCode::RangeNotSatisfiable);
    }
    EXPECT_EQ(rms::stream::unsatisfied_content_range(100), "bytes */100");
}

TEST(ChunkSpanTest, MapsRangeOntoChunkIndices) {
    auto single = chunk_span(ByteRange{125 * kMiB, 126 * kMiB - 1}, kMiB);
    EXPECT_EQ(single.first, 125u);
    EXPECT_EQ(single.second, 125u);

    auto multi = chunk_span(ByteRange{100 * kMiB, 103 * kMiB - 1}, kMiB);
    EXPECT_EQ(multi.first, 100u);
    EXPECT_EQ(multi.second, 102u);
}

TEST(PlanSlicesTest, PartialFirstAndLastChunk) {
    // chunk size 10, file of 45 bytes: chunks 0..3 full, chunk 4 holds 5
    auto slices = plan_slices(ByteRange{7, 23}, 45, 10, 0);
    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[0].chunk_index, 0u);
    EXPECT_EQ(slices[0].offset, 7u);
    EXPECT_EQ(slices[0].length, 3u);
    EXPECT_EQ(slices[1].chunk_index, 1u);
    EXPECT_EQ(slices[1].offset, 0u);
    EXPECT_EQ(slices[1].length, 10u);
    EXPECT_EQ(slices[2].chunk_index, 2u);
    EXPECT_EQ(slices[2].offset, 0u);
    EXPECT_EQ(slices[2].length, 4u);
}

TEST(PlanSlicesTest, LastChunkClampsToTrueLength) {
    auto slices = plan_slices(ByteRange{38, 49}, 45, 10, 0);
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[0].chunk_index, 3u);
    EXPECT_EQ(slices[0].length, 2u);
    EXPECT_EQ(slices[1].chunk_index, 4u);
    EXPECT_EQ(slices[1].offset, 0u);
    EXPECT_EQ(slices[1].length, 5u);

    std::uint64_t total = 0;
    for (const auto& slice : slices) {
        total += slice.length;
    }
    EXPECT_EQ(total, 7u);
}

TEST(PlanSlicesTest, SplitsAtBlockSize) {
    auto slices = plan_slices(ByteRange{0, 24}, 45, 10, 4);
    std::uint64_t total = 0;
    for (const auto& slice : slices) {
        EXPECT_LE(slice.length, 4u);
        total += slice.length;
    }
    EXPECT_EQ(total, 25u);
    EXPECT_EQ(slices.front().chunk_index, 0u);
    EXPECT_EQ(slices.back().chunk_index, 2u);
}

TEST(PlanSlicesTest, WholeFileCoversEveryChunkOnce) {
    const std::uint64_t total_size = 259 * kMiB;
    auto slices = plan_slices(ByteRange{0, total_size - 1}, total_size, 5 * kMiB, 0);
    ASSERT_EQ(slices.size(), 52u);
    EXPECT_EQ(slices.back().length, 4 * kMiB);
}
