#include "strata/journal/segment_name.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using strata::journal::is_segment_candidate;
using strata::journal::make_segment_name;
using strata::journal::parse_segment_name;
using strata::journal::SegmentInfo;

TEST(SegmentNameTest, FormatsFixedWidthFields) {
    EXPECT_EQ(make_segment_name(1700000000, 0), "chunk_1700000000_000.dat");
    EXPECT_EQ(make_segment_name(1700000000, 12), "chunk_1700000000_012.dat");
    EXPECT_EQ(make_segment_name(999999999, 1), "chunk_0999999999_001.dat");
}

TEST(SegmentNameTest, ParsesTimestampAndSequence) {
    auto info = parse_segment_name("/backups/chunk_1700000123_004.dat");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->timestamp, 1700000123);
    EXPECT_EQ(info->sequence, 4u);
    EXPECT_EQ(info->path.string(), "/backups/chunk_1700000123_004.dat");
}

TEST(SegmentNameTest, RejectsMalformedNames) {
    EXPECT_FALSE(parse_segment_name("chunk_abc_000.dat").has_value());
    EXPECT_FALSE(parse_segment_name("chunk_1700000000.dat").has_value());
    EXPECT_FALSE(parse_segment_name("chunk_1700000000_.dat").has_value());
    EXPECT_FALSE(parse_segment_name("chunk_1700000000_000.bin").has_value());
    EXPECT_FALSE(parse_segment_name("snapshot_1700000000_000.dat").has_value());

    EXPECT_TRUE(is_segment_candidate("chunk_abc_000.dat"));
    EXPECT_FALSE(is_segment_candidate(".chunk_1700000000_000.dat.tmp"));
}

TEST(SegmentNameTest, NumericOrderingSurvivesDigitWidthChange) {
    // Lexicographically "chunk_999999999_000" sorts after "chunk_1000000000_000"
    std::vector<SegmentInfo> segments{
        *parse_segment_name("chunk_1000000000_000.dat"),
        *parse_segment_name("chunk_999999999_001.dat"),
        *parse_segment_name("chunk_999999999_000.dat"),
    };
    std::sort(segments.begin(), segments.end());

    EXPECT_EQ(segments[0].path.string(), "chunk_999999999_000.dat");
    EXPECT_EQ(segments[1].path.string(), "chunk_999999999_001.dat");
    EXPECT_EQ(segments[2].path.string(), "chunk_1000000000_000.dat");
}
