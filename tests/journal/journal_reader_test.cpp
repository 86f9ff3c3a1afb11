#include "strata/journal/journal_reader.hpp"
#include "strata/journal/journal_writer.hpp"
#include "strata/journal/segment_codec.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

namespace fs = std::filesystem;
using strata::ErrorKind;
using strata::journal::ChangeRecord;
using strata::journal::CorruptSegment;
using strata::journal::DecodedSegment;
using strata::journal::JournalReader;
using strata::journal::SegmentCodec;
using strata::journal::SegmentPayload;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() / fs::path("strata_reader_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_bytes(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void write_segment(const fs::path& path, const std::string& record_path) {
    SegmentPayload payload;
    ChangeRecord record;
    record.path = record_path;
    record.content = {'o', 'k'};
    record.size = 2;
    payload.records.push_back(record);
    write_bytes(path, SegmentCodec::encode(payload));
}

} // namespace

class JournalReaderTest : public ::testing::Test {
protected:
    void SetUp() override { backup_ = create_temp_dir(); }
    void TearDown() override { fs::remove_all(backup_); }

    fs::path backup_;
};

TEST_F(JournalReaderTest, EmptyLocationIsNotFound) {
    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::NotFound);
}

TEST_F(JournalReaderTest, MissingLocationIsNotFound) {
    JournalReader reader(backup_ / "nope");
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().kind, ErrorKind::NotFound);
}

TEST_F(JournalReaderTest, IgnoresUnrelatedFilesAndStagingFiles) {
    write_segment(backup_ / "chunk_1700000000_000.dat", "a.txt");
    write_bytes(backup_ / "notes.txt", {'x'});
    write_bytes(backup_ / ".chunk_1700000001_000.dat.tmp", {'x'});
    fs::create_directories(backup_ / "chunk_dir_000.dat");

    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().segments.size(), 1u);
    EXPECT_TRUE(listing.value().malformed.empty());
}

TEST_F(JournalReaderTest, OrdersByTimestampThenSequence) {
    write_segment(backup_ / "chunk_1700000005_000.dat", "c");
    write_segment(backup_ / "chunk_1700000001_001.dat", "b");
    write_segment(backup_ / "chunk_1700000001_000.dat", "a");
    write_segment(backup_ / "chunk_999999999_000.dat", "legacy");

    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_ok());
    const auto& segments = listing.value().segments;
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0].path.filename().string(), "chunk_999999999_000.dat");
    EXPECT_EQ(segments[1].path.filename().string(), "chunk_1700000001_000.dat");
    EXPECT_EQ(segments[2].path.filename().string(), "chunk_1700000001_001.dat");
    EXPECT_EQ(segments[3].path.filename().string(), "chunk_1700000005_000.dat");
}

TEST_F(JournalReaderTest, ReportsUnparseableNamesAsMalformed) {
    write_bytes(backup_ / "chunk_garbage.dat", {'x'});

    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_ok());
    EXPECT_TRUE(listing.value().segments.empty());
    ASSERT_EQ(listing.value().malformed.size(), 1u);
}

TEST_F(JournalReaderTest, CorruptSegmentIsTaggedNotFatal) {
    write_bytes(backup_ / "chunk_1700000000_000.dat", std::vector<std::uint8_t>(64, 0xc1));
    write_segment(backup_ / "chunk_1700000001_000.dat", "good.txt");

    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().segments.size(), 2u);

    auto first = reader.read_segment(listing.value().segments[0]);
    ASSERT_TRUE(std::holds_alternative<CorruptSegment>(first));
    EXPECT_FALSE(std::get<CorruptSegment>(first).reason.empty());

    auto second = reader.read_segment(listing.value().segments[1]);
    ASSERT_TRUE(std::holds_alternative<DecodedSegment>(second));
    ASSERT_EQ(std::get<DecodedSegment>(second).records.size(), 1u);
    EXPECT_EQ(std::get<DecodedSegment>(second).records[0].path, "good.txt");
}
