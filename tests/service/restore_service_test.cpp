#include "strata/events/event_bus.hpp"
#include "strata/events/events.hpp"
#include "strata/journal/journal_writer.hpp"
#include "strata/service/restore_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using strata::events::EventBus;
using strata::events::RestoreCompletedEvent;
using strata::events::SegmentSkippedEvent;
using strata::journal::ChangeRecord;
using strata::journal::JournalWriter;
using strata::service::RestoreService;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

ChangeRecord live(const std::string& path, const std::string& content) {
    ChangeRecord record;
    record.path = path;
    record.permissions = 0644;
    record.modified_time_ns = 1704110400000000000LL;
    record.content.assign(content.begin(), content.end());
    record.size = content.size();
    return record;
}

} // namespace

class RestoreServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("strata_restore_service_");
        backup_ = root_ / "backup";
        target_ = root_ / "target";

        bus_.subscribe<SegmentSkippedEvent>([this](const SegmentSkippedEvent& e) { skipped_.push_back(e); });
        bus_.subscribe<RestoreCompletedEvent>([this](const RestoreCompletedEvent& e) { completed_.push_back(e); });
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_segment(std::int64_t timestamp, const std::vector<ChangeRecord>& records) {
        JournalWriter writer(backup_, JournalWriter::kDefaultSegmentLimit, [timestamp] { return timestamp; });
        ASSERT_TRUE(writer.write(records).is_ok());
    }

    fs::path root_;
    fs::path backup_;
    fs::path target_;
    EventBus bus_;
    std::vector<SegmentSkippedEvent> skipped_;
    std::vector<RestoreCompletedEvent> completed_;
};

TEST_F(RestoreServiceTest, ReportsCompletionWithCounts) {
    write_segment(1700000000, {live("a.txt", "alpha"), live("b.txt", "beta")});
    write_segment(1700000060, {ChangeRecord::tombstone("b.txt")});

    RestoreService service(bus_);
    auto result = service.restore(backup_, target_);

    ASSERT_TRUE(result.is_ok()) << strata::to_string(result.error());
    EXPECT_TRUE(skipped_.empty());
    ASSERT_EQ(completed_.size(), 1u);
    EXPECT_EQ(completed_[0].target_root.string(), target_.string());
    EXPECT_EQ(completed_[0].files_restored, 1u);
    EXPECT_EQ(completed_[0].tombstones, 1u);
    EXPECT_EQ(completed_[0].segments_applied, 2u);
    EXPECT_EQ(completed_[0].segments_skipped, 0u);
    EXPECT_TRUE(fs::exists(target_ / "a.txt"));
    EXPECT_FALSE(fs::exists(target_ / "b.txt"));
}

TEST_F(RestoreServiceTest, EmitsEventForEachCorruptSegment) {
    write_segment(1700000000, {live("a.txt", "alpha")});
    {
        std::ofstream bad(backup_ / "chunk_1700000060_000.dat", std::ios::binary);
        bad << "definitely not a segment";
    }

    RestoreService service(bus_);
    auto result = service.restore(backup_, target_);

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(skipped_.size(), 1u);
    EXPECT_EQ(skipped_[0].path.filename().string(), "chunk_1700000060_000.dat");
    EXPECT_FALSE(skipped_[0].reason.empty());
    ASSERT_EQ(completed_.size(), 1u);
    EXPECT_EQ(completed_[0].segments_skipped, 1u);
    EXPECT_EQ(completed_[0].files_restored, 1u);
}

TEST_F(RestoreServiceTest, MissingJournalEmitsNothing) {
    fs::create_directories(backup_);
    RestoreService service(bus_);

    auto result = service.restore(backup_, target_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, strata::ErrorKind::NotFound);
    EXPECT_TRUE(completed_.empty());
}
