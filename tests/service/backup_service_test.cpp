#include "strata/events/event_bus.hpp"
#include "strata/events/events.hpp"
#include "strata/journal/journal_reader.hpp"
#include "strata/service/backup_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using strata::events::BackupFailedEvent;
using strata::events::ChangesDetectedEvent;
using strata::events::EventBus;
using strata::events::SegmentWrittenEvent;
using strata::journal::JournalReader;
using strata::service::BackupService;
using strata::service::BackupSettings;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

class BackupServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("strata_service_");
        watch_ = root_ / "watch";
        backup_ = root_ / "backup";
        fs::create_directories(watch_);

        bus_.subscribe<ChangesDetectedEvent>([this](const ChangesDetectedEvent& e) { detected_.push_back(e); });
        bus_.subscribe<SegmentWrittenEvent>([this](const SegmentWrittenEvent& e) { written_.push_back(e); });
        bus_.subscribe<BackupFailedEvent>([this](const BackupFailedEvent& e) { failures_.push_back(e); });
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    BackupSettings settings() const {
        BackupSettings s;
        s.watch_root = watch_;
        s.backup_root = backup_;
        s.interval = std::chrono::seconds(1);
        return s;
    }

    fs::path root_;
    fs::path watch_;
    fs::path backup_;
    EventBus bus_;
    std::vector<ChangesDetectedEvent> detected_;
    std::vector<SegmentWrittenEvent> written_;
    std::vector<BackupFailedEvent> failures_;
};

TEST_F(BackupServiceTest, PrepareCreatesBackupRoot) {
    BackupService service(settings(), bus_);

    ASSERT_TRUE(service.prepare().is_ok());
    EXPECT_TRUE(fs::is_directory(backup_));
}

TEST_F(BackupServiceTest, PrepareRejectsMissingWatchRoot) {
    auto s = settings();
    s.watch_root = root_ / "absent";
    BackupService service(s, bus_);

    auto result = service.prepare();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, strata::ErrorKind::Io);
}

TEST_F(BackupServiceTest, FirstCycleWritesOneSegment) {
    write_file(watch_ / "a.txt", "alpha");
    write_file(watch_ / "nested" / "b.txt", "beta");

    BackupService service(settings(), bus_, [] { return std::int64_t{1700000000}; });
    auto result = service.run_once();

    ASSERT_TRUE(result.is_ok()) << strata::to_string(result.error());
    EXPECT_EQ(result.value().changes, 2u);
    EXPECT_EQ(result.value().segments_written, 1u);

    ASSERT_EQ(detected_.size(), 1u);
    EXPECT_EQ(detected_[0].added, 2u);
    ASSERT_EQ(written_.size(), 1u);
    EXPECT_EQ(written_[0].path.filename().string(), "chunk_1700000000_000.dat");
    EXPECT_EQ(written_[0].record_count, 2u);
    EXPECT_TRUE(failures_.empty());
    EXPECT_EQ(service.snapshot().size(), 2u);
}

TEST_F(BackupServiceTest, UnchangedTreeEmitsEmptyScanAndNoSegment) {
    write_file(watch_ / "a.txt", "alpha");
    BackupService service(settings(), bus_, [] { return std::int64_t{1700000000}; });

    ASSERT_TRUE(service.run_once().is_ok());
    auto second = service.run_once();

    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().changes, 0u);
    EXPECT_EQ(second.value().segments_written, 0u);
    ASSERT_EQ(detected_.size(), 2u);
    EXPECT_EQ(detected_[1].total(), 0u);
    EXPECT_EQ(written_.size(), 1u);
}

TEST_F(BackupServiceTest, DeletionIsWrittenAsTombstoneSegment) {
    write_file(watch_ / "a.txt", "alpha");
    std::int64_t now = 1700000000;
    BackupService service(settings(), bus_, [&now] { return now; });

    ASSERT_TRUE(service.run_once().is_ok());
    fs::remove(watch_ / "a.txt");
    now = 1700000060;
    auto result = service.run_once();

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(detected_.size(), 2u);
    EXPECT_EQ(detected_[1].deleted, 1u);

    JournalReader reader(backup_);
    auto listing = reader.list_segments();
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().segments.size(), 2u);
    EXPECT_EQ(listing.value().segments[1].timestamp, 1700000060);
}

TEST_F(BackupServiceTest, MissingWatchRootReportsScanFailure) {
    auto s = settings();
    s.watch_root = root_ / "absent";
    BackupService service(s, bus_);

    auto result = service.run_once();

    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].stage, "scan");
    EXPECT_TRUE(detected_.empty());
}

TEST_F(BackupServiceTest, FailedWriteIsRetriedNextCycle) {
    write_file(watch_ / "a.txt", "alpha");
    // A regular file where the backup directory should be
    write_file(backup_, "in the way");

    BackupService service(settings(), bus_, [] { return std::int64_t{1700000000}; });
    auto first = service.run_once();

    ASSERT_TRUE(first.is_error());
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].stage, "write");
    EXPECT_TRUE(service.snapshot().empty());

    fs::remove(backup_);
    auto second = service.run_once();

    ASSERT_TRUE(second.is_ok()) << strata::to_string(second.error());
    EXPECT_EQ(second.value().changes, 1u);
    EXPECT_EQ(second.value().segments_written, 1u);
}

TEST_F(BackupServiceTest, RunStopsWhenFlagIsSet) {
    BackupService service(settings(), bus_);
    std::atomic<bool> stop{true};

    service.run(stop);

    EXPECT_TRUE(detected_.empty());
}
