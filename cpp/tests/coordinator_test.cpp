#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "sloup/upload/coordinator.hpp"
#include "sloup/upload/planner.hpp"
#include "test_support.hpp"

using namespace sloup::core;
using namespace sloup::upload;
using sloup::testing::FakeStorage;
using sloup::testing::MemorySource;
using sloup::testing::ScratchDir;

class CoordinatorTest : public ::testing::Test {
protected:
    void plan(u64 total, u64 segment) {
        PlanRequest req;
        req.total_size = total;
        req.segment_size = segment;
        req.min_segment_size = 1;
        req.container = "media";
        req.object_name = "movie.mkv";
        ASSERT_TRUE(is_ok(plan_upload(req, &plan_)));
        source_ = std::make_unique<MemorySource>(sloup::testing::pattern_bytes(total));
        storage_.work_dir = dir_.path();
    }

    CoordinatorDeps deps() {
        CoordinatorDeps d;
        d.source = source_.get();
        d.fs = &fs_;
        d.storage = &storage_;
        return d;
    }

    ScratchDir dir_{"sloup_coordinator_test"};
    UploadPlan plan_;
    std::unique_ptr<MemorySource> source_;
    sloup::fs::PosixFs fs_;
    FakeStorage storage_;
};

TEST_F(CoordinatorTest, UploadsEverySegmentAndReportsInIndexOrder) {
    plan(10'500, 1000);
    ASSERT_EQ(plan_.segment_count, 11u);

    UploadCoordinator c(plan_, 4, dir_.path(), deps());
    RunReport report;
    ASSERT_TRUE(is_ok(c.run(&report)));

    ASSERT_EQ(report.results.size(), 11u);
    for (u32 i = 0; i < 11; ++i) {
        EXPECT_EQ(report.results[i].index, i);
        EXPECT_EQ(report.results[i].status, SegmentStatus::Succeeded);
    }
    EXPECT_TRUE(report.failed_indices.empty());
    EXPECT_EQ(report.dispatched, 11u);
    EXPECT_EQ(storage_.puts().size(), 11u);
    EXPECT_EQ(storage_.containers(), std::vector<std::string>{"media_segments"});
    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
}

TEST_F(CoordinatorTest, LocalSegmentFilesNeverExceedConcurrency) {
    plan(20'000, 1000);
    storage_.put_delay = std::chrono::milliseconds(5);

    UploadCoordinator c(plan_, 3, dir_.path(), deps());
    RunReport report;
    ASSERT_TRUE(is_ok(c.run(&report)));

    EXPECT_LE(storage_.max_segment_files(), 3u);
    EXPECT_LE(storage_.max_in_flight(), 3u);
    EXPECT_LE(report.gate_high_water, 3u);
    EXPECT_GE(report.gate_high_water, 1u);
}

TEST_F(CoordinatorTest, SingleWorkerIsSequential) {
    plan(5000, 1000);
    UploadCoordinator c(plan_, 1, dir_.path(), deps());
    RunReport report;
    ASSERT_TRUE(is_ok(c.run(&report)));
    EXPECT_EQ(storage_.max_in_flight(), 1u);

    const std::vector<std::string> expected = {
        "movie.mkv/5000/00000000", "movie.mkv/5000/00000001", "movie.mkv/5000/00000002",
        "movie.mkv/5000/00000003", "movie.mkv/5000/00000004",
    };
    EXPECT_EQ(storage_.puts(), expected);
}

TEST_F(CoordinatorTest, FailureStopsDispatchAndReportsFailedIndex) {
    plan(10'000, 1000);
    storage_.fail_objects.insert(segment_object_path(plan_, 1));

    UploadCoordinator c(plan_, 1, dir_.path(), deps());
    RunReport report;
    const Status s = c.run(&report);
    EXPECT_EQ(s.domain, StatusDomain::Coordinator);
    EXPECT_EQ(s.code, StatusCode::UploadFailed);
    EXPECT_EQ(s.aux, 1u);

    EXPECT_EQ(report.failed_indices, std::vector<u32>{1});
    EXPECT_EQ(report.dispatched, 2u);
    EXPECT_EQ(storage_.puts().size(), 2u);
    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
}

TEST_F(CoordinatorTest, InFlightSegmentsFinishAndAllFailuresAreReported) {
    plan(10'000, 1000);
    storage_.put_delay = std::chrono::milliseconds(20);
    storage_.fail_objects.insert(segment_object_path(plan_, 0));
    storage_.fail_objects.insert(segment_object_path(plan_, 2));

    UploadCoordinator c(plan_, 4, dir_.path(), deps());
    RunReport report;
    const Status s = c.run(&report);
    EXPECT_EQ(s.code, StatusCode::UploadFailed);

    // Segments 0-3 start together; both failures are among them.
    EXPECT_EQ(report.failed_indices, (std::vector<u32>{0, 2}));
    EXPECT_LT(report.dispatched, 10u);
    EXPECT_EQ(report.results.size(), report.dispatched);
    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
}

TEST_F(CoordinatorTest, ContainerFailureUploadsNothing) {
    plan(3000, 1000);
    storage_.container_status = make_status(StatusDomain::Swift, StatusCode::PermissionDenied, 403);

    UploadCoordinator c(plan_, 2, dir_.path(), deps());
    RunReport report;
    const Status s = c.run(&report);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_TRUE(storage_.puts().empty());
}

TEST_F(CoordinatorTest, ProgressCallbackSeesEveryResult) {
    plan(4000, 1000);
    std::vector<u32> finished;
    CoordinatorDeps d = deps();
    d.on_result = [&finished](const SegmentResult&, u32 done, u32 total) {
        EXPECT_EQ(total, 4u);
        finished.push_back(done);
    };

    UploadCoordinator c(plan_, 2, dir_.path(), std::move(d));
    RunReport report;
    ASSERT_TRUE(is_ok(c.run(&report)));
    EXPECT_EQ(finished, (std::vector<u32>{1, 2, 3, 4}));
}

TEST_F(CoordinatorTest, RecordsResultsInJournal) {
    plan(3000, 1000);
    sloup::db::UploadJournal journal;
    ASSERT_TRUE(is_ok(journal.open(dir_.path() + "/journal.db")));
    ASSERT_TRUE(is_ok(journal.record_upload(plan_, "/src/movie.mkv")));

    CoordinatorDeps d = deps();
    d.journal = &journal;
    UploadCoordinator c(plan_, 2, dir_.path(), std::move(d));
    RunReport report;
    ASSERT_TRUE(is_ok(c.run(&report)));

    std::vector<sloup::db::JournalSegment> segments;
    ASSERT_TRUE(is_ok(journal.load_segments(&segments)));
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[2].result.remote_object_path, "media_segments/movie.mkv/3000/00000002");
    ASSERT_TRUE(is_ok(journal.close()));
}
