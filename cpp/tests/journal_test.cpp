#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "sloup/db/journal.hpp"
#include "test_support.hpp"

using namespace sloup::core;
using sloup::db::JournalSegment;
using sloup::db::JournalUpload;
using sloup::db::UploadJournal;

namespace {

UploadPlan sample_plan() {
    UploadPlan p;
    p.total_size = 3 * kMiB + 5;
    p.segment_size = kMiB;
    p.segment_count = 4;
    p.container = "vm";
    p.segments_container = "vm_segments";
    p.object_name = "root.qcow2";
    return p;
}

SegmentResult result(u32 index, SegmentStatus status) {
    SegmentResult r;
    r.index = index;
    r.status = status;
    if (status == SegmentStatus::Succeeded) {
        r.remote_object_path = "vm_segments/root.qcow2/3145733/0000000" + std::to_string(index);
        r.etag = "e" + std::to_string(index);
        r.size_bytes = kMiB;
    } else {
        r.error = make_status(StatusDomain::Swift, StatusCode::Unavailable, 503);
    }
    return r;
}

} // namespace

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(journal_.open(dir_.path() + "/journal.db")));
    }

    void TearDown() override {
        if (journal_.is_open()) {
            EXPECT_TRUE(is_ok(journal_.close()));
        }
    }

    sloup::testing::ScratchDir dir_{"sloup_journal_test"};
    UploadJournal journal_;
};

TEST_F(JournalTest, NoUploadRecordedIsNotFound) {
    JournalUpload u;
    const Status s = journal_.load_upload(&u);
    EXPECT_EQ(s.domain, StatusDomain::Journal);
    EXPECT_EQ(s.code, StatusCode::NotFound);
}

TEST_F(JournalTest, UploadRoundTrip) {
    const UploadPlan plan = sample_plan();
    ASSERT_TRUE(is_ok(journal_.record_upload(plan, "/images/root.qcow2")));

    JournalUpload u;
    ASSERT_TRUE(is_ok(journal_.load_upload(&u)));
    EXPECT_EQ(u.source_path, "/images/root.qcow2");
    EXPECT_EQ(u.plan.container, "vm");
    EXPECT_EQ(u.plan.segments_container, "vm_segments");
    EXPECT_EQ(u.plan.object_name, "root.qcow2");
    EXPECT_EQ(u.plan.total_size, plan.total_size);
    EXPECT_EQ(u.plan.segment_count, 4u);
    EXPECT_GT(u.started_at, 0);
}

TEST_F(JournalTest, SegmentsOrderedAndReplacedByIndex) {
    ASSERT_TRUE(is_ok(journal_.record_upload(sample_plan(), "/x")));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(2, SegmentStatus::Failed))));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(0, SegmentStatus::Succeeded))));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(1, SegmentStatus::Succeeded))));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(2, SegmentStatus::Succeeded))));

    std::vector<JournalSegment> segs;
    ASSERT_TRUE(is_ok(journal_.load_segments(&segs)));
    ASSERT_EQ(segs.size(), 3u);
    for (u32 i = 0; i < 3; ++i) {
        EXPECT_EQ(segs[i].result.index, i);
        EXPECT_EQ(segs[i].result.status, SegmentStatus::Succeeded);
    }
    EXPECT_EQ(segs[1].result.etag, "e1");
}

TEST_F(JournalTest, FailedSegmentKeepsError) {
    ASSERT_TRUE(is_ok(journal_.record_upload(sample_plan(), "/x")));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(3, SegmentStatus::Failed))));

    std::vector<JournalSegment> segs;
    ASSERT_TRUE(is_ok(journal_.load_segments(&segs)));
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].result.status, SegmentStatus::Failed);
    EXPECT_EQ(segs[0].result.error.domain, StatusDomain::Swift);
    EXPECT_EQ(segs[0].result.error.code, StatusCode::Unavailable);
    EXPECT_EQ(segs[0].result.error.aux, 503u);
}

TEST_F(JournalTest, RecordingUploadAgainClearsSegments) {
    ASSERT_TRUE(is_ok(journal_.record_upload(sample_plan(), "/x")));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(0, SegmentStatus::Succeeded))));
    ASSERT_TRUE(is_ok(journal_.record_upload(sample_plan(), "/y")));

    std::vector<JournalSegment> segs;
    ASSERT_TRUE(is_ok(journal_.load_segments(&segs)));
    EXPECT_TRUE(segs.empty());
}

TEST_F(JournalTest, SurvivesReopen) {
    ASSERT_TRUE(is_ok(journal_.record_upload(sample_plan(), "/x")));
    ASSERT_TRUE(is_ok(journal_.record_segment(result(0, SegmentStatus::Succeeded))));
    ASSERT_TRUE(is_ok(journal_.close()));

    UploadJournal again;
    ASSERT_TRUE(is_ok(again.open(dir_.path() + "/journal.db")));
    std::vector<JournalSegment> segs;
    ASSERT_TRUE(is_ok(again.load_segments(&segs)));
    EXPECT_EQ(segs.size(), 1u);
    ASSERT_TRUE(is_ok(again.close()));
}

TEST(Journal, ClosedJournalRejectsCalls) {
    UploadJournal j;
    EXPECT_FALSE(j.is_open());
    EXPECT_EQ(j.record_segment(SegmentResult{}).code, StatusCode::Invalid);
    EXPECT_EQ(j.close().code, StatusCode::Invalid);
}

TEST(JournalOpen, ExistingModeDoesNotCreateFile) {
    sloup::testing::ScratchDir dir{"sloup_journal_open_test"};
    const std::string path = dir.path() + "/journal.db";

    UploadJournal journal;
    const Status s = journal.open(path, sloup::db::OpenMode::Existing);
    EXPECT_EQ(s.domain, StatusDomain::Journal);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_FALSE(journal.is_open());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(JournalOpen, ExistingModeReadsRetainedJournal) {
    sloup::testing::ScratchDir dir{"sloup_journal_reopen_test"};
    const std::string path = dir.path() + "/journal.db";
    {
        UploadJournal writer;
        ASSERT_TRUE(is_ok(writer.open(path)));
        ASSERT_TRUE(is_ok(writer.record_upload(sample_plan(), "/data/root.qcow2")));
        ASSERT_TRUE(is_ok(writer.record_segment(result(0, SegmentStatus::Succeeded))));
        ASSERT_TRUE(is_ok(writer.close()));
    }

    UploadJournal reader;
    ASSERT_TRUE(is_ok(reader.open(path, sloup::db::OpenMode::Existing)));
    JournalUpload u;
    ASSERT_TRUE(is_ok(reader.load_upload(&u)));
    EXPECT_EQ(u.plan.object_name, "root.qcow2");
    std::vector<JournalSegment> segs;
    ASSERT_TRUE(is_ok(reader.load_segments(&segs)));
    EXPECT_EQ(segs.size(), 1u);
    EXPECT_TRUE(is_ok(reader.close()));
}

TEST(JournalSummary, CountsAndNeverWrapsOnExtraRows) {
    JournalUpload u;
    u.plan = sample_plan();

    std::vector<JournalSegment> segs(2);
    segs[0].result = result(2, SegmentStatus::Failed);
    segs[1].result = result(0, SegmentStatus::Succeeded);
    sloup::db::JournalSummary sum = sloup::db::summarize(u, segs);
    EXPECT_EQ(sum.succeeded, 1u);
    EXPECT_EQ(sum.failed, std::vector<u32>{2});
    EXPECT_EQ(sum.not_attempted, 2u);

    segs.resize(6);
    for (u32 i = 2; i < 6; ++i) {
        segs[i].result = result(i + 1, SegmentStatus::Succeeded);
    }
    sum = sloup::db::summarize(u, segs);
    EXPECT_EQ(sum.succeeded, 5u);
    EXPECT_EQ(sum.not_attempted, 0u);
}
