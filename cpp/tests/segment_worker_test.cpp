#include <cerrno>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "sloup/storage/hashing.hpp"
#include "sloup/upload/planner.hpp"
#include "sloup/upload/segment_worker.hpp"
#include "test_support.hpp"

using namespace sloup::core;
using namespace sloup::upload;
using sloup::testing::FakeStorage;
using sloup::testing::MemorySource;
using sloup::testing::ScratchDir;

namespace {

UploadPlan small_plan(u64 total, u64 segment) {
    PlanRequest req;
    req.total_size = total;
    req.segment_size = segment;
    req.min_segment_size = 1;
    req.container = "c";
    req.object_name = "obj";
    UploadPlan plan;
    EXPECT_TRUE(is_ok(plan_upload(req, &plan)));
    return plan;
}

// Fails open_temp_file, delegates the rest.
class NoSpaceFs final : public sloup::fs::LocalFs {
public:
    Status ensure_dir(const std::string& p) noexcept override { return inner.ensure_dir(p); }
    Status remove_dir(const std::string& p) noexcept override { return inner.remove_dir(p); }
    Status delete_file(const std::string& p) noexcept override { return inner.delete_file(p); }
    Status open_temp_file(const std::string&, const std::string&,
                          std::unique_ptr<sloup::fs::TempFile>*) noexcept override {
        return make_status(StatusDomain::Fs, StatusCode::Io, ENOSPC);
    }

    sloup::fs::PosixFs inner;
};

} // namespace

class SegmentWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        plan_ = small_plan(2500, 1000);
        ctx_.plan = &plan_;
        ctx_.work_dir = dir_.path();
        ctx_.source = &source_;
        ctx_.fs = &fs_;
        ctx_.storage = &storage_;
        ctx_.gate = &gate_;
        storage_.work_dir = dir_.path();
    }

    SegmentJob job(u32 index) {
        SegmentJob j;
        EXPECT_TRUE(is_ok(segment_job(plan_, index, &j)));
        return j;
    }

    ScratchDir dir_{"sloup_segment_worker_test"};
    UploadPlan plan_;
    MemorySource source_{sloup::testing::pattern_bytes(2500)};
    sloup::fs::PosixFs fs_;
    FakeStorage storage_;
    DiskBudgetGate gate_{2};
    WorkerContext ctx_;
};

TEST_F(SegmentWorkerTest, UploadsExactRangeAndCleansUp) {
    const SegmentResult r = process_segment(ctx_, job(1));
    ASSERT_EQ(r.status, SegmentStatus::Succeeded);
    EXPECT_EQ(r.index, 1u);
    EXPECT_EQ(r.size_bytes, 1000u);
    EXPECT_EQ(r.remote_object_path, "c_segments/obj/2500/00000001");

    const auto bytes = sloup::testing::pattern_bytes(2500);
    const std::string expected(bytes.begin() + 1000, bytes.begin() + 2000);
    EXPECT_EQ(storage_.body("obj/2500/00000001"), expected);

    sloup::storage::Md5Digest d{};
    ASSERT_TRUE(is_ok(sloup::storage::md5_compute(
        {reinterpret_cast<const u8*>(expected.data()), expected.size()}, &d)));
    EXPECT_EQ(storage_.md5("obj/2500/00000001"), sloup::storage::md5_to_hex(d));
    EXPECT_EQ(r.etag, sloup::storage::md5_to_hex(d));

    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
    EXPECT_EQ(gate_.in_use(), 0u);
    EXPECT_EQ(storage_.max_segment_files(), 1u);
}

TEST_F(SegmentWorkerTest, ShortLastSegment) {
    const SegmentResult r = process_segment(ctx_, job(2));
    ASSERT_EQ(r.status, SegmentStatus::Succeeded);
    EXPECT_EQ(r.size_bytes, 500u);
    EXPECT_EQ(storage_.body("obj/2500/00000002").size(), 500u);
}

TEST_F(SegmentWorkerTest, UploadFailureStillDeletesTempFile) {
    storage_.fail_objects.insert("obj/2500/00000000");
    const SegmentResult r = process_segment(ctx_, job(0));
    EXPECT_EQ(r.status, SegmentStatus::Failed);
    EXPECT_EQ(r.error.domain, StatusDomain::Swift);
    EXPECT_EQ(r.error.code, StatusCode::Unavailable);
    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
    EXPECT_EQ(gate_.in_use(), 0u);
}

TEST_F(SegmentWorkerTest, TempFileFailureIsSegmentIoError) {
    NoSpaceFs nospace;
    ctx_.fs = &nospace;
    const SegmentResult r = process_segment(ctx_, job(0));
    EXPECT_EQ(r.status, SegmentStatus::Failed);
    EXPECT_EQ(r.error.domain, StatusDomain::Segment);
    EXPECT_EQ(r.error.code, StatusCode::Io);
    EXPECT_EQ(r.error.aux, static_cast<u32>(ENOSPC));
    EXPECT_TRUE(storage_.puts().empty());
    EXPECT_EQ(gate_.in_use(), 0u);
}

TEST_F(SegmentWorkerTest, ShrunkSourceIsCorrupt) {
    MemorySource shrunk(sloup::testing::pattern_bytes(1500));
    shrunk.set_reported_size(2500);
    ctx_.source = &shrunk;

    const SegmentResult r = process_segment(ctx_, job(1));
    EXPECT_EQ(r.status, SegmentStatus::Failed);
    EXPECT_EQ(r.error.domain, StatusDomain::Segment);
    EXPECT_EQ(r.error.code, StatusCode::Corrupt);
    EXPECT_EQ(sloup::testing::count_segment_files(dir_.path()), 0u);
    EXPECT_TRUE(storage_.puts().empty());
}

TEST_F(SegmentWorkerTest, MissingContextIsInvalid) {
    WorkerContext empty;
    const SegmentResult r = process_segment(empty, job(0));
    EXPECT_EQ(r.status, SegmentStatus::Failed);
    EXPECT_EQ(r.error.code, StatusCode::Invalid);
}
