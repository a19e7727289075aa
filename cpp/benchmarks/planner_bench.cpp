#include <benchmark/benchmark.h>

#include "sloup/upload/disk_budget.hpp"
#include "sloup/upload/planner.hpp"

static void BM_PlanUpload(benchmark::State& state) {
    sloup::upload::PlanRequest req;
    req.total_size = static_cast<sloup::core::u64>(state.range(0)) * sloup::core::kMiB;
    req.container = "bench";
    req.object_name = "object.bin";

    for (auto _ : state) {
        sloup::core::UploadPlan plan;
        const sloup::core::Status s = sloup::upload::plan_upload(req, &plan);
        benchmark::DoNotOptimize(static_cast<sloup::core::u16>(s.code));
        benchmark::DoNotOptimize(plan.segment_count);
    }
}
BENCHMARK(BM_PlanUpload)->Arg(12)->Arg(2000)->Arg(1 << 20);

static void BM_SegmentJobsAndNames(benchmark::State& state) {
    sloup::upload::PlanRequest req;
    req.total_size = 1000 * sloup::core::kMiB;
    req.container = "bench";
    req.object_name = "object.bin";
    sloup::core::UploadPlan plan;
    if (!sloup::core::is_ok(sloup::upload::plan_upload(req, &plan))) {
        state.SkipWithError("plan failed");
        return;
    }

    for (auto _ : state) {
        for (sloup::core::u32 i = 0; i < plan.segment_count; ++i) {
            sloup::core::SegmentJob job;
            const sloup::core::Status s = sloup::upload::segment_job(plan, i, &job);
            benchmark::DoNotOptimize(static_cast<sloup::core::u16>(s.code));
            benchmark::DoNotOptimize(sloup::upload::segment_object_path(plan, i));
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * plan.segment_count);
}
BENCHMARK(BM_SegmentJobsAndNames);

static void BM_EffectiveConcurrency(benchmark::State& state) {
    for (auto _ : state) {
        const auto d = sloup::upload::effective_concurrency(10, 5 * sloup::core::kMiB, sloup::core::kMiB, 1000);
        benchmark::DoNotOptimize(d.effective);
    }
}
BENCHMARK(BM_EffectiveConcurrency);
