#include "sloup/upload/coordinator.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "sloup/upload/channel.hpp"
#include "sloup/upload/disk_budget.hpp"
#include "sloup/upload/planner.hpp"
#include "sloup/upload/segment_worker.hpp"

namespace sloup::upload {

using namespace sloup::core;

namespace {

void worker_loop(const WorkerContext& ctx, Channel<SegmentJob>& jobs, Channel<SegmentResult>& results) {
    SegmentJob job;
    while (jobs.pop(&job)) {
        SegmentResult r = process_segment(ctx, std::move(job));
        if (!results.push(std::move(r))) {
            return;
        }
    }
}

} // namespace

UploadCoordinator::UploadCoordinator(const UploadPlan& plan, u32 concurrency, std::string work_dir,
                                     CoordinatorDeps deps)
    : plan_(plan), concurrency_(concurrency == 0 ? 1 : concurrency), work_dir_(std::move(work_dir)),
      deps_(std::move(deps)) {}

Status UploadCoordinator::run(RunReport* report) noexcept {
    if (report == nullptr || deps_.source == nullptr || deps_.fs == nullptr || deps_.storage == nullptr) {
        return make_status(StatusDomain::Coordinator, StatusCode::Invalid);
    }
    if (plan_.segment_count == 0 || work_dir_.empty()) {
        return make_status(StatusDomain::Coordinator, StatusCode::Invalid);
    }

    *report = RunReport{};

    Status s = deps_.storage->create_container(plan_.segments_container);
    if (!is_ok(s)) {
        spdlog::error("cannot create segments container {} ({}, aux={})", plan_.segments_container,
                      status_code_name(s.code), s.aux);
        return s;
    }

    DiskBudgetGate gate(concurrency_);
    Channel<SegmentJob> jobs(concurrency_);
    Channel<SegmentResult> results(concurrency_);

    WorkerContext ctx;
    ctx.plan = &plan_;
    ctx.work_dir = work_dir_;
    ctx.source = deps_.source;
    ctx.fs = deps_.fs;
    ctx.storage = deps_.storage;
    ctx.gate = &gate;

    std::vector<std::thread> workers;
    workers.reserve(concurrency_);
    try {
        for (u32 i = 0; i < concurrency_; ++i) {
            workers.emplace_back(worker_loop, std::cref(ctx), std::ref(jobs), std::ref(results));
        }
    } catch (const std::system_error& e) {
        spdlog::error("cannot start upload worker {} of {}: {}", workers.size() + 1, concurrency_, e.what());
        jobs.close();
        for (auto& t : workers) {
            t.join();
        }
        return make_status(StatusDomain::Coordinator, StatusCode::Unavailable, static_cast<u32>(workers.size()));
    }

    spdlog::info("uploading {} segments of {} bytes with {} workers", plan_.segment_count, plan_.segment_size,
                 concurrency_);

    u32 next = 0;
    u32 in_flight = 0;
    u32 finished = 0;
    bool stopped = false;
    bool budget_broken = false;

    auto dispatch = [&]() {
        SegmentJob job;
        const Status js = segment_job(plan_, next, &job);
        if (!is_ok(js) || !jobs.push(std::move(job))) {
            SegmentResult r;
            r.index = next;
            r.status = SegmentStatus::Failed;
            r.error = is_ok(js) ? make_status(StatusDomain::Coordinator, StatusCode::Unavailable) : js;
            report->results.push_back(r);
            stopped = true;
        } else {
            ++in_flight;
            ++report->dispatched;
        }
        ++next;
    };

    while (next < plan_.segment_count && in_flight < concurrency_ && !stopped) {
        dispatch();
    }

    while (in_flight > 0) {
        SegmentResult r;
        if (!results.pop(&r)) {
            break;
        }
        --in_flight;
        ++finished;

        if (r.status == SegmentStatus::Failed) {
            if (!stopped) {
                spdlog::warn("segment {} failed, no further segments will be started", r.index);
            }
            stopped = true;
            if (r.error.code == StatusCode::BudgetExhausted) {
                budget_broken = true;
            }
        } else {
            spdlog::debug("segment {} uploaded as {}", r.index, r.remote_object_path);
        }

        if (deps_.journal != nullptr) {
            const Status js = deps_.journal->record_segment(r);
            if (!is_ok(js)) {
                spdlog::error("journal: segment {} not recorded ({}, aux={})", r.index, status_code_name(js.code),
                              js.aux);
            }
        }
        if (deps_.on_result) {
            deps_.on_result(r, finished, plan_.segment_count);
        }

        report->results.push_back(std::move(r));

        if (!stopped && next < plan_.segment_count) {
            dispatch();
        }
    }

    jobs.close();
    results.close();
    for (auto& t : workers) {
        t.join();
    }

    std::sort(report->results.begin(), report->results.end(),
              [](const SegmentResult& a, const SegmentResult& b) { return a.index < b.index; });
    for (const SegmentResult& r : report->results) {
        if (r.status == SegmentStatus::Failed) {
            report->failed_indices.push_back(r.index);
        }
    }
    report->gate_high_water = gate.high_water();

    if (budget_broken || gate.in_use() != 0) {
        spdlog::critical("disk budget accounting is inconsistent ({} units still held)", gate.in_use());
        return make_status(StatusDomain::Budget, StatusCode::BudgetExhausted);
    }
    if (!report->failed_indices.empty()) {
        return make_status(StatusDomain::Coordinator, StatusCode::UploadFailed,
                           static_cast<u32>(report->failed_indices.size()));
    }
    if (report->results.size() != plan_.segment_count) {
        return make_status(StatusDomain::Coordinator, StatusCode::Unknown);
    }
    return ok_status();
}

} // namespace sloup::upload
