#include "sloup/upload/uploader.hpp"

#include <limits>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "sloup/db/journal.hpp"
#include "sloup/storage/manifest_json.hpp"
#include "sloup/upload/manifest.hpp"
#include "sloup/upload/planner.hpp"

namespace sloup::upload {

using namespace sloup::core;

namespace {

constexpr const char* kWorkDirName = "sloup-work";
constexpr const char* kManifestFileName = "manifest.json";

[[nodiscard]] Status invalid_option(u32 aux = 0) noexcept {
    return make_status(StatusDomain::Plan, StatusCode::Invalid, aux);
}

UploadOutcome planning_error(Status s) {
    UploadOutcome out;
    out.kind = OutcomeKind::PlanningError;
    out.status = s;
    return out;
}

// Copy of the rendered manifest next to the journal, for `finalize` and for
// whoever inspects a failed run.
void keep_manifest_copy(sloup::fs::LocalFs& fs, const std::string& work_dir, const std::string& json) {
    std::unique_ptr<sloup::fs::TempFile> file;
    Status s = fs.open_temp_file(work_dir, kManifestFileName, &file);
    if (is_ok(s)) {
        s = file->write({reinterpret_cast<const u8*>(json.data()), json.size()});
    }
    if (is_ok(s)) {
        s = file->close();
    }
    if (!is_ok(s)) {
        spdlog::warn("could not write {} in {} ({}, aux={})", kManifestFileName, work_dir,
                     status_code_name(s.code), s.aux);
    }
}

void close_journal(sloup::db::UploadJournal& journal) {
    if (!journal.is_open()) {
        return;
    }
    const Status s = journal.close();
    if (!is_ok(s)) {
        spdlog::warn("journal did not close cleanly (aux={})", s.aux);
    }
}

// Manifest step shared by execute_upload and finalize_upload. Fills
// kind/status/manifest_path and removes the work directory on success.
void finish_with_manifest(sloup::storage::ObjectStorageClient& storage, sloup::fs::LocalFs& fs,
                          std::vector<SegmentResult> results, sloup::db::UploadJournal& journal,
                          UploadOutcome* out) {
    Manifest entries;
    Status s = build_manifest(out->plan, std::move(results), &entries);
    if (!is_ok(s)) {
        close_journal(journal);
        out->kind = OutcomeKind::ManifestFailure;
        out->status = s;
        return;
    }

    keep_manifest_copy(fs, out->work_dir, sloup::storage::manifest_to_json(entries));

    s = submit_manifest(storage, out->plan, entries);
    close_journal(journal);
    if (!is_ok(s)) {
        out->kind = OutcomeKind::ManifestFailure;
        out->status = s;
        return;
    }

    out->kind = OutcomeKind::Success;
    out->status = ok_status();
    out->manifest_path = manifest_path(out->plan);

    s = fs.remove_dir(out->work_dir);
    if (!is_ok(s)) {
        spdlog::warn("upload finished but {} could not be removed ({}, aux={})", out->work_dir,
                     status_code_name(s.code), s.aux);
    }
}

} // namespace

Status validate_options(const UploadOptions& opts) noexcept {
    if (opts.source_path.empty()) {
        return invalid_option();
    }
    if (opts.container.empty() || opts.container.find('/') != std::string::npos) {
        return invalid_option();
    }
    if (opts.segment_size_mb == 0 || opts.segment_size_mb > std::numeric_limits<u64>::max() / kMiB) {
        return invalid_option();
    }
    if (opts.max_disk_space_mb > std::numeric_limits<u64>::max() / kMiB) {
        return invalid_option();
    }
    if (opts.concurrency == 0 || opts.max_segments == 0) {
        return invalid_option();
    }
    return ok_status();
}

std::string work_dir_for(const UploadOptions& opts) {
    return sloup::fs::join_path(opts.temp_dir.empty() ? std::string(".") : opts.temp_dir, kWorkDirName);
}

Status prepare_upload(const UploadOptions& opts, u64 source_size, PreparedUpload* out) noexcept {
    if (out == nullptr) {
        return invalid_option();
    }
    Status s = validate_options(opts);
    if (!is_ok(s)) {
        return s;
    }

    PlanRequest req;
    req.total_size = source_size;
    req.segment_size = opts.segment_size_mb * kMiB;
    req.max_segments = opts.max_segments;
    req.container = opts.container;
    req.object_name = opts.object_name.empty() ? sloup::fs::base_name(opts.source_path) : opts.object_name;

    PreparedUpload p;
    s = plan_upload(req, &p.plan);
    if (!is_ok(s)) {
        return s;
    }

    p.concurrency = effective_concurrency(opts.concurrency, opts.max_disk_space_mb * kMiB, p.plan.segment_size,
                                          p.plan.segment_count);
    if (p.concurrency.below_one_segment) {
        spdlog::warn("{} MiB of disk cannot hold one {} byte segment, running a single worker",
                     opts.max_disk_space_mb, p.plan.segment_size);
    } else if (p.concurrency.limited_by_disk) {
        spdlog::warn("{} concurrent segments do not fit in {} MiB of disk, using {}", opts.concurrency,
                     opts.max_disk_space_mb, p.concurrency.effective);
    }

    p.source_path = opts.source_path;
    p.work_dir = work_dir_for(opts);
    *out = std::move(p);
    return ok_status();
}

const char* outcome_kind_name(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success: return "Success";
        case OutcomeKind::SegmentFailure: return "SegmentFailure";
        case OutcomeKind::ManifestFailure: return "ManifestFailure";
        case OutcomeKind::PlanningError: return "PlanningError";
    }
    return "Unknown";
}

UploadOutcome execute_upload(const PreparedUpload& prepared, const UploadDeps& deps) noexcept {
    if (deps.storage == nullptr || deps.fs == nullptr || deps.source == nullptr) {
        return planning_error(make_status(StatusDomain::Plan, StatusCode::Invalid));
    }
    if (deps.source->size() != prepared.plan.total_size) {
        return planning_error(make_status(StatusDomain::Plan, StatusCode::Conflict));
    }

    UploadOutcome out;
    out.plan = prepared.plan;
    out.concurrency = prepared.concurrency.effective;

    Status s = deps.fs->ensure_dir(prepared.work_dir);
    if (!is_ok(s)) {
        spdlog::error("cannot create work directory {} ({}, aux={})", prepared.work_dir, status_code_name(s.code),
                      s.aux);
        out.kind = OutcomeKind::PlanningError;
        out.status = s;
        return out;
    }
    out.work_dir = prepared.work_dir;

    sloup::db::UploadJournal journal;
    s = journal.open(sloup::fs::join_path(prepared.work_dir, sloup::db::kJournalFileName));
    if (is_ok(s)) {
        s = journal.record_upload(prepared.plan, prepared.source_path);
    }
    if (!is_ok(s)) {
        spdlog::warn("continuing without an upload journal ({}, aux={})", status_code_name(s.code), s.aux);
        close_journal(journal);
    }

    CoordinatorDeps cdeps;
    cdeps.source = deps.source;
    cdeps.fs = deps.fs;
    cdeps.storage = deps.storage;
    cdeps.journal = journal.is_open() ? &journal : nullptr;
    cdeps.on_result = deps.on_result;

    UploadCoordinator coordinator(prepared.plan, prepared.concurrency.effective, prepared.work_dir,
                                  std::move(cdeps));
    RunReport report;
    s = coordinator.run(&report);
    if (!is_ok(s)) {
        close_journal(journal);
        out.kind = OutcomeKind::SegmentFailure;
        out.status = s;
        out.failed_indices = std::move(report.failed_indices);
        spdlog::error("upload of {} failed: {} of {} segments failed, work directory kept at {}",
                      prepared.source_path, out.failed_indices.size(), prepared.plan.segment_count,
                      prepared.work_dir);
        return out;
    }

    finish_with_manifest(*deps.storage, *deps.fs, std::move(report.results), journal, &out);
    return out;
}

UploadOutcome upload(const UploadOptions& opts, const UploadDeps& deps) noexcept {
    Status s = validate_options(opts);
    if (!is_ok(s)) {
        return planning_error(s);
    }

    sloup::fs::PosixSourceFile file;
    UploadDeps run_deps = deps;
    if (run_deps.source == nullptr) {
        s = file.open(opts.source_path);
        if (!is_ok(s)) {
            spdlog::error("cannot open {} ({}, aux={})", opts.source_path, status_code_name(s.code), s.aux);
            return planning_error(s);
        }
        run_deps.source = &file;
    }

    PreparedUpload prepared;
    s = prepare_upload(opts, run_deps.source->size(), &prepared);
    if (!is_ok(s)) {
        return planning_error(s);
    }
    return execute_upload(prepared, run_deps);
}

UploadOutcome finalize_upload(const std::string& work_dir, sloup::storage::ObjectStorageClient& storage,
                              sloup::fs::LocalFs& fs) noexcept {
    sloup::db::UploadJournal journal;
    Status s = journal.open(sloup::fs::join_path(work_dir, sloup::db::kJournalFileName),
                            sloup::db::OpenMode::Existing);
    if (!is_ok(s)) {
        return planning_error(s);
    }

    sloup::db::JournalUpload recorded;
    s = journal.load_upload(&recorded);
    std::vector<sloup::db::JournalSegment> segments;
    if (is_ok(s)) {
        s = journal.load_segments(&segments);
    }
    if (!is_ok(s)) {
        close_journal(journal);
        return planning_error(s);
    }

    UploadOutcome out;
    out.plan = recorded.plan;
    out.work_dir = work_dir;

    const sloup::db::JournalSummary summary = sloup::db::summarize(recorded, segments);
    if (!summary.failed.empty() || segments.size() != recorded.plan.segment_count) {
        close_journal(journal);
        out.kind = OutcomeKind::SegmentFailure;
        out.failed_indices = summary.failed;
        const u32 missing = recorded.plan.segment_count > summary.succeeded
                                ? recorded.plan.segment_count - summary.succeeded
                                : static_cast<u32>(summary.failed.size());
        out.status = make_status(StatusDomain::Coordinator, StatusCode::UploadFailed, missing);
        return out;
    }

    std::vector<SegmentResult> results;
    results.reserve(segments.size());
    for (auto& seg : segments) {
        results.push_back(std::move(seg.result));
    }
    finish_with_manifest(storage, fs, std::move(results), journal, &out);
    return out;
}

} // namespace sloup::upload
