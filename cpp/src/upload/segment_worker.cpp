#include "sloup/upload/segment_worker.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sloup/storage/hashing.hpp"
#include "sloup/upload/planner.hpp"

namespace sloup::upload {

using namespace sloup::core;

namespace {

[[nodiscard]] Status as_segment_io(Status s) noexcept {
    return make_status(StatusDomain::Segment, s.code, s.aux);
}

[[nodiscard]] SegmentResult failed(u32 index, Status error) {
    SegmentResult r;
    r.index = index;
    r.status = SegmentStatus::Failed;
    r.error = error;
    return r;
}

// Copies [byte_offset, byte_offset + byte_length) of the source into `out`.
Status copy_range(const WorkerContext& ctx, const SegmentJob& job, sloup::fs::TempFile* out,
                  sloup::storage::Md5Digest* digest) {
    sloup::storage::Md5Hasher hasher;
    Status s = hasher.init();
    if (!is_ok(s)) return s;

    std::vector<u8> chunk(static_cast<size_t>(std::min(job.byte_length, kCopyChunkBytes)));
    u64 copied = 0;
    while (copied < job.byte_length) {
        const u64 want = std::min<u64>(chunk.size(), job.byte_length - copied);
        u64 got = 0;
        s = ctx.source->read_range(job.byte_offset + copied, {chunk.data(), want}, &got);
        if (!is_ok(s)) return as_segment_io(s);
        if (got == 0) {
            // Source shrank underneath us.
            return make_status(StatusDomain::Segment, StatusCode::Corrupt);
        }

        s = hasher.update({chunk.data(), got});
        if (!is_ok(s)) return s;

        s = out->write({chunk.data(), got});
        if (!is_ok(s)) return as_segment_io(s);

        copied += got;
    }

    s = out->close();
    if (!is_ok(s)) return as_segment_io(s);

    return hasher.finalize(digest);
}

void discard_local(const WorkerContext& ctx, SegmentJob* job) {
    if (job->local_path.empty()) {
        return;
    }
    const Status s = ctx.fs->delete_file(job->local_path);
    if (!is_ok(s)) {
        spdlog::warn("segment {}: could not delete {} ({}/{}, aux={})", job->index, job->local_path,
                     status_domain_name(s.domain), status_code_name(s.code), s.aux);
    }
    job->local_path.clear();
}

} // namespace

SegmentResult process_segment(const WorkerContext& ctx, SegmentJob job) noexcept {
    if (ctx.plan == nullptr || ctx.source == nullptr || ctx.fs == nullptr || ctx.storage == nullptr ||
        ctx.gate == nullptr) {
        return failed(job.index, make_status(StatusDomain::Segment, StatusCode::Invalid));
    }

    GatePermit permit(*ctx.gate);

    std::unique_ptr<sloup::fs::TempFile> file;
    Status s = ctx.fs->open_temp_file(ctx.work_dir, segment_temp_name(job.index), &file);
    if (!is_ok(s)) {
        spdlog::warn("segment {}: cannot create temp file in {}", job.index, ctx.work_dir);
        return failed(job.index, as_segment_io(s));
    }
    job.local_path = file->path();

    sloup::storage::Md5Digest digest{};
    s = copy_range(ctx, job, file.get(), &digest);
    file.reset();
    if (!is_ok(s)) {
        spdlog::warn("segment {}: materializing {} bytes at {} failed ({}/{}, aux={})", job.index,
                     job.byte_length, job.byte_offset, status_domain_name(s.domain),
                     status_code_name(s.code), s.aux);
        discard_local(ctx, &job);
        const Status released = permit.release();
        return failed(job.index, is_ok(released) ? s : released);
    }

    sloup::storage::PutObjectRequest req;
    req.container = ctx.plan->segments_container;
    req.object_path = segment_object_path(*ctx.plan, job.index);
    req.local_path = job.local_path;
    req.size_bytes = job.byte_length;
    req.md5_hex = sloup::storage::md5_to_hex(digest);

    spdlog::debug("segment {}: uploading {} bytes to {}/{}", job.index, req.size_bytes, req.container,
                  req.object_path);

    sloup::storage::PutObjectResult put{};
    s = ctx.storage->put_object(req, &put);

    discard_local(ctx, &job);
    const Status released = permit.release();
    if (!is_ok(released)) {
        return failed(job.index, released);
    }

    if (!is_ok(s)) {
        spdlog::warn("segment {}: upload failed ({}/{}, aux={})", job.index, status_domain_name(s.domain),
                     status_code_name(s.code), s.aux);
        return failed(job.index, s);
    }

    SegmentResult r;
    r.index = job.index;
    r.status = SegmentStatus::Succeeded;
    r.remote_object_path = req.container + "/" + req.object_path;
    r.size_bytes = job.byte_length;
    r.etag = put.etag.empty() ? req.md5_hex : put.etag;
    return r;
}

} // namespace sloup::upload
