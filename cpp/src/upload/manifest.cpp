#include "sloup/upload/manifest.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace sloup::upload {

using namespace sloup::core;

Status build_manifest(const UploadPlan& plan, std::vector<SegmentResult> results, Manifest* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Manifest, StatusCode::Invalid);
    }
    if (results.size() != plan.segment_count) {
        return make_status(StatusDomain::Manifest, StatusCode::Invalid, static_cast<u32>(results.size()));
    }

    std::sort(results.begin(), results.end(),
              [](const SegmentResult& a, const SegmentResult& b) { return a.index < b.index; });

    Manifest entries;
    entries.reserve(results.size());
    for (u32 i = 0; i < results.size(); ++i) {
        const SegmentResult& r = results[i];
        if (r.index != i) {
            // Duplicate or missing index.
            return make_status(StatusDomain::Manifest, StatusCode::Invalid, i);
        }
        if (r.status != SegmentStatus::Succeeded || r.remote_object_path.empty()) {
            return make_status(StatusDomain::Manifest, StatusCode::Invalid, i);
        }

        ManifestEntry e;
        e.path = "/" + r.remote_object_path;
        e.etag = r.etag;
        e.size_bytes = r.size_bytes;
        entries.push_back(std::move(e));
    }

    *out = std::move(entries);
    return ok_status();
}

Status submit_manifest(sloup::storage::ObjectStorageClient& storage, const UploadPlan& plan,
                       const Manifest& entries) noexcept {
    if (entries.empty() || entries.size() != plan.segment_count) {
        return make_status(StatusDomain::Manifest, StatusCode::Invalid);
    }

    const Status s = storage.put_manifest(plan.container, plan.object_name, entries);
    if (!is_ok(s)) {
        spdlog::error("manifest {} not accepted ({}/{}, aux={}); all {} segments remain in {}",
                      manifest_path(plan), status_domain_name(s.domain), status_code_name(s.code), s.aux,
                      entries.size(), plan.segments_container);
        return make_status(StatusDomain::Manifest, StatusCode::ManifestUploadFailed, s.aux);
    }

    spdlog::info("manifest {} stored ({} segments)", manifest_path(plan), entries.size());
    return ok_status();
}

std::string manifest_path(const UploadPlan& plan) {
    return plan.container + "/" + plan.object_name;
}

} // namespace sloup::upload
