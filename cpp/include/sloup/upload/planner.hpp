#pragma once

#include <string>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/core/types.hpp"

namespace sloup::upload {
    using u32 = sloup::core::u32;
    using u64 = sloup::core::u64;

    struct PlanRequest {
        u64 total_size{0};
        u64 segment_size{sloup::core::kDefaultSegmentSize};
        u64 min_segment_size{sloup::core::kMinSegmentSize};
        u32 max_segments{sloup::core::kDefaultMaxSegments};
        std::string container;
        std::string object_name;
    };

    // Splits total_size into ceil(total_size / segment_size) segments. When
    // that exceeds max_segments the segment size is raised once to
    // ceil(total_size / max_segments), rounded up to a whole MiB.
    [[nodiscard]] sloup::core::Status plan_upload(const PlanRequest& req, sloup::core::UploadPlan* out) noexcept;

    // Byte range of segment `index`; only the last segment may be short.
    [[nodiscard]] sloup::core::Status segment_job(const sloup::core::UploadPlan& plan,
        u32 index,
        sloup::core::SegmentJob* out) noexcept;

    std::string segments_container_for(const std::string& container);

    // {object_name}/{total_size}/{index:08}: unique per source size and index.
    std::string segment_object_path(const sloup::core::UploadPlan& plan, u32 index);

    // Work-directory file name of a materialized segment.
    std::string segment_temp_name(u32 index);

} // namespace sloup::upload
