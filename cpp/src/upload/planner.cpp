#include "sloup/upload/planner.hpp"

#include <cstdio>

#include <spdlog/spdlog.h>

namespace sloup::upload {
    namespace {
        [[nodiscard]] sloup::core::Status invalid_input(u32 aux = 0) noexcept {
            return sloup::core::make_status(sloup::core::StatusDomain::Plan, sloup::core::StatusCode::Invalid, aux);
        }

        [[nodiscard]] constexpr u64 round_up(u64 v, u64 unit) noexcept {
            return sloup::core::ceil_div(v, unit) * unit;
        }
    } // namespace

    sloup::core::Status plan_upload(const PlanRequest& req, sloup::core::UploadPlan* out) noexcept {
        if (out == nullptr) {
            return invalid_input();
        }
        if (req.total_size == 0) {
            return invalid_input();
        }
        if (req.min_segment_size == 0 || req.segment_size < req.min_segment_size) {
            return invalid_input();
        }
        if (req.max_segments == 0) {
            return invalid_input();
        }
        if (req.container.empty() || req.object_name.empty()) {
            return invalid_input();
        }

        u64 segment_size = req.segment_size;
        u64 count = sloup::core::ceil_div(req.total_size, segment_size);
        bool adjusted = false;

        if (count > req.max_segments) {
            const u64 wanted = sloup::core::ceil_div(req.total_size, req.max_segments);
            segment_size = round_up(wanted, sloup::core::kMiB);
            count = sloup::core::ceil_div(req.total_size, segment_size);
            adjusted = true;
            spdlog::info("segment size {} bytes would need more than {} segments, using {} bytes",
                         req.segment_size, req.max_segments, segment_size);
        }

        out->total_size = req.total_size;
        out->segment_size = segment_size;
        out->segment_count = static_cast<u32>(count);
        out->container = req.container;
        out->segments_container = segments_container_for(req.container);
        out->object_name = req.object_name;
        out->segment_size_adjusted = adjusted;
        return sloup::core::ok_status();
    }

    sloup::core::Status segment_job(const sloup::core::UploadPlan& plan, u32 index, sloup::core::SegmentJob* out) noexcept {
        if (out == nullptr || plan.segment_size == 0 || index >= plan.segment_count) {
            return invalid_input();
        }

        const u64 offset = static_cast<u64>(index) * plan.segment_size;
        if (offset >= plan.total_size) {
            return invalid_input();
        }
        const u64 remaining = plan.total_size - offset;

        out->index = index;
        out->byte_offset = offset;
        out->byte_length = remaining < plan.segment_size ? remaining : plan.segment_size;
        out->local_path.clear();
        return sloup::core::ok_status();
    }

    std::string segments_container_for(const std::string& container) {
        return container + "_segments";
    }

    std::string segment_object_path(const sloup::core::UploadPlan& plan, u32 index) {
        char tail[48];
        std::snprintf(tail, sizeof(tail), "/%llu/%08u",
                      static_cast<unsigned long long>(plan.total_size), index);
        return plan.object_name + tail;
    }

    std::string segment_temp_name(u32 index) {
        char name[32];
        std::snprintf(name, sizeof(name), "segment_%08u", index);
        return name;
    }
} // namespace sloup::upload
