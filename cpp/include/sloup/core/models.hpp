#pragma once
#include <string>
#include <type_traits>
#include <vector>

#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"

namespace sloup::core {
    // Immutable once produced by the planner.
    struct UploadPlan {
        u64 total_size{0};
        u64 segment_size{0};
        u32 segment_count{0};
        std::string container;
        std::string segments_container;
        std::string object_name;
        bool segment_size_adjusted{false};  // requested size would exceed the segment limit
    };

    struct SegmentJob {
        u32 index{0};
        u64 byte_offset{0};
        u64 byte_length{0};
        std::string local_path;  // set while the temp file exists
    };

    enum class SegmentStatus : u8 {
        Succeeded = 0,
        Failed = 1,
    };

    struct SegmentResult {
        u32 index{0};
        SegmentStatus status{SegmentStatus::Failed};
        std::string remote_object_path;  // {segments_container}/{object path}
        u64 size_bytes{0};
        std::string etag;
        Status error{};
    };

    struct ManifestEntry {
        std::string path;  // "/{segments_container}/{object path}"
        std::string etag;
        u64 size_bytes{0};

        friend bool operator==(const ManifestEntry&, const ManifestEntry&) = default;
    };

    using Manifest = std::vector<ManifestEntry>;

    static_assert(std::is_trivially_copyable_v<SegmentStatus>);
} // namespace sloup::core
