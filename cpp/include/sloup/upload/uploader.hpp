#pragma once

#include <string>
#include <vector>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/core/types.hpp"
#include "sloup/fs/local_fs.hpp"
#include "sloup/storage/backend.hpp"
#include "sloup/upload/coordinator.hpp"
#include "sloup/upload/disk_budget.hpp"

namespace sloup::upload {

using u8 = sloup::core::u8;
using u32 = sloup::core::u32;
using u64 = sloup::core::u64;

struct UploadOptions {
    std::string source_path;
    std::string container;
    std::string object_name;                           // empty: last component of source_path
    u64 segment_size_mb{1};
    u32 concurrency{sloup::core::kDefaultConcurrency};
    u64 max_disk_space_mb{0};                          // 0: no ceiling
    std::string temp_dir;                              // parent of the work directory; empty: "."
    u32 max_segments{sloup::core::kDefaultMaxSegments};
};

[[nodiscard]] sloup::core::Status validate_options(const UploadOptions& opts) noexcept;

// {temp_dir}/sloup-work
std::string work_dir_for(const UploadOptions& opts);

struct PreparedUpload {
    sloup::core::UploadPlan plan;
    ConcurrencyDecision concurrency;
    std::string source_path;
    std::string work_dir;
};

// Validates options and plans segments for a source of `source_size` bytes.
// No I/O.
[[nodiscard]] sloup::core::Status prepare_upload(const UploadOptions& opts, u64 source_size,
                                                 PreparedUpload* out) noexcept;

enum class OutcomeKind : u8 {
    Success = 0,
    SegmentFailure = 1,
    ManifestFailure = 2,
    PlanningError = 3,
};

const char* outcome_kind_name(OutcomeKind kind) noexcept;

struct UploadOutcome {
    OutcomeKind kind{OutcomeKind::PlanningError};
    sloup::core::Status status{};
    std::string manifest_path;       // Success
    std::vector<u32> failed_indices; // SegmentFailure
    sloup::core::UploadPlan plan;
    u32 concurrency{0};
    std::string work_dir;            // retained on every failure after planning
};

struct UploadDeps {
    sloup::storage::ObjectStorageClient* storage{nullptr};
    sloup::fs::LocalFs* fs{nullptr};
    sloup::fs::SourceFile* source{nullptr};  // null: open source_path from disk
    ProgressFn on_result;
};

// Runs a prepared upload: work directory, journal, segments, manifest. The
// work directory is removed only when the manifest was stored.
[[nodiscard]] UploadOutcome execute_upload(const PreparedUpload& prepared, const UploadDeps& deps) noexcept;

// open source -> prepare_upload -> execute_upload.
[[nodiscard]] UploadOutcome upload(const UploadOptions& opts, const UploadDeps& deps) noexcept;

// Re-submits only the manifest of a run whose segments are all recorded as
// uploaded in the journal retained in `work_dir`.
[[nodiscard]] UploadOutcome finalize_upload(const std::string& work_dir,
                                            sloup::storage::ObjectStorageClient& storage,
                                            sloup::fs::LocalFs& fs) noexcept;

} // namespace sloup::upload
