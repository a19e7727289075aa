#pragma once

#include <string>

#include "sloup/core/models.hpp"
#include "sloup/fs/local_fs.hpp"
#include "sloup/storage/backend.hpp"
#include "sloup/upload/disk_budget.hpp"

namespace sloup::upload {

// Everything a worker touches besides its own job. Shared, read-only except
// for the gate.
struct WorkerContext {
    const sloup::core::UploadPlan* plan{nullptr};
    std::string work_dir;
    sloup::fs::SourceFile* source{nullptr};
    sloup::fs::LocalFs* fs{nullptr};
    sloup::storage::ObjectStorageClient* storage{nullptr};
    DiskBudgetGate* gate{nullptr};
};

// Materializes, uploads and deletes one segment:
//   1. take a disk budget unit
//   2. copy the byte range into work_dir/segment_NNNNNNNN, hashing it
//   3. PUT it into the segments container
//   4. delete the local copy (always, and before step 5)
//   5. return the budget unit
// Every failure becomes a Failed result; nothing is retried here.
[[nodiscard]] sloup::core::SegmentResult process_segment(const WorkerContext& ctx,
                                                         sloup::core::SegmentJob job) noexcept;

} // namespace sloup::upload
