#pragma once

#include <functional>
#include <string>
#include <vector>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/db/journal.hpp"
#include "sloup/fs/local_fs.hpp"
#include "sloup/storage/backend.hpp"

namespace sloup::upload {

using u32 = sloup::core::u32;

// Called on the coordinator thread after every finished segment.
using ProgressFn = std::function<void(const sloup::core::SegmentResult& result, u32 finished, u32 total)>;

struct CoordinatorDeps {
    sloup::fs::SourceFile* source{nullptr};
    sloup::fs::LocalFs* fs{nullptr};
    sloup::storage::ObjectStorageClient* storage{nullptr};
    sloup::db::UploadJournal* journal{nullptr};  // optional
    ProgressFn on_result;                         // optional
};

struct RunReport {
    std::vector<sloup::core::SegmentResult> results;  // finished segments, ordered by index
    std::vector<u32> failed_indices;                  // ascending
    u32 dispatched{0};
    u32 gate_high_water{0};
};

// Drives every segment of a plan through a pool of `concurrency` workers.
//
// The coordinator thread is the only dispatcher and the only consumer of
// results: it keeps at most `concurrency` jobs in flight, stops dispatching
// after the first failed segment, and waits for in-flight workers before
// returning. Workers hand results back over a channel; nothing else is shared
// with them except the disk budget gate.
class UploadCoordinator {
public:
    UploadCoordinator(const sloup::core::UploadPlan& plan, u32 concurrency, std::string work_dir,
                      CoordinatorDeps deps);

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    // Ok when every segment succeeded. UploadFailed (aux = number of failed
    // segments) when any failed; the container creation error when the
    // segments container could not be created; BudgetExhausted if the gate
    // accounting broke.
    [[nodiscard]] sloup::core::Status run(RunReport* report) noexcept;

private:
    const sloup::core::UploadPlan& plan_;
    const u32 concurrency_;
    const std::string work_dir_;
    CoordinatorDeps deps_;
};

} // namespace sloup::upload
