#pragma once

#include <string>
#include <vector>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/storage/backend.hpp"

namespace sloup::upload {

// Builds manifest entries in index order from results in any order. Invalid
// unless there is exactly one Succeeded result for every index of the plan.
[[nodiscard]] sloup::core::Status build_manifest(const sloup::core::UploadPlan& plan,
                                                 std::vector<sloup::core::SegmentResult> results,
                                                 sloup::core::Manifest* out) noexcept;

// PUTs the manifest. ManifestUploadFailed when the store does not acknowledge
// it; aux is the store's aux (the HTTP status for Swift).
[[nodiscard]] sloup::core::Status submit_manifest(sloup::storage::ObjectStorageClient& storage,
                                                  const sloup::core::UploadPlan& plan,
                                                  const sloup::core::Manifest& entries) noexcept;

// "{container}/{object_name}", the name callers use to fetch the object.
std::string manifest_path(const sloup::core::UploadPlan& plan);

} // namespace sloup::upload
