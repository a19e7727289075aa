#pragma once

#include <string>

#include "sloup/core/models.hpp"

namespace sloup::storage {

// SLO manifest body: a compact JSON array of {"etag","path","size_bytes"}
// objects in entry order. The output depends only on the entries.
std::string manifest_to_json(const sloup::core::Manifest& entries);

} // namespace sloup::storage
