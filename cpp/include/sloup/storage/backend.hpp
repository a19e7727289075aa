#pragma once

#include <string>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"

namespace sloup::storage {

using u64 = sloup::core::u64;

struct PutObjectRequest {
    std::string container;
    std::string object_path;   // path inside the container
    std::string local_path;    // file whose contents become the object body
    u64 size_bytes{0};
    std::string md5_hex;       // expected body MD5 (sent as ETag), may be empty
};

struct PutObjectResult {
    u64 size_bytes{0};
    std::string etag;
};

// Object storage operations the upload core needs. Implementations must be
// callable from several worker threads at once.
class ObjectStorageClient {
public:
    virtual ~ObjectStorageClient() = default;

    // Succeeds when the container already exists.
    [[nodiscard]] virtual sloup::core::Status create_container(const std::string& name) noexcept = 0;

    [[nodiscard]] virtual sloup::core::Status put_object(const PutObjectRequest& req,
                                                          PutObjectResult* result) noexcept = 0;

    // Stores `entries` as a Static Large Object manifest named `object_name`.
    [[nodiscard]] virtual sloup::core::Status put_manifest(const std::string& container,
                                                            const std::string& object_name,
                                                            const sloup::core::Manifest& entries) noexcept = 0;
};

} // namespace sloup::storage
