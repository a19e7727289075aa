#pragma once

#include <string>

#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"
#include "sloup/storage/backend.hpp"

namespace sloup::storage {

struct SwiftCredentials {
    std::string storage_url;  // account URL, e.g. https://host/v1/AUTH_acct
    std::string auth_token;
};

// ========================================================================
// Helpers
// ========================================================================

// curl_global_init; call once from main before any worker thread starts.
[[nodiscard]] sloup::core::Status swift_global_init() noexcept;
void swift_global_cleanup() noexcept;

// Swift-domain status for an HTTP response code; aux carries the code.
[[nodiscard]] sloup::core::Status http_status_to_status(long http_code) noexcept;

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string escape_path_component(const std::string& s);

// Percent-encodes each '/'-separated component, keeping the separators.
std::string escape_object_path(const std::string& path);

// {storage_url}/{container}[/{object_path}], trailing '/' on storage_url ignored.
std::string swift_object_url(const std::string& storage_url, const std::string& container,
                             const std::string& object_path = std::string());

// TempAuth / v1 authentication. Fills storage URL and token from the
// X-Storage-Url and X-Auth-Token response headers.
[[nodiscard]] sloup::core::Status authenticate_v1(const std::string& auth_url, const std::string& user,
                                                  const std::string& key, SwiftCredentials* out) noexcept;

// Keystone v2 authentication (POST {auth_url}/tokens with passwordCredentials
// and tenantName). The storage URL is the publicURL of the first object-store
// endpoint in the service catalog.
[[nodiscard]] sloup::core::Status authenticate_v2(const std::string& auth_url, const std::string& tenant,
                                                  const std::string& user, const std::string& password,
                                                  SwiftCredentials* out) noexcept;

// Request body of authenticate_v2.
std::string keystone_v2_request_body(const std::string& tenant, const std::string& user,
                                     const std::string& password);

// Token id and object-store publicURL from a v2 token response. Corrupt when
// either is missing, NotFound when the catalog has no object-store endpoint.
[[nodiscard]] sloup::core::Status parse_keystone_v2_response(const std::string& body,
                                                             SwiftCredentials* out) noexcept;

// ========================================================================
// Client
// ========================================================================

// ObjectStorageClient over the Swift REST API. Every request uses its own curl
// easy handle, so one client serves all workers.
class SwiftClient final : public ObjectStorageClient {
public:
    explicit SwiftClient(SwiftCredentials creds);

    const SwiftCredentials& credentials() const noexcept { return creds_; }

    // HEAD on the account; Ok means the token is accepted.
    [[nodiscard]] sloup::core::Status head_account() noexcept;

    // Ok with *exists = false on 404.
    [[nodiscard]] sloup::core::Status head_container(const std::string& name, bool* exists) noexcept;

    [[nodiscard]] sloup::core::Status create_container(const std::string& name) noexcept override;
    [[nodiscard]] sloup::core::Status put_object(const PutObjectRequest& req,
                                                 PutObjectResult* result) noexcept override;
    [[nodiscard]] sloup::core::Status put_manifest(const std::string& container, const std::string& object_name,
                                                   const sloup::core::Manifest& entries) noexcept override;

private:
    SwiftCredentials creds_;
};

} // namespace sloup::storage
