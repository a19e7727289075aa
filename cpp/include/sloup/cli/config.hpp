#pragma once

#include <string>

#include "sloup/cli/options.hpp"
#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"
#include "sloup/upload/uploader.hpp"

namespace sloup::cli {

// Same shape as std::getenv, so tests can supply their own environment.
using EnvLookup = const char* (*)(const char* name);

enum class AuthMethod : sloup::core::u8 {
    Token = 0,       // storage_url and auth_token are ready to use
    KeystoneV2 = 1,  // auth_url, tenant, user, key
    TempAuthV1 = 2,  // auth_url, user, key
};

struct CredentialConfig {
    AuthMethod method{AuthMethod::Token};
    std::string storage_url;
    std::string auth_token;
    std::string auth_url;
    std::string tenant;
    std::string user;
    std::string key;
};

// --storage-url/--auth-token, then OS_STORAGE_URL/OS_AUTH_TOKEN, then Keystone
// v2 from OS_AUTH_URL/OS_TENANT_NAME/OS_USERNAME/OS_PASSWORD, then TempAuth from
// ST_AUTH/ST_USER/ST_KEY. NotFound when none of them is complete.
[[nodiscard]] sloup::core::Status resolve_credentials(const ParsedOptions& opts, EnvLookup env,
                                                      CredentialConfig* out) noexcept;

// Fills UploadOptions from parsed options and positionals. Out-of-range
// numbers are Cli/Invalid with aux = the OptionId.
[[nodiscard]] sloup::core::Status build_upload_options(const ParsedOptions& opts, const char* source_path,
                                                       const char* container,
                                                       sloup::upload::UploadOptions* out) noexcept;

// --temp-dir if given, else ".".
std::string temp_dir_option(const ParsedOptions& opts);

} // namespace sloup::cli
