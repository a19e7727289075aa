#include "sloup/cli/config.hpp"

#include <limits>
#include <utility>

namespace sloup::cli {

using sloup::core::Status;
using sloup::core::StatusCode;
using sloup::core::StatusDomain;
using sloup::core::make_status;

namespace {

[[nodiscard]] const char* string_option(const ParsedOptions& opts, OptionId id) noexcept {
    const ParsedOption* o = find_option(opts, id);
    if (o == nullptr || o->type != OptionType::String) {
        return nullptr;
    }
    return o->value.str;
}

[[nodiscard]] bool non_empty(const char* s) noexcept {
    return s != nullptr && *s != '\0';
}

[[nodiscard]] const char* lookup(EnvLookup env, const char* name) noexcept {
    return env == nullptr ? nullptr : env(name);
}

// Reads an integer option into *out when present, checking [min, max].
template <typename T>
[[nodiscard]] Status integer_option(const ParsedOptions& opts, OptionId id, i64 min, T* out) noexcept {
    const ParsedOption* o = find_option(opts, id);
    if (o == nullptr) {
        return sloup::core::ok_status();
    }
    const i64 v = o->value.i64v;
    if (o->type != OptionType::I64 || v < min ||
        static_cast<sloup::core::u64>(v) > static_cast<sloup::core::u64>(std::numeric_limits<T>::max())) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid, static_cast<u32>(id));
    }
    *out = static_cast<T>(v);
    return sloup::core::ok_status();
}

} // namespace

Status resolve_credentials(const ParsedOptions& opts, EnvLookup env, CredentialConfig* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    CredentialConfig cfg;

    const char* url = string_option(opts, OptionId::StorageUrl);
    const char* token = string_option(opts, OptionId::AuthToken);
    if (!non_empty(url)) url = lookup(env, "OS_STORAGE_URL");
    if (!non_empty(token)) token = lookup(env, "OS_AUTH_TOKEN");
    if (non_empty(url) && non_empty(token)) {
        cfg.storage_url = url;
        cfg.auth_token = token;
        *out = std::move(cfg);
        return sloup::core::ok_status();
    }

    const char* os_auth = lookup(env, "OS_AUTH_URL");
    const char* os_tenant = lookup(env, "OS_TENANT_NAME");
    const char* os_user = lookup(env, "OS_USERNAME");
    const char* os_password = lookup(env, "OS_PASSWORD");
    if (non_empty(os_auth) && non_empty(os_tenant) && non_empty(os_user) && non_empty(os_password)) {
        cfg.method = AuthMethod::KeystoneV2;
        cfg.auth_url = os_auth;
        cfg.tenant = os_tenant;
        cfg.user = os_user;
        cfg.key = os_password;
        *out = std::move(cfg);
        return sloup::core::ok_status();
    }

    const char* auth = lookup(env, "ST_AUTH");
    const char* user = lookup(env, "ST_USER");
    const char* key = lookup(env, "ST_KEY");
    if (non_empty(auth) && non_empty(user) && non_empty(key)) {
        cfg.method = AuthMethod::TempAuthV1;
        cfg.auth_url = auth;
        cfg.user = user;
        cfg.key = key;
        *out = std::move(cfg);
        return sloup::core::ok_status();
    }
    return make_status(StatusDomain::Cli, StatusCode::NotFound);
}

Status build_upload_options(const ParsedOptions& opts, const char* source_path, const char* container,
                            sloup::upload::UploadOptions* out) noexcept {
    if (out == nullptr || !non_empty(source_path) || !non_empty(container)) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    sloup::upload::UploadOptions o;
    o.source_path = source_path;
    o.container = container;

    Status s = integer_option(opts, OptionId::SegmentSize, 1, &o.segment_size_mb);
    if (!sloup::core::is_ok(s)) return s;
    s = integer_option(opts, OptionId::Concurrency, 1, &o.concurrency);
    if (!sloup::core::is_ok(s)) return s;
    s = integer_option(opts, OptionId::MaxDiskSpace, 0, &o.max_disk_space_mb);
    if (!sloup::core::is_ok(s)) return s;
    s = integer_option(opts, OptionId::MaxSegments, 1, &o.max_segments);
    if (!sloup::core::is_ok(s)) return s;

    if (const char* name = string_option(opts, OptionId::ObjectName); non_empty(name)) {
        o.object_name = name;
    }
    if (const char* dir = string_option(opts, OptionId::TempDir); non_empty(dir)) {
        o.temp_dir = dir;
    }

    *out = std::move(o);
    return sloup::core::ok_status();
}

std::string temp_dir_option(const ParsedOptions& opts) {
    const char* dir = string_option(opts, OptionId::TempDir);
    return non_empty(dir) ? std::string(dir) : std::string(".");
}

} // namespace sloup::cli
