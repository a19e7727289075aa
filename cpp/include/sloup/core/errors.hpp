#pragma once
#include <cstdint>
#include <type_traits>

namespace sloup::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Network,
        Unsupported,
        Unavailable,
        UploadFailed,          // one or more segments failed
        ManifestUploadFailed,  // every segment is remote, the manifest is not
        BudgetExhausted,       // disk budget accounting broke
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Plan,
        Budget,
        Segment,
        Coordinator,
        Manifest,
        Swift,
        Fs,
        Journal,
        Cli,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Busy: return "Busy";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Network: return "Network";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
            case StatusCode::UploadFailed: return "UploadFailed";
            case StatusCode::ManifestUploadFailed: return "ManifestUploadFailed";
            case StatusCode::BudgetExhausted: return "BudgetExhausted";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Plan: return "Plan";
            case StatusDomain::Budget: return "Budget";
            case StatusDomain::Segment: return "Segment";
            case StatusDomain::Coordinator: return "Coordinator";
            case StatusDomain::Manifest: return "Manifest";
            case StatusDomain::Swift: return "Swift";
            case StatusDomain::Fs: return "Fs";
            case StatusDomain::Journal: return "Journal";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace sloup::core
