#pragma once

#include <array>
#include <string>

#include "sloup/core/errors.hpp"
#include "sloup/core/types.hpp"
#include "sloup/storage/buffer.hpp"

struct evp_md_ctx_st;

namespace sloup::storage {
    // Swift ETags for plain objects are the hex MD5 of the body.
    struct Md5Digest {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Md5Digest&, const Md5Digest&) noexcept = default;
    };

    [[nodiscard]] constexpr bool digest_is_zero(const Md5Digest& d) noexcept {
        for (u8 b : d.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    sloup::core::Status md5_compute(BufferView data, Md5Digest* out) noexcept;

    // Lowercase hex, the form Swift returns in ETag headers.
    std::string md5_to_hex(const Md5Digest& d);

    // Incremental MD5 for data that is produced in chunks.
    class Md5Hasher {
    public:
        Md5Hasher() noexcept = default;
        ~Md5Hasher() noexcept;

        Md5Hasher(const Md5Hasher&) = delete;
        Md5Hasher& operator=(const Md5Hasher&) = delete;

        [[nodiscard]] sloup::core::Status init() noexcept;
        [[nodiscard]] sloup::core::Status update(BufferView data) noexcept;
        [[nodiscard]] sloup::core::Status finalize(Md5Digest* out) noexcept;

    private:
        evp_md_ctx_st* ctx_{nullptr};
    };

} // namespace sloup::storage
