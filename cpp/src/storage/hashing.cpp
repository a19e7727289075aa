#include "sloup/storage/hashing.hpp"

#include <cstddef>

#include <openssl/evp.h>

namespace sloup::storage {
    namespace {
        [[nodiscard]] sloup::core::Status invalid() noexcept {
            return sloup::core::make_status(sloup::core::StatusDomain::Core, sloup::core::StatusCode::Invalid);
        }

        [[nodiscard]] sloup::core::Status hash_failed() noexcept {
            return sloup::core::make_status(sloup::core::StatusDomain::Core, sloup::core::StatusCode::Unknown);
        }
    } // namespace

    sloup::core::Status md5_compute(BufferView data, Md5Digest* out) noexcept {
        if (out == nullptr){
            return invalid();
        }
        if (data.len > 0 && data.data == nullptr){
            return invalid();
        }

        Md5Hasher hasher;
        sloup::core::Status s = hasher.init();
        if (!sloup::core::is_ok(s)) {
            return s;
        }
        s = hasher.update(data);
        if (!sloup::core::is_ok(s)) {
            return s;
        }
        return hasher.finalize(out);
    }

    std::string md5_to_hex(const Md5Digest& d) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(d.b.size() * 2);
        for (u8 b : d.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }

    Md5Hasher::~Md5Hasher() noexcept {
        if (ctx_ != nullptr) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    sloup::core::Status Md5Hasher::init() noexcept {
        if (ctx_ == nullptr) {
            ctx_ = EVP_MD_CTX_new();
            if (ctx_ == nullptr) {
                return hash_failed();
            }
        }
        if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
            return hash_failed();
        }
        return sloup::core::ok_status();
    }

    sloup::core::Status Md5Hasher::update(BufferView data) noexcept {
        if (ctx_ == nullptr) {
            return invalid();
        }
        if (data.len > 0 && data.data == nullptr) {
            return invalid();
        }
        if (data.len > 0 && EVP_DigestUpdate(ctx_, data.data, static_cast<size_t>(data.len)) != 1) {
            return hash_failed();
        }
        return sloup::core::ok_status();
    }

    sloup::core::Status Md5Hasher::finalize(Md5Digest* out) noexcept {
        if (ctx_ == nullptr || out == nullptr) {
            return invalid();
        }
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out->b.data(), &len) != 1 || len != out->b.size()) {
            return hash_failed();
        }
        return sloup::core::ok_status();
    }
} // namespace sloup::storage
