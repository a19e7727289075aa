#pragma once

#include <type_traits>

#include "sloup/core/types.hpp"

namespace sloup::storage {
    using u8 = sloup::core::u8;
    using u32 = sloup::core::u32;
    using u64 = sloup::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace sloup::storage
