#pragma once

#include <type_traits>
#include <vector>

#include "shardsim/core/types.hpp"

namespace shardsim::storage {
    using u8 = shardsim::core::u8;
    using u32 = shardsim::core::u32;
    using u64 = shardsim::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView view_of(const std::vector<u8>& v) noexcept {
        return BufferView{v.data(), static_cast<u64>(v.size())};
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace shardsim::storage
