#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/erasure/codec.hpp"
#include "shardsim/storage/buffer.hpp"

namespace shardsim::storage {
    constexpr const char* kHashAlgorithmName = "blake3";

    struct ShardDigest {
        shardsim::core::ShardIndex index{0};
        shardsim::core::Hash256 hash{};
        std::string hex;
    };

    [[nodiscard]] constexpr bool hash_is_zero(const shardsim::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    shardsim::core::Status hash_compute(BufferView data, shardsim::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const shardsim::core::Hash256& h);

    // Accepts exactly 64 hex characters, either case.
    [[nodiscard]] bool hash_from_hex(std::string_view hex, shardsim::core::Hash256* out) noexcept;

    // One digest per shard, ordered by shard index. With parallel set each
    // shard is hashed on its own task.
    shardsim::core::Status hash_shards(const shardsim::erasure::ShardSet& shards,
                                       bool parallel,
                                       std::vector<ShardDigest>* out) noexcept;

} // namespace shardsim::storage
