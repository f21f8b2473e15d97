#pragma once

#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/storage/buffer.hpp"

namespace shardsim::erasure {
    using u8 = shardsim::core::u8;
    using u32 = shardsim::core::u32;
    using u64 = shardsim::core::u64;
    using i32 = shardsim::core::i32;

    // GF(2^8) bounds the number of distinct Vandermonde rows.
    constexpr i32 kMaxDataShards = 256;
    constexpr i32 kMaxTotalShards = 256;
    constexpr int kGaloisWordBits = 8;

    constexpr const char* kAlgorithmName = "jerasure/reed_sol_van";

    struct CodecParams {
        i32 data{4};
        i32 parity{2};
    };

    // Shards [0, data_count) carry the object, [data_count, data_count + parity_count) parity.
    struct ShardSet {
        u32 data_count{0};
        u32 parity_count{0};
        u64 shard_bytes{0};
        u64 object_bytes{0};
        std::vector<std::vector<u8>> shards;

        [[nodiscard]] u32 total() const noexcept { return data_count + parity_count; }
    };

    // Eager parameter check, no allocation and no I/O.
    [[nodiscard]] shardsim::core::Status codec_validate_params(const CodecParams& params) noexcept;

    // ceil(object_bytes / data); 0 when either argument is 0.
    [[nodiscard]] constexpr u64 shard_bytes_for(u64 object_bytes, u32 data) noexcept {
        if (data == 0) {
            return 0;
        }
        return (object_bytes + data - 1) / data;
    }

    // Systematic Reed-Solomon codec over GF(2^8) using a Vandermonde-derived
    // coding matrix. Not copyable; the coding matrix is owned.
    class ErasureCodec {
    public:
        ErasureCodec() noexcept = default;
        ~ErasureCodec() noexcept;

        ErasureCodec(const ErasureCodec&) = delete;
        ErasureCodec& operator=(const ErasureCodec&) = delete;

        [[nodiscard]] shardsim::core::Status init(const CodecParams& params) noexcept;

        // Allocates data + parity shards and fills the data shards, zero padded.
        [[nodiscard]] shardsim::core::Status split(shardsim::storage::BufferView object, ShardSet* out) const noexcept;

        // Computes parity shards in place from the data shards.
        [[nodiscard]] shardsim::core::Status encode(ShardSet* shards) const noexcept;

        [[nodiscard]] shardsim::core::Status encode_object(shardsim::storage::BufferView object,
                                                           ShardSet* out) const noexcept;

        [[nodiscard]] bool ready() const noexcept { return ready_; }
        [[nodiscard]] u32 data_shards() const noexcept { return static_cast<u32>(params_.data); }
        [[nodiscard]] u32 parity_shards() const noexcept { return static_cast<u32>(params_.parity); }
        [[nodiscard]] u32 total_shards() const noexcept { return data_shards() + parity_shards(); }
        [[nodiscard]] const char* algorithm() const noexcept { return kAlgorithmName; }

    private:
        void reset() noexcept;

        CodecParams params_{};
        int* matrix_{nullptr};
        bool ready_{false};
    };

} // namespace shardsim::erasure
