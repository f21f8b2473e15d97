#include "shardsim/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

#include "shardsim/core/task_group.hpp"

namespace shardsim::storage {
    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        shardsim::core::Status digest_one(const std::vector<u8>& shard,
                                          shardsim::core::ShardIndex index,
                                          ShardDigest* out) noexcept {
            out->index = index;
            const shardsim::core::Status s = hash_compute(view_of(shard), &out->hash);
            if (!shardsim::core::is_ok(s)) {
                return s;
            }
            out->hex = hash_to_hex(out->hash);
            return shardsim::core::ok_status();
        }
    } // namespace

    shardsim::core::Status hash_compute(BufferView data, shardsim::core::Hash256* out) noexcept {
        if (out == nullptr){
            return shardsim::core::make_status(shardsim::core::StatusDomain::Storage, shardsim::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return shardsim::core::make_status(shardsim::core::StatusDomain::Storage, shardsim::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return shardsim::core::ok_status();
    }

    std::string hash_to_hex(const shardsim::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.resize(h.b.size() * 2);
        for (size_t i = 0; i < h.b.size(); ++i) {
            out[i * 2] = hex[(h.b[i] >> 4) & 0xF];
            out[i * 2 + 1] = hex[h.b[i] & 0xF];
        }
        return out;
    }

    bool hash_from_hex(std::string_view hex, shardsim::core::Hash256* out) noexcept {
        if (out == nullptr || hex.size() != out->b.size() * 2) {
            return false;
        }
        shardsim::core::Hash256 h{};
        for (size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }

    shardsim::core::Status hash_shards(const shardsim::erasure::ShardSet& shards,
                                       bool parallel,
                                       std::vector<ShardDigest>* out) noexcept {
        if (out == nullptr) {
            return shardsim::core::make_status(shardsim::core::StatusDomain::Storage, shardsim::core::StatusCode::Invalid);
        }
        if (shards.shards.size() != shards.total()) {
            return shardsim::core::make_status(shardsim::core::StatusDomain::Storage, shardsim::core::StatusCode::Invalid);
        }

        out->clear();
        out->resize(shards.shards.size());

        if (!parallel) {
            for (size_t i = 0; i < shards.shards.size(); ++i) {
                const shardsim::core::Status s =
                    digest_one(shards.shards[i], static_cast<shardsim::core::ShardIndex>(i), &(*out)[i]);
                if (!shardsim::core::is_ok(s)) {
                    return s;
                }
            }
            return shardsim::core::ok_status();
        }

        // Each task owns one slot of out; the vector is not resized until wait() returns.
        shardsim::core::TaskGroup group;
        for (size_t i = 0; i < shards.shards.size(); ++i) {
            const std::vector<u8>* shard = &shards.shards[i];
            ShardDigest* slot = &(*out)[i];
            const auto index = static_cast<shardsim::core::ShardIndex>(i);
            group.spawn([shard, slot, index]() { return digest_one(*shard, index, slot); });
        }
        return group.wait();
    }
} // namespace shardsim::storage
