#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/storage/buffer.hpp"
#include "shardsim/storage/hashing.hpp"

namespace shardsim::meta {
    using u32 = shardsim::core::u32;
    using u64 = shardsim::core::u64;

    constexpr const char* kMetadataVersion = "1.0.0";
    constexpr const char* kMetadataFormat = "xl";
    constexpr const char* kPartName = "part.1";
    constexpr u64 kDefaultBlockSize = 10 * 1024 * 1024;

    struct ChecksumEntry {
        std::string name;
        shardsim::core::ShardIndex index{0};
        std::string algorithm;
        std::string hash;
    };

    struct PartEntry {
        u32 number{1};
        std::string name;
        std::string etag;
        u64 size{0};
    };

    struct ErasureInfo {
        std::string algorithm;
        u32 data{0};
        u32 parity{0};
        u64 block_size{0};
        u64 shard_size{0};
        // Position -> shard index, 0-based.
        std::vector<u32> distribution;
        // One entry per shard, ordered by shard index.
        std::vector<ChecksumEntry> checksums;
    };

    // One record per object. Each shard's sidecar is this record serialized
    // with that shard's index.
    struct ObjectMetadata {
        std::string version;
        std::string format;
        u64 size{0};
        shardsim::core::Timestamp mod_time{0};
        ErasureInfo erasure;
        std::string md5_sum;
        std::vector<PartEntry> parts;
    };

    struct ComposeParams {
        const char* algorithm{nullptr};
        u32 data{0};
        u32 parity{0};
        u64 block_size{kDefaultBlockSize};
        u64 shard_size{0};
        u64 object_bytes{0};
        shardsim::core::Timestamp mod_time{0};
        std::string md5_sum;
    };

    // Fails with Invalid/Meta unless digests cover [0, data + parity) in order.
    shardsim::core::Status compose_metadata(const ComposeParams& params,
                                            const std::vector<shardsim::storage::ShardDigest>& digests,
                                            ObjectMetadata* out) noexcept;

    shardsim::core::Status metadata_to_json(const ObjectMetadata& record,
                                            shardsim::core::ShardIndex shard_index,
                                            std::string* out) noexcept;

    // Corrupt/Meta on malformed documents or missing fields.
    shardsim::core::Status metadata_from_json(std::string_view doc,
                                              ObjectMetadata* out,
                                              shardsim::core::ShardIndex* shard_index) noexcept;

    // RFC 3339, UTC, nanosecond precision: 2017-04-25T01:09:39.173066169Z
    [[nodiscard]] std::string format_mod_time(shardsim::core::Timestamp unix_nanos);
    [[nodiscard]] bool parse_mod_time(std::string_view text, shardsim::core::Timestamp* out) noexcept;

    shardsim::core::Status md5_hex(shardsim::storage::BufferView data, std::string* out) noexcept;

} // namespace shardsim::meta
