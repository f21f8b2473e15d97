#pragma once

#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/meta/metadata.hpp"
#include "shardsim/pipeline/config.hpp"
#include "shardsim/storage/hashing.hpp"
#include "shardsim/storage/placement.hpp"
#include "shardsim/storage/shard_io.hpp"

namespace shardsim::pipeline {

    struct ObjectRequest {
        shardsim::core::ObjectId id{};
        // Salt source; the harness passes the wall clock at encode time.
        shardsim::core::Timestamp unix_nanos{0};
    };

    struct ObjectResult {
        u64 object_bytes{0};
        u64 shard_bytes{0};
        u32 shard_count{0};
        shardsim::storage::ObjectSalt salt;
        std::vector<shardsim::storage::PlacementEntry> placement;
        std::vector<shardsim::storage::ShardDigest> digests;
        shardsim::meta::ObjectMetadata metadata;
        shardsim::storage::WriteStats writes;
        u32 verified_shards{0};
    };

    [[nodiscard]] shardsim::core::Timestamp wall_clock_nanos() noexcept;

    // read -> split -> encode -> hash -> place -> compose -> write (unless skip_disk).
    [[nodiscard]] shardsim::core::Status encode_object(const RunConfig& cfg,
                                                       const ObjectRequest& req,
                                                       ObjectResult* out) noexcept;

} // namespace shardsim::pipeline
