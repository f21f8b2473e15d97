#pragma once

#include <string>
#include <vector>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"

namespace shardsim::storage {
    using u32 = shardsim::core::u32;
    using u64 = shardsim::core::u64;

    constexpr const char* kShardFileName = "part.1";
    constexpr const char* kSidecarFileName = "xl.json";

    // Ordered pool of simulated volumes mounted under mount_root.
    struct DiskPool {
        std::string mount_root;
        std::vector<std::string> disks;
    };

    // /mnt with sde1 .. sdl1.
    [[nodiscard]] DiskPool default_disk_pool();

    // hex: reversed 16-digit lowercase hex of the encode timestamp.
    // prefix/suffix: the two directory levels under a shard's disk directory.
    struct ObjectSalt {
        std::string hex;
        std::string prefix;
        std::string suffix;
    };

    [[nodiscard]] ObjectSalt make_object_salt(u64 unix_nanos, shardsim::core::ObjectId object);

    struct PlacementEntry {
        shardsim::core::ShardIndex index{0};
        std::string disk;
        std::string dir;
        std::string shard_path;
        std::string sidecar_path;
    };

    // pool.disks[index % size]; nullptr for an empty pool. A plain modulo
    // rule, not a load-aware assignment.
    [[nodiscard]] const std::string* pick_volume(shardsim::core::ShardIndex index, const DiskPool& pool) noexcept;

    // <mount_root>/<disk>/disk<index+1>/<salt prefix>/<salt suffix>/{part.1,xl.json}
    shardsim::core::Status place_shard(shardsim::core::ShardIndex index,
                                       const ObjectSalt& salt,
                                       const DiskPool& pool,
                                       PlacementEntry* out) noexcept;

    shardsim::core::Status place_object(u32 total_shards,
                                        const ObjectSalt& salt,
                                        const DiskPool& pool,
                                        std::vector<PlacementEntry>* out) noexcept;

} // namespace shardsim::storage
