#include "shardsim/storage/placement.hpp"

#include <algorithm>
#include <cstdio>

namespace shardsim::storage {

using namespace shardsim::core;

namespace {
    void join_path(std::string* out, const std::string& segment) {
        if (!out->empty() && out->back() != '/') {
            out->push_back('/');
        }
        out->append(segment);
    }
} // namespace

DiskPool default_disk_pool() {
    return DiskPool{"/mnt", {"sde1", "sdf1", "sdg1", "sdh1", "sdi1", "sdj1", "sdk1", "sdl1"}};
}

ObjectSalt make_object_salt(u64 unix_nanos, ObjectId object) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(unix_nanos));

    ObjectSalt salt;
    salt.hex = buf;
    std::reverse(salt.hex.begin(), salt.hex.end());
    salt.prefix = salt.hex.substr(0, 2);

    std::snprintf(buf, sizeof(buf), "-%u-%u", object.worker, object.run);
    salt.suffix = salt.hex.substr(2) + buf;
    return salt;
}

const std::string* pick_volume(ShardIndex index, const DiskPool& pool) noexcept {
    if (pool.disks.empty()) {
        return nullptr;
    }
    return &pool.disks[index % pool.disks.size()];
}

Status place_shard(ShardIndex index, const ObjectSalt& salt, const DiskPool& pool, PlacementEntry* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Placement, StatusCode::Invalid);
    }
    const std::string* disk = pick_volume(index, pool);
    if (disk == nullptr) {
        return make_status(StatusDomain::Placement, StatusCode::Invalid);
    }
    if (salt.prefix.empty() || salt.suffix.empty()) {
        return make_status(StatusDomain::Placement, StatusCode::Invalid);
    }

    char slot[32];
    std::snprintf(slot, sizeof(slot), "disk%u", index + 1);

    std::string dir = pool.mount_root;
    join_path(&dir, *disk);
    join_path(&dir, slot);
    join_path(&dir, salt.prefix);
    join_path(&dir, salt.suffix);

    out->index = index;
    out->disk = *disk;
    out->shard_path = dir + "/" + kShardFileName;
    out->sidecar_path = dir + "/" + kSidecarFileName;
    out->dir = std::move(dir);
    return ok_status();
}

Status place_object(u32 total_shards, const ObjectSalt& salt, const DiskPool& pool, std::vector<PlacementEntry>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Placement, StatusCode::Invalid);
    }
    out->clear();
    out->resize(total_shards);
    for (u32 i = 0; i < total_shards; ++i) {
        const Status s = place_shard(i, salt, pool, &(*out)[i]);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
    }
    return ok_status();
}

} // namespace shardsim::storage
