#include "shardsim/pipeline/pipeline.hpp"

#include <chrono>
#include <string>

#include "shardsim/core/task_group.hpp"
#include "shardsim/erasure/codec.hpp"

namespace shardsim::pipeline {

using namespace shardsim::core;
using shardsim::storage::BufferView;
using shardsim::storage::PlacementEntry;
using shardsim::storage::ShardDigest;
using shardsim::storage::WriteStats;

namespace {
    struct ShardWrite {
        const std::vector<shardsim::storage::u8>* shard{nullptr};
        const PlacementEntry* place{nullptr};
        const ShardDigest* digest{nullptr};
    };

    // Reads the sidecar back, then checks the shard file against the digest it records.
    Status verify_written_shard(const ShardWrite& w, u64 shard_bytes) noexcept {
        std::vector<shardsim::storage::u8> doc;
        Status s = shardsim::storage::read_file(w.place->sidecar_path, &doc);
        if (!is_ok(s)) {
            return s;
        }

        shardsim::meta::ObjectMetadata parsed;
        ShardIndex index = 0;
        s = shardsim::meta::metadata_from_json(
            std::string_view(reinterpret_cast<const char*>(doc.data()), doc.size()), &parsed, &index);
        if (!is_ok(s)) {
            return s;
        }
        if (index != w.place->index || index >= parsed.erasure.checksums.size()) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, w.place->index);
        }

        Hash256 recorded{};
        if (!shardsim::storage::hash_from_hex(parsed.erasure.checksums[index].hash, &recorded) ||
            recorded != w.digest->hash) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, w.place->index);
        }

        bool valid = false;
        s = shardsim::storage::verify_shard_file(w.place->shard_path, recorded, shard_bytes, &valid);
        if (!is_ok(s)) {
            return s;
        }
        if (!valid) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt, w.place->index);
        }
        return ok_status();
    }

    Status write_one_shard(const RunConfig& cfg,
                           const shardsim::meta::ObjectMetadata& record,
                           const ShardWrite& w,
                           u64 shard_bytes,
                           WriteStats* stats,
                           u32* verified) noexcept {
        Status s = shardsim::storage::create_directories(w.place->dir);
        if (!is_ok(s)) {
            return s;
        }

        s = shardsim::storage::write_file(w.place->shard_path, shardsim::storage::view_of(*w.shard), cfg.sync_writes, stats);
        if (!is_ok(s)) {
            return s;
        }

        std::string doc;
        s = shardsim::meta::metadata_to_json(record, w.place->index, &doc);
        if (!is_ok(s)) {
            return s;
        }
        s = shardsim::storage::write_file(
            w.place->sidecar_path,
            BufferView{reinterpret_cast<const shardsim::storage::u8*>(doc.data()), static_cast<u64>(doc.size())},
            cfg.sync_writes,
            stats);
        if (!is_ok(s)) {
            return s;
        }

        if (cfg.verify) {
            s = verify_written_shard(w, shard_bytes);
            if (!is_ok(s)) {
                return s;
            }
            *verified += 1;
        }
        return ok_status();
    }
} // namespace

Timestamp wall_clock_nanos() noexcept {
    using namespace std::chrono;
    return static_cast<Timestamp>(
        duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

Status encode_object(const RunConfig& cfg, const ObjectRequest& req, ObjectResult* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Pipeline, StatusCode::Invalid);
    }
    *out = ObjectResult{};

    shardsim::erasure::ErasureCodec codec;
    Status s = codec.init(cfg.codec);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<shardsim::storage::u8> object;
    shardsim::storage::FileInfo info{};
    s = shardsim::storage::read_object_file(cfg.input_path, &object, &info);
    if (!is_ok(s)) {
        return s;
    }

    shardsim::erasure::ShardSet shards;
    s = codec.encode_object(shardsim::storage::view_of(object), &shards);
    if (!is_ok(s)) {
        return s;
    }

    s = shardsim::storage::hash_shards(shards, cfg.shard_fanout, &out->digests);
    if (!is_ok(s)) {
        return s;
    }

    out->salt = shardsim::storage::make_object_salt(static_cast<u64>(req.unix_nanos), req.id);
    s = shardsim::storage::place_object(shards.total(), out->salt, cfg.pool, &out->placement);
    if (!is_ok(s)) {
        return s;
    }

    shardsim::meta::ComposeParams params;
    params.algorithm = codec.algorithm();
    params.data = codec.data_shards();
    params.parity = codec.parity_shards();
    params.block_size = cfg.block_size;
    params.shard_size = shards.shard_bytes;
    params.object_bytes = shards.object_bytes;
    params.mod_time = info.mod_time;
    s = shardsim::meta::md5_hex(shardsim::storage::view_of(object), &params.md5_sum);
    if (!is_ok(s)) {
        return s;
    }
    s = shardsim::meta::compose_metadata(params, out->digests, &out->metadata);
    if (!is_ok(s)) {
        return s;
    }

    out->object_bytes = shards.object_bytes;
    out->shard_bytes = shards.shard_bytes;
    out->shard_count = shards.total();

    if (cfg.skip_disk) {
        return ok_status();
    }

    const u32 total = shards.total();
    std::vector<ShardWrite> writes(total);
    for (u32 i = 0; i < total; ++i) {
        writes[i] = ShardWrite{&shards.shards[i], &out->placement[i], &out->digests[i]};
    }

    if (!cfg.shard_fanout) {
        for (u32 i = 0; i < total; ++i) {
            s = write_one_shard(cfg, out->metadata, writes[i], shards.shard_bytes, &out->writes, &out->verified_shards);
            if (!is_ok(s)) {
                return s;
            }
        }
        return ok_status();
    }

    // Per-shard counters; folded in after the join.
    std::vector<WriteStats> stats(total);
    std::vector<u32> verified(total, 0);
    TaskGroup group;
    for (u32 i = 0; i < total; ++i) {
        const ShardWrite* w = &writes[i];
        WriteStats* st = &stats[i];
        u32* v = &verified[i];
        const shardsim::meta::ObjectMetadata* record = &out->metadata;
        const u64 shard_bytes = shards.shard_bytes;
        group.spawn([&cfg, record, w, shard_bytes, st, v]() {
            return write_one_shard(cfg, *record, *w, shard_bytes, st, v);
        });
    }
    s = group.wait();

    for (u32 i = 0; i < total; ++i) {
        out->writes += stats[i];
        out->verified_shards += verified[i];
    }
    return s;
}

} // namespace shardsim::pipeline
