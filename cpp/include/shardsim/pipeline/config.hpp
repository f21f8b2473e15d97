#pragma once

#include <string>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"
#include "shardsim/erasure/codec.hpp"
#include "shardsim/meta/metadata.hpp"
#include "shardsim/storage/placement.hpp"

namespace shardsim::pipeline {
    using u32 = shardsim::core::u32;
    using u64 = shardsim::core::u64;

    // Upper bound on worker threads; each worker owns one thread for the whole run.
    constexpr u32 kMaxWorkers = 4096;

    // Built once at startup and shared read-only by every worker.
    struct RunConfig {
        std::string input_path;
        shardsim::erasure::CodecParams codec{};
        shardsim::storage::DiskPool pool{shardsim::storage::default_disk_pool()};
        u64 block_size{shardsim::meta::kDefaultBlockSize};
        u32 workers{1};
        u32 runs{1000};
        bool skip_disk{false};      // full pipeline, no filesystem writes
        bool verify{false};         // read back every written shard
        bool shard_fanout{false};   // hash and write shards concurrently
        bool sync_writes{false};
    };

    // Codec parameters are checked first so a bad shard count fails before any I/O.
    [[nodiscard]] shardsim::core::Status validate_run_config(const RunConfig& cfg) noexcept;

} // namespace shardsim::pipeline
