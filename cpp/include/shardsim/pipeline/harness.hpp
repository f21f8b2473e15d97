#pragma once

#include <functional>

#include "shardsim/core/errors.hpp"
#include "shardsim/pipeline/config.hpp"
#include "shardsim/pipeline/pipeline.hpp"
#include "shardsim/storage/shard_io.hpp"

namespace shardsim::pipeline {

    struct HarnessReport {
        u32 workers{0};
        // runs / workers; the remainder is dropped, not redistributed.
        u32 objects_per_worker{0};
        u64 objects{0};
        u64 elapsed_ns{0};
        u64 bytes_encoded{0};
        u64 shards_verified{0};
        shardsim::storage::WriteStats writes{};
    };

    using ObjectEncoder = std::function<shardsim::core::Status(const RunConfig&, const ObjectRequest&, ObjectResult*)>;

    [[nodiscard]] constexpr u32 objects_per_worker(u32 runs, u32 workers) noexcept {
        return workers == 0 ? 0 : runs / workers;
    }

    // 0 when no time elapsed.
    [[nodiscard]] double objects_per_second(const HarnessReport& report) noexcept;

    // Starts cfg.workers threads, each encoding its share sequentially, then
    // joins them all. The first failure stops every worker before its next
    // object; the status of the lowest-numbered failed worker is returned.
    [[nodiscard]] shardsim::core::Status run_harness(const RunConfig& cfg, HarnessReport* out) noexcept;

    // run_harness with encode in place of encode_object.
    [[nodiscard]] shardsim::core::Status run_harness_with(const RunConfig& cfg,
                                                          const ObjectEncoder& encode,
                                                          HarnessReport* out) noexcept;

} // namespace shardsim::pipeline
