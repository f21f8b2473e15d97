#include "shardsim/pipeline/harness.hpp"

#include <atomic>
#include <chrono>
#include <new>
#include <system_error>
#include <thread>
#include <vector>

namespace shardsim::pipeline {

using namespace shardsim::core;

namespace {
    struct WorkerState {
        Status status{};
        u64 objects{0};
        u64 bytes_encoded{0};
        u64 shards_verified{0};
        shardsim::storage::WriteStats writes{};
    };

    void run_worker(const RunConfig& cfg,
                    const ObjectEncoder& encode,
                    u32 worker,
                    u32 count,
                    std::atomic<bool>* stop,
                    WorkerState* state) noexcept {
        ObjectResult result;
        for (u32 run = 0; run < count; ++run) {
            if (stop->load(std::memory_order_acquire)) {
                return;
            }

            ObjectRequest req;
            req.id = ObjectId{worker, run};
            req.unix_nanos = wall_clock_nanos();

            const Status s = encode(cfg, req, &result);
            if (!is_ok(s)) {
                state->status = s;
                stop->store(true, std::memory_order_release);
                return;
            }
            state->objects += 1;
            state->bytes_encoded += result.object_bytes;
            state->shards_verified += result.verified_shards;
            state->writes += result.writes;
        }
    }
} // namespace

double objects_per_second(const HarnessReport& report) noexcept {
    if (report.elapsed_ns == 0) {
        return 0.0;
    }
    const double seconds = static_cast<double>(report.elapsed_ns) / 1e9;
    return static_cast<double>(report.objects) / seconds;
}

Status run_harness(const RunConfig& cfg, HarnessReport* out) noexcept {
    return run_harness_with(cfg, encode_object, out);
}

Status run_harness_with(const RunConfig& cfg, const ObjectEncoder& encode, HarnessReport* out) noexcept {
    if (out == nullptr || !encode) {
        return make_status(StatusDomain::Pipeline, StatusCode::Invalid);
    }
    *out = HarnessReport{};

    Status s = validate_run_config(cfg);
    if (!is_ok(s)) {
        return s;
    }

    const u32 per_worker = objects_per_worker(cfg.runs, cfg.workers);
    out->workers = cfg.workers;
    out->objects_per_worker = per_worker;

    std::vector<WorkerState> states;
    std::vector<std::thread> threads;
    try {
        states.resize(cfg.workers);
        threads.reserve(cfg.workers);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Pipeline, StatusCode::Unavailable, cfg.workers);
    }

    std::atomic<bool> stop{false};
    const auto start = std::chrono::steady_clock::now();

    Status spawn_status = ok_status();
    for (u32 w = 0; w < cfg.workers; ++w) {
        WorkerState* state = &states[w];
        try {
            threads.emplace_back([&cfg, &encode, &stop, w, per_worker, state]() {
                run_worker(cfg, encode, w, per_worker, &stop, state);
            });
        } catch (const std::system_error& e) {
            spawn_status = make_status(StatusDomain::Pipeline, StatusCode::Unavailable,
                                       static_cast<u32>(e.code().value()));
            stop.store(true, std::memory_order_release);
            break;
        }
    }

    for (std::thread& t : threads) {
        t.join();
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    out->elapsed_ns = static_cast<u64>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());

    for (const WorkerState& state : states) {
        out->objects += state.objects;
        out->bytes_encoded += state.bytes_encoded;
        out->shards_verified += state.shards_verified;
        out->writes += state.writes;
    }

    if (!is_ok(spawn_status)) {
        return spawn_status;
    }
    for (const WorkerState& state : states) {
        if (!is_ok(state.status)) {
            return state.status;
        }
    }
    return ok_status();
}

} // namespace shardsim::pipeline
