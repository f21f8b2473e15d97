#include <cstdio>
#include <cstdlib>
#include <string>

#include "shardsim/cli/options.hpp"
#include "shardsim/cli/run_options.hpp"
#include "shardsim/core/errors.hpp"
#include "shardsim/pipeline/harness.hpp"

// ========================================================================
// Output Helpers
// ========================================================================

void print_status_error(const char* context, shardsim::core::Status s) {
    const std::string what = shardsim::core::status_describe(s);
    fprintf(stderr, "error: %s failed: %s\n", context, what.c_str());
}

void print_invocation_error(shardsim::core::Status s) {
    using shardsim::core::StatusCode;
    using shardsim::core::StatusDomain;

    if (s.domain == StatusDomain::Cli && s.code == StatusCode::NotFound) {
        fprintf(stderr, "error: %s\n", s.aux == 0 ? "no input filename given" : "expected exactly one input filename");
        return;
    }
    if (s.domain == StatusDomain::Erasure) {
        fprintf(stderr, "error: invalid shard counts (data must be 1..256, parity must be >= 0)\n");
        return;
    }
    print_status_error("argument parsing", s);
}

// 850.123us, 12.345ms, 3.210s
std::string format_elapsed(shardsim::core::u64 ns) {
    char buf[64];
    if (ns < 1000000ull) {
        snprintf(buf, sizeof(buf), "%.3fus", static_cast<double>(ns) / 1e3);
    } else if (ns < 1000000000ull) {
        snprintf(buf, sizeof(buf), "%.3fms", static_cast<double>(ns) / 1e6);
    } else {
        snprintf(buf, sizeof(buf), "%.3fs", static_cast<double>(ns) / 1e9);
    }
    return std::string(buf);
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "shardsim";

    shardsim::cli::CliArgs args{};
    if (argc > 1) {
        args.argv = argv + 1;
        args.argc = static_cast<shardsim::core::u32>(argc - 1);
    }

    shardsim::cli::RunInvocation inv;
    shardsim::core::Status s = shardsim::cli::parse_run_invocation(args, &inv);
    if (!shardsim::core::is_ok(s)) {
        print_invocation_error(s);
        shardsim::cli::print_usage(program);
        return shardsim::cli::exit_code_for(s);
    }
    if (inv.help) {
        shardsim::cli::print_usage(program);
        return shardsim::cli::kExitOk;
    }

    const shardsim::pipeline::RunConfig& cfg = inv.config;
    printf("Number of worker routines:  %u\n", cfg.workers);
    if (cfg.runs % cfg.workers != 0) {
        printf("Dropping %u run(s) that do not divide evenly across workers\n", cfg.runs % cfg.workers);
    }

    shardsim::pipeline::HarnessReport report;
    s = shardsim::pipeline::run_harness(cfg, &report);
    if (!shardsim::core::is_ok(s)) {
        print_status_error("encode run", s);
        return shardsim::cli::exit_code_for(s);
    }

    printf("Total objects: %llu\n", static_cast<unsigned long long>(report.objects));
    printf("Elapsed time : %s\n", format_elapsed(report.elapsed_ns).c_str());
    printf("Speed        : %4.0f objs/sec\n", shardsim::pipeline::objects_per_second(report));
    if (!cfg.skip_disk) {
        printf("Written      : %llu files, %llu bytes\n",
               static_cast<unsigned long long>(report.writes.files),
               static_cast<unsigned long long>(report.writes.bytes));
    }
    if (cfg.verify) {
        printf("Verified     : %llu shards\n", static_cast<unsigned long long>(report.shards_verified));
    }

    return shardsim::cli::kExitOk;
}
