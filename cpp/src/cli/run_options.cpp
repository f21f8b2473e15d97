#include "shardsim/cli/run_options.hpp"

#include <cstdint>
#include <cstdio>

namespace shardsim::cli {

using shardsim::core::Status;
using shardsim::core::StatusCode;
using shardsim::core::StatusDomain;

namespace {
    constexpr u32 kMaxParsedOptions = 64;

    const OptionSpec g_run_options[] = {
        {OptionId::Data, OptionType::I64, "data", 'd'},
        {OptionId::Parity, OptionType::I64, "parity", 'p'},
        {OptionId::Parity, OptionType::I64, "par", '\0'},
        {OptionId::Out, OptionType::String, "out", 'o'},
        {OptionId::Workers, OptionType::I64, "workers", 'w'},
        {OptionId::Runs, OptionType::I64, "runs", 'r'},
        {OptionId::NoDisk, OptionType::Flag, "nodisk", 'n'},
        {OptionId::Verify, OptionType::Flag, "verify", '\0'},
        {OptionId::Fanout, OptionType::Flag, "fanout", '\0'},
        {OptionId::Sync, OptionType::Flag, "sync", '\0'},
        {OptionId::BlockSize, OptionType::I64, "block-size", '\0'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };

    [[nodiscard]] Status cli_invalid(OptionId id) noexcept {
        return shardsim::core::make_status(StatusDomain::Cli, StatusCode::Invalid, static_cast<u32>(id));
    }

    // Out-of-range shard counts saturate so codec_validate_params still rejects them.
    [[nodiscard]] shardsim::core::i32 clamp_shard_count(i64 v) noexcept {
        if (v > INT32_MAX) return INT32_MAX;
        if (v < INT32_MIN) return INT32_MIN;
        return static_cast<shardsim::core::i32>(v);
    }
} // namespace

const OptionSpec* run_option_specs(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(g_run_options) / sizeof(g_run_options[0]));
    }
    return g_run_options;
}

Status parse_run_invocation(const CliArgs& args, RunInvocation* out) noexcept {
    if (out == nullptr) {
        return shardsim::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    *out = RunInvocation{};
    shardsim::pipeline::RunConfig& cfg = out->config;

    u32 spec_count = 0;
    const OptionSpec* specs = run_option_specs(&spec_count);

    ParsedOption buf[kMaxParsedOptions]{};
    ParsedOptions parsed{buf, 0, kMaxParsedOptions};
    u32 consumed = 0;
    Status s = parse_options(args, specs, spec_count, &parsed, &consumed);
    if (!shardsim::core::is_ok(s)) {
        return s;
    }

    for (u32 i = 0; i < parsed.len; ++i) {
        const ParsedOption& opt = parsed.data[i];
        switch (opt.id) {
            case OptionId::Data:
                cfg.codec.data = clamp_shard_count(opt.value.i64v);
                break;
            case OptionId::Parity:
                cfg.codec.parity = clamp_shard_count(opt.value.i64v);
                break;
            case OptionId::Out:
                if (opt.value.str == nullptr || opt.value.str[0] == '\0') {
                    return cli_invalid(opt.id);
                }
                cfg.pool.mount_root = opt.value.str;
                break;
            case OptionId::Workers:
                if (opt.value.i64v < 1 || opt.value.i64v > shardsim::pipeline::kMaxWorkers) {
                    return cli_invalid(opt.id);
                }
                cfg.workers = static_cast<u32>(opt.value.i64v);
                break;
            case OptionId::Runs:
                if (opt.value.i64v < 0 || opt.value.i64v > UINT32_MAX) {
                    return cli_invalid(opt.id);
                }
                cfg.runs = static_cast<u32>(opt.value.i64v);
                break;
            case OptionId::NoDisk:
                cfg.skip_disk = true;
                break;
            case OptionId::Verify:
                cfg.verify = true;
                break;
            case OptionId::Fanout:
                cfg.shard_fanout = true;
                break;
            case OptionId::Sync:
                cfg.sync_writes = true;
                break;
            case OptionId::BlockSize:
                if (opt.value.i64v <= 0) {
                    return cli_invalid(opt.id);
                }
                cfg.block_size = static_cast<shardsim::core::u64>(opt.value.i64v);
                break;
            case OptionId::Help:
                out->help = true;
                break;
            case OptionId::None:
                return cli_invalid(opt.id);
        }
    }

    if (out->help) {
        return shardsim::core::ok_status();
    }

    s = shardsim::erasure::codec_validate_params(cfg.codec);
    if (!shardsim::core::is_ok(s)) {
        return s;
    }

    if (args.argc - consumed != 1) {
        return shardsim::core::make_status(StatusDomain::Cli, StatusCode::NotFound, args.argc - consumed);
    }
    cfg.input_path = args.argv[consumed];
    return shardsim::pipeline::validate_run_config(cfg);
}

int exit_code_for(Status s) noexcept {
    if (shardsim::core::is_ok(s)) {
        return kExitOk;
    }
    if (s.domain == StatusDomain::Cli || s.code == StatusCode::Invalid) {
        return kExitUsage;
    }
    return kExitFailure;
}

void print_usage(const char* program) noexcept {
    std::fprintf(stderr, "Usage of %s:\n", program != nullptr ? program : "shardsim");
    std::fprintf(stderr, "  shardsim [-flags] filename.ext\n\n");
    std::fprintf(stderr, "Valid flags:\n");
    std::fprintf(stderr, "  -d, --data N        number of data shards, 1..256 (default 4)\n");
    std::fprintf(stderr, "  -p, --parity N      number of parity shards (default 2)\n");
    std::fprintf(stderr, "  -o, --out DIR       alternative mount root for simulated disks (default /mnt)\n");
    std::fprintf(stderr, "  -w, --workers N     number of workers to run in parallel (default 1)\n");
    std::fprintf(stderr, "  -r, --runs N        total number of runs (default 1000)\n");
    std::fprintf(stderr, "  -n, --nodisk        disable writes to disk\n");
    std::fprintf(stderr, "      --verify        read back and verify every written shard\n");
    std::fprintf(stderr, "      --fanout        hash and write shards of one object concurrently\n");
    std::fprintf(stderr, "      --sync          fsync every shard and sidecar\n");
    std::fprintf(stderr, "      --block-size N  block size recorded in xl.json (default 10485760)\n");
    std::fprintf(stderr, "  -h, --help          show this help\n");
}

} // namespace shardsim::cli
