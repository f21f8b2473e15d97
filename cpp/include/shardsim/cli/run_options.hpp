#pragma once

#include "shardsim/cli/options.hpp"
#include "shardsim/core/errors.hpp"
#include "shardsim/pipeline/config.hpp"

namespace shardsim::cli {

    constexpr int kExitOk = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitFailure = 2;

    // Flag table for the shardsim command line.
    [[nodiscard]] const OptionSpec* run_option_specs(u32* count) noexcept;

    struct RunInvocation {
        shardsim::pipeline::RunConfig config{};
        bool help{false};
    };

    // argv excludes the program name. Exactly one positional (the input file)
    // must follow the options unless --help is given. Flag problems are
    // Invalid/Cli; shard counts are checked by codec_validate_params and keep
    // the Erasure domain.
    [[nodiscard]] shardsim::core::Status parse_run_invocation(const CliArgs& args, RunInvocation* out) noexcept;

    // kExitUsage for a bad invocation (any Cli status or an Invalid value),
    // kExitFailure for anything that went wrong while running.
    [[nodiscard]] int exit_code_for(shardsim::core::Status s) noexcept;

    void print_usage(const char* program) noexcept;

} // namespace shardsim::cli
