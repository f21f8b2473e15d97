#pragma once

#include <type_traits>

#include "shardsim/core/errors.hpp"
#include "shardsim/core/types.hpp"

namespace shardsim::cli {
    using u8 = shardsim::core::u8;
    using u32 = shardsim::core::u32;
    using i64 = shardsim::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Data = 1,
        Parity = 2,
        Out = 3,
        Workers = 4,
        Runs = 5,
        NoDisk = 6,
        Verify = 7,
        Fanout = 8,
        Sync = 9,
        BlockSize = 10,
        Help = 11,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options and stops at the first positional argument or "--".
    // Accepts --name, --name=value, -n, -nVALUE and the single-dash long form
    // -name (as in "-data 4"), which wins over a short option of the same letter.
    shardsim::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace shardsim::cli
