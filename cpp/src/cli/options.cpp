#include "shardsim/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace shardsim::cli {
    namespace {
        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] shardsim::core::Status cli_invalid(u32 aux = 0) noexcept {
            return shardsim::core::make_status(shardsim::core::StatusDomain::Cli, shardsim::core::StatusCode::Invalid, aux);
        }

        [[nodiscard]] shardsim::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out == nullptr) {
                return cli_invalid();
            }
            if (out->cap == 0 || out->data == nullptr) {
                return cli_invalid();
            }
            if (out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return shardsim::core::ok_status();
        }

        [[nodiscard]] bool convert_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            if (spec.type == OptionType::String) {
                opt->value.str = value;
                return true;
            }
            if (spec.type == OptionType::I64) {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return false;
                }
                opt->value.i64v = v;
                return true;
            }
            return false;
        }

        // Splits "name=value" into name_buf. Returns false when the name is empty or too long.
        [[nodiscard]] bool split_name(const char* tok, char* name_buf, size_t cap, const char** name, const char** value) noexcept {
            *name = tok;
            *value = nullptr;
            const char* eq = std::strchr(tok, '=');
            if (eq == nullptr) {
                return *tok != '\0';
            }
            const size_t name_len = static_cast<size_t>(eq - tok);
            if (name_len == 0 || name_len >= cap) {
                return false;
            }
            std::memcpy(name_buf, tok, name_len);
            name_buf[name_len] = '\0';
            *name = name_buf;
            *value = eq + 1;
            return true;
        }
    } // namespace

    shardsim::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            char name_buf[128]{};
            const char* name = nullptr;
            const char* value = nullptr;
            const OptionSpec* spec = nullptr;

            if (tok[1] == '-') {
                if (!split_name(tok + 2, name_buf, sizeof(name_buf), &name, &value)) {
                    return cli_invalid(i);
                }
                spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return cli_invalid(i);
                }
            } else if (tok[2] != '\0' && split_name(tok + 1, name_buf, sizeof(name_buf), &name, &value)) {
                spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    value = nullptr;
                }
            }

            ParsedOption opt{};
            if (spec != nullptr) {
                opt.id = spec->id;
                opt.type = spec->type;
                if (spec->type == OptionType::Flag) {
                    if (value != nullptr) {
                        return cli_invalid(i);
                    }
                    opt.value.boolv = 1;
                    ++i;
                } else if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid(i);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
            } else {
                const char short_name = tok[1];
                spec = find_short(specs, spec_count, short_name);
                if (spec == nullptr) {
                    return cli_invalid(i);
                }
                opt.id = spec->id;
                opt.type = spec->type;
                if (spec->type == OptionType::Flag) {
                    if (tok[2] != '\0') {
                        return cli_invalid(i);
                    }
                    opt.value.boolv = 1;
                    ++i;
                } else if (tok[2] != '\0') {
                    value = tok + 2;
                    ++i;
                } else {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid(i);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                }
            }

            if (spec->type != OptionType::Flag && !convert_value(*spec, value, &opt)) {
                return cli_invalid(i);
            }

            const shardsim::core::Status s = push_option(out, opt);
            if (!shardsim::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return shardsim::core::ok_status();
    }
} // namespace shardsim::cli
