#include "rarity/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace rarity::cli {
    namespace {
        [[nodiscard]] rarity::core::Status invalid() noexcept {
            return rarity::core::make_status(rarity::core::StatusDomain::Cli, rarity::core::StatusCode::Invalid);
        }

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

        // Converts value according to spec->type and appends it.
        [[nodiscard]] rarity::core::Status push_value(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    if (value != nullptr) {
                        return invalid();
                    }
                    opt.value.boolv = 1;
                    break;
                case OptionType::String:
                    opt.value.str = value;
                    break;
                case OptionType::I64:
                    if (!parse_i64(value, &opt.value.i64v)) {
                        return invalid();
                    }
                    break;
                default:
                    return invalid();
            }

            out->data[out->len++] = opt;
            return rarity::core::ok_status();
        }
    } // namespace

    rarity::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec != nullptr && tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return invalid();
                    }
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }
            ++i;

            // Separate-token value: "--db path" / "-d path".
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return invalid();
                }
                value = args.argv[i++];
            }

            const rarity::core::Status s = push_value(out, *spec, value);
            if (!rarity::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return rarity::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace rarity::cli
