#include "rarity/cli/commands.hpp"

#include <cstring>

namespace rarity::cli {
    namespace {
        [[nodiscard]] rarity::core::Status invalid() noexcept {
            return rarity::core::make_status(rarity::core::StatusDomain::Cli, rarity::core::StatusCode::Invalid);
        }

        [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                    return &specs[i];
                }
            }
            return nullptr;
        }
    } // namespace

    rarity::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        // Options belong before the command name.
        const char* name = args.argv[0];
        if (name[0] == '-') {
            return invalid();
        }

        const CommandSpec* match = find_command(specs, spec_count, name);
        if (match == nullptr) {
            return invalid();
        }

        out->id = match->id;
        out->args = CliArgs{args.argv + 1, args.argc - 1};
        *consumed = 1;
        return rarity::core::ok_status();
    }
} // namespace rarity::cli
