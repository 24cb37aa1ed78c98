#pragma once

#include <type_traits>

#include "rarity/cli/options.hpp"
#include "rarity/core/errors.hpp"

namespace rarity::cli {
    using u32 = rarity::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Serve = 2,
        Get = 3,
        Fingerprint = 4,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs; out->args receives the remaining tokens.
    rarity::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace rarity::cli
