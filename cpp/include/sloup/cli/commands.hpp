#pragma once

#include <type_traits>

#include "sloup/cli/options.hpp"
#include "sloup/core/errors.hpp"

namespace sloup::cli {
    using u32 = sloup::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Upload = 2,
        Plan = 3,
        Status = 4,
        Finalize = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 positional{0};  // required positional arguments after the options
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        const CommandSpec* spec{nullptr};
        CliArgs args{};
    };

    // Matches argv[0] against `specs`; the invocation's args are the rest.
    [[nodiscard]] sloup::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // The commands `sloup` understands, in help order.
    [[nodiscard]] const CommandSpec* command_table(u32* count) noexcept;

    // Options accepted by upload and plan.
    [[nodiscard]] const OptionSpec* upload_option_table(u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace sloup::cli
