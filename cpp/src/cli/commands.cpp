#include "sloup/cli/commands.hpp"

#include <cstring>

namespace sloup::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Upload, "upload", 2, "upload [options] FILE CONTAINER"},
            {CommandId::Plan, "plan", 1, "plan [options] FILE [CONTAINER]"},
            {CommandId::Status, "status", 0, "status [TEMP_DIR]"},
            {CommandId::Finalize, "finalize", 0, "finalize [options] [TEMP_DIR]"},
            {CommandId::Help, "help", 0, "help"},
        };

        constexpr OptionSpec kUploadOptions[] = {
            {OptionId::SegmentSize, OptionType::I64, "segment-size", 's'},
            {OptionId::Concurrency, OptionType::I64, "concurrency", 'c'},
            {OptionId::MaxDiskSpace, OptionType::I64, "max-disk-space", 'd'},
            {OptionId::TempDir, OptionType::String, "temp-dir", 't'},
            {OptionId::MaxSegments, OptionType::I64, "max-segments", '\0'},
            {OptionId::ObjectName, OptionType::String, "object-name", 'o'},
            {OptionId::StorageUrl, OptionType::String, "storage-url", '\0'},
            {OptionId::AuthToken, OptionType::String, "auth-token", '\0'},
            {OptionId::Yes, OptionType::Flag, "yes", 'y'},
            {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
        };
    } // namespace

    sloup::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return sloup::core::make_status(sloup::core::StatusDomain::Cli, sloup::core::StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return sloup::core::make_status(sloup::core::StatusDomain::Cli, sloup::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return sloup::core::make_status(sloup::core::StatusDomain::Cli, sloup::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->spec = &s;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return sloup::core::ok_status();
            }
        }
        return sloup::core::make_status(sloup::core::StatusDomain::Cli, sloup::core::StatusCode::NotFound);
    }

    const CommandSpec* command_table(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }

    const OptionSpec* upload_option_table(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kUploadOptions) / sizeof(kUploadOptions[0]));
        }
        return kUploadOptions;
    }
} // namespace sloup::cli
