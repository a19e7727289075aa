#include <benchmark/benchmark.h>

#include "sloup/cli/commands.hpp"
#include "sloup/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    sloup::cli::u32 spec_count = 0;
    const sloup::cli::OptionSpec* specs = sloup::cli::upload_option_table(&spec_count);

    const char* argv[] = {"--verbose", "--segment-size", "64", "--temp-dir=/var/tmp", "-c8", "--", "file.iso"};
    const sloup::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        sloup::cli::ParsedOption buf[8]{};
        sloup::cli::ParsedOptions out{buf, 0, 8};
        sloup::cli::u32 consumed = 0;
        const sloup::core::Status s = sloup::cli::parse_options(args, specs, spec_count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<sloup::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    sloup::cli::u32 spec_count = 0;
    const sloup::cli::CommandSpec* specs = sloup::cli::command_table(&spec_count);

    const char* argv[] = {"finalize", "--yes", "/scratch"};
    const sloup::cli::CliArgs args{argv, 3};
    for (auto _ : state) {
        sloup::cli::CommandInvocation out{};
        sloup::cli::u32 consumed = 0;
        const sloup::core::Status s = sloup::cli::parse_command(args, specs, spec_count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<sloup::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<sloup::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
