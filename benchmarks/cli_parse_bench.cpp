#include <array>

#include <benchmark/benchmark.h>

#include "rarity/cli/commands.hpp"
#include "rarity/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<rarity::cli::OptionSpec, 4> specs = {{
        {rarity::cli::OptionId::Db, rarity::cli::OptionType::String, "db", 'd'},
        {rarity::cli::OptionId::Listen, rarity::cli::OptionType::String, "listen", 'l'},
        {rarity::cli::OptionId::Timeout, rarity::cli::OptionType::I64, "timeout", 't'},
        {rarity::cli::OptionId::Verbose, rarity::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--verbose", "--db", "cache.db", "--timeout=2500", "-l:8080", "--", "serve"};
    const rarity::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        rarity::cli::ParsedOption buf[8]{};
        rarity::cli::ParsedOptions out{buf, 0, 8};
        rarity::cli::u32 consumed = 0;
        const rarity::core::Status s = rarity::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<rarity::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<rarity::cli::CommandSpec, 4> specs = {{
        {rarity::cli::CommandId::Help, "help"},
        {rarity::cli::CommandId::Serve, "serve"},
        {rarity::cli::CommandId::Get, "get"},
        {rarity::cli::CommandId::Fingerprint, "fingerprint"},
    }};

    const char* argv[] = {"get", "cool-cats", "7"};
    const rarity::cli::CliArgs args{argv, 3};
    for (auto _ : state) {
        rarity::cli::CommandInvocation out{};
        rarity::cli::u32 consumed = 0;
        const rarity::core::Status s = rarity::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<rarity::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<rarity::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
