#include <benchmark/benchmark.h>

#include "rarity/parse/fields.hpp"

static void BM_ParseRank(benchmark::State& state) {
    for (auto _ : state) {
        rarity::parse::RankInfo r = rarity::parse::parse_rank("  Rank 1234 / 10000  ");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ParseRank);

static void BM_ParseRankMiss(benchmark::State& state) {
    for (auto _ : state) {
        rarity::parse::RankInfo r = rarity::parse::parse_rank("not ranked yet");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_ParseRankMiss);

static void BM_ParseRarityScore(benchmark::State& state) {
    for (auto _ : state) {
        double v = rarity::parse::parse_rarity_score("Rarity Score: 87.42");
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ParseRarityScore);

static void BM_ParseTraitEntry(benchmark::State& state) {
    for (auto _ : state) {
        rarity::parse::TraitEntry e = rarity::parse::parse_trait_entry("Background Color: Light Blue");
        benchmark::DoNotOptimize(e);
    }
}
BENCHMARK(BM_ParseTraitEntry);

static void BM_ParsePercentage(benchmark::State& state) {
    for (auto _ : state) {
        double v = 0.0;
        rarity::core::Status s = rarity::parse::parse_percentage(" 3.5% ", &v);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ParsePercentage);
