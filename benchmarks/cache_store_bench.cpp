#include <benchmark/benchmark.h>
#include "rarity/cache/cache_store.hpp"
#include <string>

using namespace rarity::cache;
using namespace rarity::core;

namespace {

Fingerprint make_bench_key(u64 counter) {
    Fingerprint k{};
    (void)fingerprint("bench", counter, &k);
    return k;
}

} // namespace

//=============================================================================
// Cache Store Benchmarks
//=============================================================================

static void BM_CacheOpenClose(benchmark::State& state) {
    for (auto _ : state) {
        CacheStore store;
        Status s = store.open(CacheConfig{});
        benchmark::DoNotOptimize(s);
        s = store.close();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_CacheOpenClose);

static void BM_CachePut(benchmark::State& state) {
    CacheStore store;
    (void)store.open(CacheConfig{});
    const std::string value(static_cast<size_t>(state.range(0)), 'x');

    u64 counter = 0;
    for (auto _ : state) {
        Status s = store.put(make_bench_key(counter++), value);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_CachePut)->Arg(256)->Arg(4096);

static void BM_CacheGetHit(benchmark::State& state) {
    CacheStore store;
    (void)store.open(CacheConfig{});
    const std::string value(1024, 'x');
    for (u64 i = 0; i < 1000; ++i) {
        (void)store.put(make_bench_key(i), value);
    }

    u64 counter = 0;
    for (auto _ : state) {
        std::string out;
        bool found = false;
        Status s = store.get(make_bench_key(counter++ % 1000), &out, &found);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_CacheGetHit);

static void BM_CacheGetMiss(benchmark::State& state) {
    CacheStore store;
    (void)store.open(CacheConfig{});
    (void)store.put(make_bench_key(0), "seed");

    u64 counter = 1;
    for (auto _ : state) {
        std::string out;
        bool found = false;
        Status s = store.get(make_bench_key(counter++), &out, &found);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(found);
    }
}
BENCHMARK(BM_CacheGetMiss);
