#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "bytecache.h"

using namespace bytecache;

#define BYTECACHE_BENCH(test)                                                                  \
    BENCHMARK_TEMPLATE(test, true)->ArgsProduct({{1, 1000, 10000, 100000}})->Complexity()->UseManualTime(); \
    BENCHMARK_TEMPLATE(test, false)->ArgsProduct({{1, 1000, 10000, 100000}})->Complexity()->UseManualTime()

template<bool ThreadSafe>
using BenchCache = MemCache<std::string, std::string, measurement::Size<std::string>, absl::Hash<std::string>, ThreadSafe>;

template<class C> std::unique_ptr<C> setup(size_t item_count)
{
    // Leave enough headroom for every item to stay in cache.
    auto cache = std::make_unique<C>(item_count * 1536 + 1536);

    for (size_t i = 0; i < item_count; ++i) {
        const std::string key = std::to_string(i);

        if (cache->insert(key, "some_value") != StoreResult::Stored) {
            std::cerr << "Benchmark setup failed: not enough space to insert" << std::endl;
            exit(1);
        }
    }

    return cache;
}

template<bool ThreadSafe> void cache_insert(benchmark::State& state)
{
    const size_t previous_insertions = state.range(0);
    auto         cache               = setup<BenchCache<ThreadSafe>>(previous_insertions);

    for (auto _ : state) {
        const std::string key = "key";

        const auto start  = std::chrono::high_resolution_clock::now();
        auto       result = cache->insert(key, "some cache value");
        const auto end    = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(result);

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(previous_insertions);
}

BYTECACHE_BENCH(cache_insert);

template<bool ThreadSafe> void cache_find(benchmark::State& state)
{
    const size_t previous_insertions = state.range(0);
    auto         cache               = setup<BenchCache<ThreadSafe>>(previous_insertions);

    for (auto _ : state) {
        const auto start = std::chrono::high_resolution_clock::now();
        auto       value = cache->find("0");
        benchmark::DoNotOptimize(value);
        const auto end = std::chrono::high_resolution_clock::now();

        const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
        state.SetIterationTime(elapsed_seconds.count());
    }

    state.SetComplexityN(previous_insertions);
}

BYTECACHE_BENCH(cache_find);

// Hits cycling over more keys than a generation holds, so that rotations and dig-outs are part of the measurement.
void history_hit(benchmark::State& state)
{
    const auto key_count = static_cast<uint64_t>(state.range(0));

    History<uint64_t> history{key_count / 4 + 1, 2};
    uint64_t          key = 0;

    for (auto _ : state) {
        history.hit(key, 1);
        key = (key + 1) % key_count;
    }

    state.SetComplexityN(state.range(0));
}

BENCHMARK(history_hit)->RangeMultiplier(10)->Range(10, 100000)->Complexity();
