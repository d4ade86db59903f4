/**
 * @file bench.cpp
 * @brief Performance benchmarks for .ppf decoding.
 *
 * Measures load and collect throughput on synthetic files for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/ppf-bench              # Run with default 100 iterations
 *   ./build/ppf-bench 1000         # Run with custom iteration count
 */

#include <ppf/ppf.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "fixture_writer.hpp"

using namespace ppf;

static constexpr int DEFAULT_ITERATIONS = 100;

static void bench_load(const char* name, std::size_t num_dumps, std::size_t num_zones,
                       int iterations) {
    std::vector<fixture::DumpRecipe> recipes;
    for (std::size_t i = 0; i < num_dumps; ++i) {
        fixture::DumpRecipe recipe = fixture::make_dump(static_cast<double>(i) * 1.0e-10,
                                                        static_cast<std::uint32_t>(i));
        recipe.bounds.max_zones = static_cast<std::uint32_t>(num_zones);
        recipe.ireg.assign(num_zones, 1);
        recipe.ireg.back() = 2;
        recipe.array_names = {"R", "RCM", "U", "PRES", "RHO", "TE"};
        recipes.push_back(recipe);
    }
    std::vector<std::uint8_t> input = fixture::make_file(recipes);

    DumpCollection collection;

    // Warmup run
    if (DumpCollection::load(input.data(), input.size(), collection) != Error::Ok ||
        collection.count() != num_dumps) {
        std::printf("%-20s FAIL (load)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        (void)DumpCollection::load(input.data(), input.size(), collection);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_dump_us = per_iter_us / static_cast<double>(num_dumps);
    double throughput_mbps = static_cast<double>(input.size()) / per_iter_us;

    std::printf("%-20s %10.2f us/iter  %8.2f us/dump  %8.1f MB/s  (%zu dumps)\n", name,
                per_iter_us, per_dump_us, throughput_mbps, num_dumps);
}

static void bench_collect(const char* name, std::size_t num_dumps, int iterations) {
    std::vector<std::uint8_t> input = fixture::make_series(num_dumps);

    DumpCollection collection;
    if (DumpCollection::load(input.data(), input.size(), collection) != Error::Ok) {
        std::printf("%-20s FAIL (load)\n", name);
        return;
    }

    Grid grid;

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        (void)collection.collect("PRES", grid);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_dump_us = per_iter_us / static_cast<double>(num_dumps);

    std::printf("%-20s %10.2f us/iter  %8.2f us/dump  %11s  (%zu dumps)\n", name, per_iter_us,
                per_dump_us, "-", num_dumps);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    // Decode warnings would dominate the timings
    logger()->set_level(spdlog::level::err);

    std::printf("ppf Benchmarks\n");
    std::printf("==============\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %15s  %11s  %s\n", "Test", "Time", "Per-Dump", "Throughput",
                "Dumps");
    std::printf("%-20s %16s  %15s  %11s  %s\n", "----", "----", "--------", "----------",
                "-----");

    std::printf("\nLoad:\n");
    bench_load("small", 10, 100, iterations);
    bench_load("long-run", 500, 100, iterations);
    bench_load("fine-mesh", 10, 10000, iterations);

    std::printf("\nCollect:\n");
    bench_collect("small", 10, iterations);
    bench_collect("long-run", 500, iterations);

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
