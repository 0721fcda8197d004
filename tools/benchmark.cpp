// Throughput benchmark for the transaction engine.
//
// Drives a nestkv::Engine directly (no console parsing) through:
//   (1) N SET+GET cycles with no transaction open,
//   (2) the same cycles inside D nested BEGIN blocks, then ROLLBACK of each
//       block one by one,
//   (3) the same cycles inside D nested BEGIN blocks, then a single COMMIT.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for the data operations, plus the wall time of the
// rollbacks and the commit.
//
// Usage: nestkv-benchmark [cycles] [depth]

#include "engine/engine.hpp"
#include "workload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
    double finish_ms{}; // rollback / commit wall time, 0 if none
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);
    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.3f µs\n"
        "  p50:          %.3f µs\n"
        "  p90:          %.3f µs\n"
        "  p99:          %.3f µs\n"
        "  p99.9:        %.3f µs\n"
        "  Finish:       %.3f ms\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us, r.finish_ms);
}

// One SET + one GET per cycle, timing each.
void run_cycles(nestkv::Engine& engine, std::size_t num_cycles, std::size_t layer,
                std::vector<int64_t>& latencies) {
    for (std::size_t i = 0; i < num_cycles; ++i) {
        std::string key = nestkv::bench::cycle_key(i);
        std::string val = nestkv::bench::cycle_value(i, layer);

        {
            auto t0 = clock::now();
            engine.set(key, val);
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }
        {
            auto t0 = clock::now();
            [[maybe_unused]] auto v = engine.get(key);
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }
    }
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_direct(std::size_t num_cycles) {
    nestkv::Engine engine;
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2);
    run_cycles(engine, num_cycles, 0, latencies);
    return compute_stats(latencies);
}

BenchResult bench_nested(std::size_t num_cycles, std::size_t depth, bool commit) {
    nestkv::Engine engine;
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2);

    // Spread the cycles evenly over the layers.  Every layer rewrites the same
    // keys with values that differ from the enclosing layer's, so each layer
    // holds one history entry per key for rollback to pop.
    const std::size_t per_layer = std::max<std::size_t>(1, num_cycles / depth);
    for (std::size_t d = 0; d < depth; ++d) {
        engine.begin();
        run_cycles(engine, per_layer, d, latencies);
    }

    auto t0 = clock::now();
    if (commit) {
        engine.commit();
    } else {
        while (engine.rollback()) {
        }
    }
    auto t1 = clock::now();

    auto r = compute_stats(latencies);
    r.finish_ms = static_cast<double>(std::chrono::duration_cast<ns>(t1 - t0).count()) / 1e6;
    return r;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_cycles = 100'000;
    if (argc > 1) {
        num_cycles = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_cycles == 0) num_cycles = 100'000;
    }

    std::size_t depth = 16;
    if (argc > 2) {
        depth = static_cast<std::size_t>(std::atol(argv[2]));
        if (depth == 0) depth = 16;
    }

    fprintf(stdout,
        "nestkv Engine Benchmark\n"
        "=======================\n"
        "Cycles:   %zu (each cycle = 1 SET + 1 GET = 2 ops)\n"
        "Depth:    %zu nested transactions\n",
        num_cycles, depth);

    auto direct_result   = bench_direct(num_cycles);
    auto rollback_result = bench_nested(num_cycles, depth, /*commit=*/false);
    auto commit_result   = bench_nested(num_cycles, depth, /*commit=*/true);

    print_result("No transaction", direct_result);
    print_result("Nested, then ROLLBACK each layer", rollback_result);
    print_result("Nested, then COMMIT", commit_result);

    fprintf(stdout, "\n");
    return 0;
}
