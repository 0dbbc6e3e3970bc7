// jsonrev-cpp benchmarks — measures throughput of core operations.

#include <jsonrev-cpp/jsonrev.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace jsonrev_cpp;

// A configuration document with `n` backends.
static auto make_config(std::int64_t n, std::int64_t generation) -> Value {
    auto backends = Array{};
    backends.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        backends.emplace_back(Object{
            {"host", "10.0." + std::to_string(i / 256) + "." + std::to_string(i % 256)},
            {"weight", (i + generation) % 5},
            {"enabled", i % 7 != 0},
        });
    }
    return Value{Object{
        {"name", "edge-gateway"},
        {"generation", generation},
        {"backends", std::move(backends)},
    }};
}

// =============================================================================
// Diff / patch
// =============================================================================

static void bm_diff(benchmark::State& state) {
    const auto before = make_config(state.range(0), 0);
    const auto after = make_config(state.range(0), 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(before, after));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff)->Range(8, 4096);

static void bm_diff_identical(benchmark::State& state) {
    const auto doc = make_config(state.range(0), 0);
    const auto copy = doc;
    for (auto _ : state) {
        benchmark::DoNotOptimize(diff(doc, copy));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_identical)->Range(8, 4096);

static void bm_apply(benchmark::State& state) {
    const auto before = make_config(state.range(0), 0);
    const auto edits = diff(before, make_config(state.range(0), 1));
    for (auto _ : state) {
        benchmark::DoNotOptimize(apply_edits(before, edits));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(edits.size()));
}
BENCHMARK(bm_apply)->Range(8, 4096);

// =============================================================================
// Text form and codec
// =============================================================================

static void bm_parse(benchmark::State& state) {
    const auto text = dump(make_config(state.range(0), 0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse(text));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse)->Range(8, 4096);

static void bm_encode_revision(benchmark::State& state) {
    auto rev = Revision{};
    rev.version = 1;
    rev.document = make_config(state.range(0), 0);
    for (auto _ : state) {
        benchmark::DoNotOptimize(encode_revision(rev));
    }
}
BENCHMARK(bm_encode_revision)->Range(8, 4096);

static void bm_decode_revision(benchmark::State& state) {
    auto rev = Revision{};
    rev.version = 1;
    rev.document = make_config(state.range(0), 0);
    const auto blob = encode_revision(rev);
    for (auto _ : state) {
        benchmark::DoNotOptimize(decode_revision(blob));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(blob.size()));
}
BENCHMARK(bm_decode_revision)->Range(8, 4096);

// =============================================================================
// Chain operations
// =============================================================================

static void bm_commit(benchmark::State& state) {
    auto chain = ChainManager{std::make_shared<MemoryRevisionStore>()};
    std::int64_t generation = 0;
    for (auto _ : state) {
        chain.commit("bench", make_config(64, generation++), "bench");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_commit);

// Reconstruct the newest version of a chain with `range(0)` edits-only
// revisions after its single snapshot.
static void bm_reconstruct_replay(benchmark::State& state) {
    auto options = ChainOptions{};
    options.mode = StorageMode::edits_only;
    auto chain = ChainManager{std::make_shared<MemoryRevisionStore>(), options};
    const auto versions = state.range(0);
    for (std::int64_t g = 0; g < versions; ++g) {
        chain.commit("bench", make_config(64, g), "bench");
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(chain.reconstruct("bench", static_cast<std::uint64_t>(versions)));
    }
}
BENCHMARK(bm_reconstruct_replay)->Range(8, 512);

static void bm_verify(benchmark::State& state) {
    auto options = ChainOptions{};
    options.mode = StorageMode::edits_only;
    options.snapshot_interval = 16;
    auto chain = ChainManager{std::make_shared<MemoryRevisionStore>(), options};
    for (std::int64_t g = 0; g < state.range(0); ++g) {
        chain.commit("bench", make_config(64, g), "bench");
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(chain.verify("bench"));
    }
}
BENCHMARK(bm_verify)->Range(16, 1024);
