// jsondelta-cpp benchmarks — throughput of the three delta engines.

#include <jsondelta-cpp/jsondelta.hpp>

#include <benchmark/benchmark.h>
#include <easylogging++.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

INITIALIZE_EASYLOGGINGPP

using namespace jsondelta_cpp;

namespace {

auto make_array(std::size_t n, std::size_t rotate) -> Value {
    auto arr = Array{};
    for (std::size_t i = 0; i < n; ++i) {
        arr.push_back(Value{static_cast<std::int64_t>((i + rotate) % n)});
    }
    return Value{std::move(arr)};
}

auto make_object(std::size_t n, std::int64_t salt) -> Value {
    auto obj = Object{};
    for (std::size_t i = 0; i < n; ++i) {
        obj.emplace("key" + std::to_string(i),
                    Value{static_cast<std::int64_t>(i) + (i % 10 == 0 ? salt : 0)});
    }
    return Value{std::move(obj)};
}

auto make_person(std::size_t n, const std::string& name) -> Value {
    auto obj = Object{};
    obj.emplace("@id", Value{"http://example.org/person"});
    obj.emplace("name", Value{name});
    auto knows = Array{};
    for (std::size_t i = 0; i < n; ++i) {
        auto friend_node = Object{};
        friend_node.emplace("name", Value{"friend " + std::to_string(i)});
        knows.push_back(Value{std::move(friend_node)});
    }
    obj.emplace("knows", Value{std::move(knows)});
    return Value{std::move(obj)};
}

struct QuietLogs {
    QuietLogs() { configure_logging(LogSettings{.level = LogLevel::off, .to_stdout = false, .file = {}}); }
};
const QuietLogs quiet_logs;

}  // namespace

// =============================================================================
// Structural
// =============================================================================

static void bm_structural_object(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = make_object(n, 0);
    const auto b = make_object(n, 1);
    for (auto _ : state) {
        auto delta = diff_structural(a, b);
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_structural_object)->Range(10, 10000);

static void bm_structural_array_moves(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = make_array(n, 0);
    const auto b = make_array(n, 3);
    for (auto _ : state) {
        auto delta = diff_structural(a, b);
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_structural_array_moves)->Range(10, 4096);

static void bm_structural_array_myers(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = make_array(n, 0);
    const auto b = make_array(n, 3);
    auto opts = StructuralOptions{};
    opts.include_moves = false;
    opts.array_diff = ArrayStrategy::myers;
    for (auto _ : state) {
        auto delta = diff_structural(a, b, opts);
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_structural_array_myers)->Range(10, 4096);

static void bm_structural_patch(benchmark::State& state) {
    const auto a = make_array(1000, 0);
    const auto b = make_array(1000, 3);
    const auto delta = diff_structural(a, b);
    for (auto _ : state) {
        auto patched = patch_structural(a, delta);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_structural_patch);

// Arg: 0 = no caches, 1 = shared cache bundle.
static void bm_structural_long_strings(benchmark::State& state) {
    auto a = Array{};
    auto b = Array{};
    for (int i = 0; i < 200; ++i) {
        a.push_back(Value{std::string(200, static_cast<char>('a' + i % 26)) + std::to_string(i)});
        b.push_back(Value{std::string(200, static_cast<char>('a' + i % 26)) + std::to_string(i)});
    }
    std::rotate(b.begin(), b.begin() + 5, b.end());
    const auto old_doc = Value{std::move(a)};
    const auto new_doc = Value{std::move(b)};

    auto caches = state.range(0) != 0 ? std::make_unique<Caches>() : nullptr;
    for (auto _ : state) {
        auto delta = diff_structural(old_doc, new_doc, {}, caches.get());
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(caches ? "cached" : "uncached");
}
BENCHMARK(bm_structural_long_strings)->Arg(0)->Arg(1);

static void bm_text_diff(benchmark::State& state) {
    auto a = std::string{};
    auto b = std::string{};
    for (int i = 0; i < 200; ++i) {
        a += "line " + std::to_string(i) + " of the original text\n";
        b += "line " + std::to_string(i) + (i % 17 == 0 ? " of the edited text\n" : " of the original text\n");
    }
    for (auto _ : state) {
        auto ops = diff_text(a, b);
        benchmark::DoNotOptimize(ops);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * a.size()));
}
BENCHMARK(bm_text_diff);

// =============================================================================
// Operational
// =============================================================================

static void bm_operational_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = make_object(n, 0);
    const auto b = make_object(n, 1);
    auto opts = OperationalOptions{};
    opts.actor_id = "bench";
    opts.timestamp = 1;
    for (auto _ : state) {
        auto log = diff_operational(a, b, opts);
        benchmark::DoNotOptimize(log);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_operational_diff)->Range(10, 10000);

static void bm_operational_replay(benchmark::State& state) {
    const auto a = make_object(1000, 0);
    const auto b = make_object(1000, 1);
    auto opts = OperationalOptions{};
    opts.actor_id = "bench";
    opts.timestamp = 1;
    const auto log = diff_operational(a, b, opts);
    for (auto _ : state) {
        auto replayed = patch_operational(a, log);
        benchmark::DoNotOptimize(replayed);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * log.operations.size()));
}
BENCHMARK(bm_operational_replay);

// =============================================================================
// Semantic
// =============================================================================

static void bm_semantic_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = make_person(n, "Ada");
    const auto b = make_person(n, "Ada Lovelace");
    for (auto _ : state) {
        auto delta = diff_semantic(a, b);
        benchmark::DoNotOptimize(delta);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_semantic_diff)->Range(8, 1024);

// =============================================================================
// Batch: 500 pairs, sequential vs parallel
//
// Arg: concurrency passed to BatchDriver (1 = calling thread, 0 = all workers).
// =============================================================================

static void bm_batch_diff(benchmark::State& state) {
    constexpr std::size_t pair_count = 500;
    auto jobs = std::vector<DiffJob>{};
    jobs.reserve(pair_count);
    for (std::size_t i = 0; i < pair_count; ++i) {
        jobs.push_back(DiffJob{
            to_json_text(make_object(50, static_cast<std::int64_t>(i))),
            to_json_text(make_object(50, static_cast<std::int64_t>(i) + 1)),
            {},
        });
    }
    const auto driver = BatchDriver{BatchOptions{.concurrency = static_cast<std::size_t>(state.range(0))}};
    for (auto _ : state) {
        auto results = driver.diff_all(jobs, Strategy::structural);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * pair_count);
    state.SetLabel(state.range(0) == 1 ? "sequential" : "parallel");
}
BENCHMARK(bm_batch_diff)->Arg(1)->Arg(0);

BENCHMARK_MAIN();
