// batch_demo — many independent diffs over the shared Taskflow executor
//
// Builds a batch of document pairs, diffs them serially and in parallel
// with a shared cache bundle, and checks that both runs agree.
//
// Build: cmake --build build -DCMAKE_BUILD_TYPE=Release
// Run:   ./build/examples/batch_demo [pairs]

#include <jsondelta-cpp/jsondelta.hpp>

#include <easylogging++.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

INITIALIZE_EASYLOGGINGPP

namespace jd = jsondelta_cpp;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

static auto make_record(std::size_t id, std::size_t revision) -> std::string {
    auto items = std::string{"["};
    for (std::size_t i = 0; i < 50; ++i) {
        if (i > 0) items += ",";
        items += std::to_string((i + revision * 7) % 50);
    }
    items += "]";
    return R"({"id":)" + std::to_string(id) +
           R"(,"revision":)" + std::to_string(revision) +
           R"(,"summary":"record )" + std::to_string(id) +
           R"( describes a long running process that was revised )" + std::to_string(revision) +
           R"( times","items":)" + items + "}";
}

int main(int argc, char** argv) {
    jd::configure_logging(jd::LogSettings{.level = jd::LogLevel::info, .to_stdout = true, .file = {}});

    const auto pairs = argc > 1 ? static_cast<std::size_t>(std::strtoul(argv[1], nullptr, 10)) : 500;
    auto jobs = std::vector<jd::DiffJob>{};
    jobs.reserve(pairs);
    for (std::size_t i = 0; i < pairs; ++i) {
        jobs.push_back(jd::DiffJob{make_record(i, 1), make_record(i, 2), {}});
    }

    auto caches = std::make_shared<jd::Caches>();

    auto serial_timer = Timer{};
    const auto serial = jd::BatchDriver{jd::BatchOptions{.concurrency = 1}, caches}
                            .diff_all(jobs, jd::Strategy::structural);
    const auto serial_ms = serial_timer.ms();

    auto parallel_timer = Timer{};
    const auto parallel = jd::BatchDriver{jd::BatchOptions{.concurrency = 0}, caches}
                              .diff_all(jobs, jd::Strategy::structural);
    const auto parallel_ms = parallel_timer.ms();

    auto failures = std::size_t{0};
    for (const auto& r : parallel) {
        if (!r.ok()) ++failures;
    }

    std::printf("pairs:        %zu\n", pairs);
    std::printf("serial:       %.1f ms\n", serial_ms);
    std::printf("parallel:     %.1f ms\n", parallel_ms);
    std::printf("failures:     %zu\n", failures);
    std::printf("identical:    %s\n", serial == parallel ? "yes" : "no");
    std::printf("hash cache:   %zu entries, %llu hits\n", caches->hashes.size(),
                static_cast<unsigned long long>(caches->hashes.hits()));

    return serial == parallel && failures == 0 ? 0 : 1;
}
