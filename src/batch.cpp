#include <jsondelta-cpp/batch.hpp>

#include "executor.hpp"

#include <easylogging++.h>

#include <optional>
#include <string>
#include <utility>

namespace jsondelta_cpp {

namespace {

// Slots start empty so Result<T> needs no default constructor.
template <typename T>
auto unwrap_slots(std::vector<std::optional<Result<T>>>& slots) -> std::vector<Result<T>> {
    auto results = std::vector<Result<T>>{};
    results.reserve(slots.size());
    for (auto& slot : slots) results.push_back(std::move(*slot));
    return results;
}

auto count_failures(const std::vector<Result<std::string>>& results) -> std::size_t {
    auto failures = std::size_t{0};
    for (const auto& r : results) {
        if (!r.ok()) ++failures;
    }
    return failures;
}

}  // namespace

BatchDriver::BatchDriver(BatchOptions options, std::shared_ptr<Caches> caches)
    : options_{options}, caches_{std::move(caches)} {
    if (!caches_) caches_ = std::make_shared<Caches>();
}

auto BatchDriver::diff_all(std::span<const DiffJob> jobs, Strategy strategy) const
    -> std::vector<Result<std::string>> {
    LOG(INFO) << "batch " << std::string{to_string_view(strategy)} << " diff of "
              << jobs.size() << " document pairs";

    auto slots = std::vector<std::optional<Result<std::string>>>(jobs.size());
    auto* caches = caches_.get();
    detail::parallel_for(jobs.size(), options_.concurrency, [&](std::size_t i) {
        const auto& job = jobs[i];
        slots[i].emplace(diff(strategy, job.old_text, job.new_text, job.options, caches));
    });

    auto results = unwrap_slots(slots);
    LOG(DEBUG) << "batch diff finished, " << count_failures(results) << " failed";
    return results;
}

auto BatchDriver::expand_all(std::span<const std::string> documents) const
    -> std::vector<Result<std::string>> {
    LOG(INFO) << "batch expansion of " << documents.size() << " documents";

    auto slots = std::vector<std::optional<Result<std::string>>>(documents.size());
    auto* caches = caches_.get();
    detail::parallel_for(documents.size(), options_.concurrency, [&](std::size_t i) {
        slots[i].emplace(expand_text(documents[i], caches));
    });

    auto results = unwrap_slots(slots);
    LOG(DEBUG) << "batch expansion finished, " << count_failures(results) << " failed";
    return results;
}

}  // namespace jsondelta_cpp
