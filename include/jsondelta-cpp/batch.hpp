/// @file batch.hpp
/// @brief Parallel diffing and expansion of many independent documents.

#pragma once

#include <jsondelta-cpp/api.hpp>
#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/error.hpp>
#include <jsondelta-cpp/options.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace jsondelta_cpp {

struct BatchOptions {
    /// Maximum number of concurrent chunks. 0 uses every worker of the
    /// shared executor; 1 runs on the calling thread.
    std::size_t concurrency{0};
};

/// One document pair to diff.
struct DiffJob {
    std::string old_text;
    std::string new_text;
    OptionMap options;
};

/// Fans independent diff and expand calls out over the shared Taskflow
/// executor.
///
/// Items share nothing but the cache bundle. Results come back in input
/// order, and a failing item only affects its own slot.
///
/// @code
/// auto driver = BatchDriver{BatchOptions{.concurrency = 4}};
/// auto jobs = std::vector<DiffJob>{{R"({"a":1})", R"({"a":2})", {}}};
/// auto results = driver.diff_all(jobs, Strategy::structural);
/// @endcode
class BatchDriver {
public:
    explicit BatchDriver(BatchOptions options = {},
                         std::shared_ptr<Caches> caches = std::make_shared<Caches>());

    auto diff_all(std::span<const DiffJob> jobs, Strategy strategy) const
        -> std::vector<Result<std::string>>;

    auto expand_all(std::span<const std::string> documents) const
        -> std::vector<Result<std::string>>;

    auto caches() const -> const std::shared_ptr<Caches>& { return caches_; }
    auto options() const -> const BatchOptions& { return options_; }

private:
    BatchOptions options_;
    std::shared_ptr<Caches> caches_;
};

}  // namespace jsondelta_cpp
