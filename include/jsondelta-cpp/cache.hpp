/// @file cache.hpp
/// @brief Bounded, thread-safe memoization shared by the diff engines.
///
/// Caches only ever change the cost of a call, never its result. Each cache
/// holds one mutex, and the lock is held for a single lookup or insert.

#pragma once

#include <jsondelta-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace jsondelta_cpp {

/// A least-recently-used map with a fixed capacity.
///
/// Lookups return copies so no reference outlives the lock. A capacity of
/// zero disables the cache: inserts are dropped and lookups always miss.
template <typename Key, typename Val, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) : capacity_{capacity} {}

    LruCache(const LruCache&) = delete;
    auto operator=(const LruCache&) -> LruCache& = delete;

    /// Look up @p key and mark it most recently used.
    auto find(const Key& key) -> std::optional<Val> {
        auto lock = std::scoped_lock{mutex_};
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        ++hits_;
        return it->second->second;
    }

    /// Insert or refresh @p key. Returns true if an older entry was evicted.
    auto insert(const Key& key, Val value) -> bool {
        if (capacity_ == 0) return false;
        auto lock = std::scoped_lock{mutex_};
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return false;
        }

        auto evicted = false;
        if (index_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
            ++evictions_;
            evicted = true;
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
        return evicted;
    }

    void clear() {
        auto lock = std::scoped_lock{mutex_};
        index_.clear();
        entries_.clear();
    }

    auto size() const -> std::size_t {
        auto lock = std::scoped_lock{mutex_};
        return index_.size();
    }

    auto capacity() const noexcept -> std::size_t { return capacity_; }

    auto hits() const -> std::uint64_t {
        auto lock = std::scoped_lock{mutex_};
        return hits_;
    }

    auto misses() const -> std::uint64_t {
        auto lock = std::scoped_lock{mutex_};
        return misses_;
    }

    auto evictions() const -> std::uint64_t {
        auto lock = std::scoped_lock{mutex_};
        return evictions_;
    }

private:
    using Entry = std::pair<Key, Val>;

    std::size_t capacity_;
    std::list<Entry> entries_;  // most recently used first
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    mutable std::mutex mutex_;
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};
};

/// Memoized structural hashes of long string leaves, keyed by the string.
class HashCache {
public:
    /// Strings shorter than this are hashed directly.
    static constexpr std::size_t min_string_length = 64;
    static constexpr std::size_t default_capacity = 4096;

    explicit HashCache(std::size_t capacity = default_capacity) : entries_{capacity} {}

    auto find(const std::string& text) -> std::optional<std::uint64_t>;
    void insert(const std::string& text, std::uint64_t hash);

    void clear() { entries_.clear(); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto capacity() const noexcept -> std::size_t { return entries_.capacity(); }
    auto hits() const -> std::uint64_t { return entries_.hits(); }

private:
    LruCache<std::string, std::uint64_t> entries_;
};

/// Memoized derived documents (expansions, flattened contexts), keyed by a
/// kind prefix plus the canonical text of the input.
class PatternCache {
public:
    static constexpr std::size_t default_capacity = 500;

    explicit PatternCache(std::size_t capacity = default_capacity) : entries_{capacity} {}

    auto find(const std::string& key) -> std::optional<Value>;
    void insert(const std::string& key, Value value);

    void clear() { entries_.clear(); }
    auto size() const -> std::size_t { return entries_.size(); }
    auto capacity() const noexcept -> std::size_t { return entries_.capacity(); }
    auto hits() const -> std::uint64_t { return entries_.hits(); }

private:
    LruCache<std::string, Value> entries_;
};

/// The cache bundle passed explicitly into every engine entry point.
///
/// @code
/// auto caches = std::make_shared<Caches>();
/// auto delta = diff_structural(old_doc, new_doc, {}, caches.get());
/// @endcode
struct Caches {
    HashCache hashes;
    PatternCache patterns;

    Caches() = default;
    Caches(std::size_t hash_capacity, std::size_t pattern_capacity)
        : hashes{hash_capacity}, patterns{pattern_capacity} {}

    /// A bundle whose caches never retain anything.
    static auto disabled() -> std::unique_ptr<Caches> {
        return std::make_unique<Caches>(0, 0);
    }

    void clear() {
        hashes.clear();
        patterns.clear();
    }
};

/// Cache key for @p v under @p prefix, or nullopt when the value cannot be
/// serialized (invalid UTF-8), in which case callers skip the cache.
auto pattern_key(std::string_view prefix, const Value& v) -> std::optional<std::string>;

}  // namespace jsondelta_cpp
