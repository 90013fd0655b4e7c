#include <jsondelta-cpp/hash.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace jsondelta_cpp {

namespace {

constexpr std::uint64_t fnv_offset = 14695981039346656037ULL;
constexpr std::uint64_t fnv_prime = 1099511628211ULL;

// One tag byte per value kind, mixed in first so that e.g. the string "1"
// and the integer 1 never share a hash.
enum class Tag : std::uint8_t {
    null = 0x01,
    boolean = 0x02,
    integer = 0x03,
    unsigned_integer = 0x04,
    real = 0x05,
    string = 0x06,
    array = 0x07,
    object = 0x08,
};

auto fnv_byte(std::uint64_t h, std::uint8_t b) -> std::uint64_t {
    h ^= b;
    h *= fnv_prime;
    return h;
}

auto fnv_u64(std::uint64_t h, std::uint64_t x) -> std::uint64_t {
    for (int i = 0; i < 8; ++i) {
        h = fnv_byte(h, static_cast<std::uint8_t>(x >> (i * 8)));
    }
    return h;
}

auto fnv_bytes(std::uint64_t h, const std::string& s) -> std::uint64_t {
    for (auto c : s) {
        h = fnv_byte(h, static_cast<std::uint8_t>(c));
    }
    return h;
}

auto start(Tag tag) -> std::uint64_t {
    return fnv_byte(fnv_offset, static_cast<std::uint8_t>(tag));
}

// splitmix64 finalizer
auto mix(std::uint64_t x) -> std::uint64_t {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

auto hash_string(const std::string& s) -> std::uint64_t {
    return fnv_bytes(fnv_u64(start(Tag::string), s.size()), s);
}

auto hash_string_cached(const std::string& s, HashCache* cache) -> std::uint64_t {
    if (!cache || s.size() < HashCache::min_string_length) {
        return hash_string(s);
    }
    if (auto hit = cache->find(s)) return *hit;
    auto h = hash_string(s);
    cache->insert(s, h);
    return h;
}

}  // namespace

auto structural_hash(const Value& v, HashCache* cache) -> std::uint64_t {
    return std::visit(overload{
        [](Null) { return start(Tag::null); },
        [](bool b) { return fnv_byte(start(Tag::boolean), b ? 1 : 0); },
        [](std::int64_t i) {
            return fnv_u64(start(Tag::integer), static_cast<std::uint64_t>(i));
        },
        [](std::uint64_t u) { return fnv_u64(start(Tag::unsigned_integer), u); },
        [](double d) {
            // -0.0 == 0.0, so both must hash alike
            if (d == 0.0) d = 0.0;
            return fnv_u64(start(Tag::real), std::bit_cast<std::uint64_t>(d));
        },
        [&](const std::string& s) { return hash_string_cached(s, cache); },
        [&](const Array& arr) {
            auto h = fnv_u64(start(Tag::array), arr.size());
            for (const auto& item : arr) {
                h = fnv_u64(h, structural_hash(item, cache));
            }
            return h;
        },
        [&](const Object& obj) {
            auto combined = std::uint64_t{0};
            for (const auto& [key, item] : obj) {
                combined += mix(hash_string(key) ^ mix(structural_hash(item, cache)));
            }
            return fnv_u64(fnv_u64(start(Tag::object), obj.size()), combined);
        },
    }, v.storage());
}

auto match_moved_elements(const Array& old_items, const Array& new_items, HashCache* cache)
    -> std::vector<std::optional<std::size_t>> {
    auto matches = std::vector<std::optional<std::size_t>>(new_items.size());
    auto consumed = std::vector<bool>(old_items.size(), false);

    auto old_hashes = std::vector<std::uint64_t>{};
    old_hashes.reserve(old_items.size());
    auto buckets = std::unordered_map<std::uint64_t, std::vector<std::size_t>>{};
    for (std::size_t i = 0; i < old_items.size(); ++i) {
        old_hashes.push_back(structural_hash(old_items[i], cache));
        buckets[old_hashes.back()].push_back(i);
    }

    auto new_hashes = std::vector<std::uint64_t>{};
    new_hashes.reserve(new_items.size());
    for (const auto& item : new_items) {
        new_hashes.push_back(structural_hash(item, cache));
    }

    // Elements that did not move keep their slot before anything is moved.
    for (std::size_t j = 0; j < new_items.size() && j < old_items.size(); ++j) {
        if (old_hashes[j] == new_hashes[j] && old_items[j] == new_items[j]) {
            matches[j] = j;
            consumed[j] = true;
        }
    }

    for (std::size_t j = 0; j < new_items.size(); ++j) {
        if (matches[j]) continue;
        auto bucket = buckets.find(new_hashes[j]);
        if (bucket == buckets.end()) continue;
        for (auto i : bucket->second) {
            if (!consumed[i] && old_items[i] == new_items[j]) {
                matches[j] = i;
                consumed[i] = true;
                break;
            }
        }
    }
    return matches;
}

}  // namespace jsondelta_cpp
