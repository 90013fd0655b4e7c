#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/json.hpp>

#include <easylogging++.h>

#include <string>
#include <utility>

namespace jsondelta_cpp {

auto HashCache::find(const std::string& text) -> std::optional<std::uint64_t> {
    return entries_.find(text);
}

void HashCache::insert(const std::string& text, std::uint64_t hash) {
    if (entries_.insert(text, hash)) {
        LOG(TRACE) << "hash cache evicted an entry (capacity " << entries_.capacity() << ")";
    }
}

auto PatternCache::find(const std::string& key) -> std::optional<Value> {
    return entries_.find(key);
}

void PatternCache::insert(const std::string& key, Value value) {
    if (entries_.insert(key, std::move(value))) {
        LOG(TRACE) << "pattern cache evicted an entry (capacity " << entries_.capacity() << ")";
    }
}

auto pattern_key(std::string_view prefix, const Value& v) -> std::optional<std::string> {
    try {
        auto key = std::string{prefix};
        key += ':';
        key += canonical_text(v);
        return key;
    } catch (const nlohmann::json::type_error& e) {
        LOG(DEBUG) << "value is not cacheable: " << e.what();
        return std::nullopt;
    }
}

}  // namespace jsondelta_cpp
