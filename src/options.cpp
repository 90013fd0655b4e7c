#include <jsondelta-cpp/options.hpp>

#include <easylogging++.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace jsondelta_cpp {

namespace {

auto lookup(const OptionMap& map, std::string_view key) -> const std::string* {
    auto it = map.find(std::string{key});
    return it == map.end() ? nullptr : &it->second;
}

template <typename T, typename Parse>
void read_option(const OptionMap& map, std::string_view key, T& out, Parse parse) {
    const auto* raw = lookup(map, key);
    if (!raw) return;
    if (auto parsed = parse(*raw)) {
        out = *parsed;
    } else {
        LOG(DEBUG) << "ignoring malformed option " << std::string{key} << "=" << *raw;
    }
}

auto parse_size(std::string_view s) -> std::optional<std::size_t> {
    auto value = std::size_t{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

auto parse_u64(std::string_view s) -> std::optional<std::uint64_t> {
    auto value = std::uint64_t{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

}  // namespace

auto parse_array_strategy(std::string_view s) -> std::optional<ArrayStrategy> {
    if (s == "lcs") return ArrayStrategy::lcs;
    if (s == "simple") return ArrayStrategy::simple;
    if (s == "myers") return ArrayStrategy::myers;
    return std::nullopt;
}

auto parse_conflict_resolution(std::string_view s) -> std::optional<ConflictResolution> {
    if (s == "last_write_wins") return ConflictResolution::last_write_wins;
    if (s == "merge") return ConflictResolution::merge;
    return std::nullopt;
}

auto parse_blank_node_strategy(std::string_view s) -> std::optional<BlankNodeStrategy> {
    if (s == "hash") return BlankNodeStrategy::hash;
    if (s == "uuid") return BlankNodeStrategy::uuid;
    if (s == "preserve") return BlankNodeStrategy::preserve;
    return std::nullopt;
}

auto parse_bool(std::string_view s) -> std::optional<bool> {
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return std::nullopt;
}

auto StructuralOptions::from_map(const OptionMap& map) -> StructuralOptions {
    auto opts = StructuralOptions{};
    read_option(map, "include_moves", opts.include_moves, parse_bool);
    read_option(map, "array_diff", opts.array_diff, parse_array_strategy);
    read_option(map, "text_diff", opts.text_diff, parse_bool);
    read_option(map, "text_diff_threshold", opts.text_diff_threshold, parse_size);
    return opts;
}

auto OperationalOptions::from_map(const OptionMap& map) -> OperationalOptions {
    auto opts = OperationalOptions{};
    if (const auto* actor = lookup(map, "actor_id"); actor && !actor->empty()) {
        opts.actor_id = *actor;
    }
    if (const auto* raw = lookup(map, "timestamp")) {
        if (auto ts = parse_u64(*raw)) {
            opts.timestamp = *ts;
        } else {
            LOG(DEBUG) << "ignoring malformed option timestamp=" << *raw;
        }
    }
    read_option(map, "conflict_resolution", opts.conflict_resolution, parse_conflict_resolution);
    return opts;
}

auto SemanticOptions::from_map(const OptionMap& map) -> SemanticOptions {
    auto opts = SemanticOptions{};
    read_option(map, "normalize", opts.normalize, parse_bool);
    read_option(map, "context_aware", opts.context_aware, parse_bool);
    read_option(map, "expand_contexts", opts.expand_contexts, parse_bool);
    read_option(map, "blank_node_strategy", opts.blank_node_strategy, parse_blank_node_strategy);
    return opts;
}

auto generate_actor_id() -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    thread_local auto rng = std::mt19937_64{std::random_device{}()};
    auto bits = rng();
    auto id = std::string{"actor_"};
    for (int i = 15; i >= 0; --i) {
        id.push_back(hex_chars[(bits >> (i * 4)) & 0x0F]);
    }
    return id;
}

auto now_nanoseconds() -> std::uint64_t {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

}  // namespace jsondelta_cpp
