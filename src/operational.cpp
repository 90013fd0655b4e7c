#include <jsondelta-cpp/operational.hpp>
#include <jsondelta-cpp/json.hpp>

#include <easylogging++.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsondelta_cpp {

auto parse_op_type(std::string_view s) -> std::optional<OpType> {
    if (s == "set") return OpType::set;
    if (s == "delete") return OpType::remove;
    if (s == "insert") return OpType::insert;
    return std::nullopt;
}

// =============================================================================
// Diff
// =============================================================================

namespace {

class OperationEmitter {
public:
    OperationEmitter(std::string actor_id, std::uint64_t base_timestamp)
        : actor_id_{std::move(actor_id)}, next_timestamp_{base_timestamp} {}

    void diff(const Value& a, const Value& b, Path& path) {
        if (a == b) return;
        if (a.is_object() && b.is_object()) {
            diff_objects(*a.get_if<Object>(), *b.get_if<Object>(), path);
        } else if (a.is_array() && b.is_array()) {
            rewrite_array(*a.get_if<Array>(), *b.get_if<Array>(), path);
        } else {
            emit(OpType::set, path, b);
        }
    }

    auto take() -> std::vector<Operation> { return std::move(ops_); }

private:
    void diff_objects(const Object& a, const Object& b, Path& path) {
        auto old_it = a.begin();
        auto new_it = b.begin();
        // Both maps are key-ordered, so one merge pass visits the key union.
        while (old_it != a.end() || new_it != b.end()) {
            if (new_it == b.end() || (old_it != a.end() && old_it->first < new_it->first)) {
                path.emplace_back(old_it->first);
                emit(OpType::remove, path, Value{});
                path.pop_back();
                ++old_it;
            } else if (old_it == a.end() || new_it->first < old_it->first) {
                path.emplace_back(new_it->first);
                emit(OpType::set, path, new_it->second);
                path.pop_back();
                ++new_it;
            } else {
                path.emplace_back(old_it->first);
                diff(old_it->second, new_it->second, path);
                path.pop_back();
                ++old_it;
                ++new_it;
            }
        }
    }

    void rewrite_array(const Array& a, const Array& b, Path& path) {
        for (auto i = a.size(); i > 0; --i) {
            path.emplace_back(i - 1);
            emit(OpType::remove, path, Value{});
            path.pop_back();
        }
        for (std::size_t j = 0; j < b.size(); ++j) {
            path.emplace_back(j);
            emit(OpType::insert, path, b[j]);
            path.pop_back();
        }
    }

    void emit(OpType type, const Path& path, Value value) {
        ops_.push_back(Operation{type, path, std::move(value), next_timestamp_++, actor_id_});
    }

    std::string actor_id_;
    std::uint64_t next_timestamp_;
    std::vector<Operation> ops_;
};

auto timestamp_range(const std::vector<Operation>& ops, std::uint64_t fallback) -> TimestampRange {
    if (ops.empty()) return TimestampRange{fallback, fallback};
    auto [lo, hi] = std::minmax_element(ops.begin(), ops.end(),
        [](const Operation& x, const Operation& y) { return x.timestamp < y.timestamp; });
    return TimestampRange{lo->timestamp, hi->timestamp};
}

}  // namespace

auto diff_operational(const Value& old_doc, const Value& new_doc,
                      const OperationalOptions& options) -> OperationLog {
    auto actor = options.actor_id.empty() ? generate_actor_id() : options.actor_id;
    const auto base = options.timestamp.value_or(now_nanoseconds());

    auto emitter = OperationEmitter{actor, base};
    auto path = Path{};
    emitter.diff(old_doc, new_doc, path);

    auto log = OperationLog{};
    log.operations = emitter.take();
    log.metadata.actors.push_back(std::move(actor));
    log.metadata.timestamp_range = timestamp_range(log.operations, base);
    log.metadata.conflict_resolution = options.conflict_resolution;
    return log;
}

// =============================================================================
// Replay
// =============================================================================

namespace {

// Array positions may arrive as digit strings from hand-written logs.
auto array_index(const PathElement& element) -> std::optional<std::size_t> {
    if (const auto* index = std::get_if<std::size_t>(&element)) return *index;
    const auto& key = std::get<std::string>(element);
    if (key.empty()) return std::nullopt;
    auto value = std::size_t{0};
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), value);
    if (ec != std::errc{} || ptr != key.data() + key.size()) return std::nullopt;
    return value;
}

auto step(Value& current, const PathElement& element) -> Value* {
    if (auto* obj = current.get_if<Object>()) {
        const auto* key = std::get_if<std::string>(&element);
        if (!key) return nullptr;
        auto it = obj->find(*key);
        return it == obj->end() ? nullptr : &it->second;
    }
    if (auto* arr = current.get_if<Array>()) {
        auto index = array_index(element);
        if (!index || *index >= arr->size()) return nullptr;
        return &(*arr)[*index];
    }
    return nullptr;
}

/// The container holding the last path element, or nullptr.
auto resolve_parent(Value& document, const Path& path) -> Value* {
    auto* current = &document;
    for (std::size_t i = 0; current && i + 1 < path.size(); ++i) {
        current = step(*current, path[i]);
    }
    return current;
}

/// Apply one operation. Returns false when it addressed a missing location;
/// the document is then unchanged, except for an insert past the end of an
/// array, which appends.
auto apply_operation(Value& document, const Operation& op) -> bool {
    if (op.path.empty()) {
        document = op.type == OpType::remove ? Value{} : op.value;
        return true;
    }
    auto* parent = resolve_parent(document, op.path);
    if (!parent) return false;
    const auto& last = op.path.back();

    if (auto* obj = parent->get_if<Object>()) {
        const auto* key = std::get_if<std::string>(&last);
        if (!key) return false;
        if (op.type == OpType::remove) return obj->erase(*key) > 0;
        (*obj)[*key] = op.value;
        return true;
    }

    if (auto* arr = parent->get_if<Array>()) {
        auto index = array_index(last);
        if (!index) return false;
        switch (op.type) {
            case OpType::set:
                if (*index >= arr->size()) return false;
                (*arr)[*index] = op.value;
                return true;
            case OpType::remove:
                if (*index >= arr->size()) return false;
                arr->erase(arr->begin() + static_cast<std::ptrdiff_t>(*index));
                return true;
            case OpType::insert: {
                const auto at = std::min(*index, arr->size());
                arr->insert(arr->begin() + static_cast<std::ptrdiff_t>(at), op.value);
                return at == *index;
            }
        }
    }
    return false;
}

auto sorted_by_timestamp(const std::vector<Operation>& ops) -> std::vector<const Operation*> {
    auto order = std::vector<const Operation*>{};
    order.reserve(ops.size());
    for (const auto& op : ops) order.push_back(&op);
    std::stable_sort(order.begin(), order.end(),
        [](const Operation* x, const Operation* y) { return x->timestamp < y->timestamp; });
    return order;
}

}  // namespace

auto patch_operational(const Value& document, const OperationLog& log) -> Value {
    auto result = document;
    for (const auto* op : sorted_by_timestamp(log.operations)) {
        if (!apply_operation(result, *op)) {
            LOG(DEBUG) << "operation " << std::string{to_string_view(op->type)}
                       << " at timestamp " << op->timestamp << " addressed a missing location";
        }
    }
    return result;
}

auto validate_operational(const Value& document, const OperationLog& log) -> bool {
    auto replay = document;
    for (const auto* op : sorted_by_timestamp(log.operations)) {
        if (!apply_operation(replay, *op)) return false;
    }
    return true;
}

// =============================================================================
// Inverse
// =============================================================================

namespace {

// Reversed operations must replay in their new order, so they get fresh
// timestamps after the newest one in the log.
auto restamp(std::vector<Operation> ops, std::uint64_t after) -> std::vector<Operation> {
    auto next = after;
    for (auto& op : ops) op.timestamp = ++next;
    return ops;
}

auto newest_timestamp(const std::vector<Operation>& ops) -> std::uint64_t {
    auto newest = std::uint64_t{0};
    for (const auto& op : ops) newest = std::max(newest, op.timestamp);
    return newest;
}

auto inverse_log(const OperationLog& log, std::vector<Operation> undo) -> OperationLog {
    auto out = OperationLog{};
    out.operations = restamp(std::move(undo), newest_timestamp(log.operations));
    out.metadata = log.metadata;
    out.metadata.timestamp_range = timestamp_range(out.operations, log.metadata.timestamp_range.last);
    return out;
}

}  // namespace

auto inverse_operational(const OperationLog& log) -> OperationLog {
    auto undo = std::vector<Operation>{};
    undo.reserve(log.operations.size());
    for (auto it = log.operations.rbegin(); it != log.operations.rend(); ++it) {
        auto op = Operation{OpType::remove, it->path, Value{}, 0, it->actor_id};
        if (it->type == OpType::remove) op.type = OpType::set;
        undo.push_back(std::move(op));
    }
    return inverse_log(log, std::move(undo));
}

auto inverse_operational(const OperationLog& log, const Value& base) -> OperationLog {
    auto replay = base;
    auto undo = std::vector<Operation>{};

    for (const auto* op : sorted_by_timestamp(log.operations)) {
        auto restore = [&](OpType type, Path path, Value value) {
            undo.push_back(Operation{type, std::move(path), std::move(value), 0, op->actor_id});
        };

        if (op->path.empty()) {
            restore(OpType::set, {}, replay);
        } else if (auto* parent = resolve_parent(replay, op->path)) {
            const auto* prior = step(*parent, op->path.back());
            if (parent->is_object()) {
                if (prior) {
                    restore(OpType::set, op->path, *prior);
                } else if (op->type != OpType::remove && std::holds_alternative<std::string>(op->path.back())) {
                    restore(OpType::remove, op->path, Value{});
                }
            } else if (parent->is_array()) {
                if (op->type == OpType::set && prior) {
                    restore(OpType::set, op->path, *prior);
                } else if (op->type == OpType::remove && prior) {
                    restore(OpType::insert, op->path, *prior);
                } else if (op->type == OpType::insert) {
                    if (auto index = array_index(op->path.back())) {
                        auto path = op->path;
                        path.back() = std::min(*index, parent->size());
                        restore(OpType::remove, std::move(path), Value{});
                    }
                }
            }
        }
        apply_operation(replay, *op);
    }

    std::reverse(undo.begin(), undo.end());
    return inverse_log(log, std::move(undo));
}

// =============================================================================
// Merge
// =============================================================================

auto merge_operational(std::span<const OperationLog> logs,
                       std::optional<ConflictResolution> resolution) -> OperationLog {
    auto merged = OperationLog{};
    for (const auto& log : logs) {
        merged.operations.insert(merged.operations.end(), log.operations.begin(), log.operations.end());
        for (const auto& actor : log.metadata.actors) {
            auto& actors = merged.metadata.actors;
            if (std::find(actors.begin(), actors.end(), actor) == actors.end()) {
                actors.push_back(actor);
            }
        }
    }
    std::stable_sort(merged.operations.begin(), merged.operations.end(),
        [](const Operation& x, const Operation& y) { return x.timestamp < y.timestamp; });

    if (resolution) {
        merged.metadata.conflict_resolution = *resolution;
    } else if (!logs.empty()) {
        merged.metadata.conflict_resolution = logs.front().metadata.conflict_resolution;
    }
    merged.metadata.timestamp_range = timestamp_range(merged.operations, 0);
    return merged;
}

// =============================================================================
// Wire format
// =============================================================================

namespace {

auto path_to_json(const Path& path) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (const auto& element : path) {
        std::visit([&](const auto& e) { out.push_back(e); }, element);
    }
    return out;
}

auto path_from_json(const nlohmann::json& j) -> Path {
    auto path = Path{};
    for (const auto& element : j) {
        if (element.is_string()) {
            path.emplace_back(element.get<std::string>());
        } else if (element.is_number_unsigned() ||
                   (element.is_number_integer() && element.get<std::int64_t>() >= 0)) {
            path.emplace_back(element.get<std::size_t>());
        } else {
            throw std::invalid_argument{"path element must be a key or an index: " + element.dump()};
        }
    }
    return path;
}

}  // namespace

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(op.type)}},
        {"path", path_to_json(op.path)},
        {"value", op.value},
        {"timestamp", op.timestamp},
        {"actor_id", op.actor_id},
    };
}

void from_json(const nlohmann::json& j, Operation& op) {
    const auto type_name = j.at("type").get<std::string>();
    auto type = parse_op_type(type_name);
    if (!type) throw std::invalid_argument{"unknown operation type: " + type_name};

    op = Operation{};
    op.type = *type;
    if (auto it = j.find("path"); it != j.end()) op.path = path_from_json(*it);
    if (auto it = j.find("value"); it != j.end()) op.value = it->get<Value>();
    op.timestamp = j.value("timestamp", std::uint64_t{0});
    op.actor_id = j.value("actor_id", std::string{});
}

void to_json(nlohmann::json& j, const OperationLog& log) {
    const auto& meta = log.metadata;
    j = nlohmann::json{
        {"operations", log.operations},
        {"metadata", {
            {"actors", meta.actors},
            {"timestamp_range", {meta.timestamp_range.first, meta.timestamp_range.last}},
            {"conflict_resolution", std::string{to_string_view(meta.conflict_resolution)}},
        }},
    };
}

void from_json(const nlohmann::json& j, OperationLog& log) {
    log = OperationLog{};
    if (!j.is_object() || !j.contains("operations") || !j["operations"].is_array()) {
        throw std::invalid_argument{"operation log needs an \"operations\" array"};
    }
    for (const auto& entry : j["operations"]) {
        try {
            log.operations.push_back(entry.get<Operation>());
        } catch (const std::invalid_argument& e) {
            LOG(DEBUG) << "skipping operation: " << e.what();
        }
    }

    const auto meta = j.value("metadata", nlohmann::json::object());
    if (auto it = meta.find("actors"); it != meta.end()) {
        log.metadata.actors = it->get<std::vector<std::string>>();
    } else {
        for (const auto& op : log.operations) {
            auto& actors = log.metadata.actors;
            if (std::find(actors.begin(), actors.end(), op.actor_id) == actors.end()) {
                actors.push_back(op.actor_id);
            }
        }
    }
    if (auto it = meta.find("timestamp_range"); it != meta.end() && it->is_array() && it->size() == 2) {
        log.metadata.timestamp_range = TimestampRange{(*it)[0].get<std::uint64_t>(),
                                                      (*it)[1].get<std::uint64_t>()};
    } else {
        log.metadata.timestamp_range = timestamp_range(log.operations, 0);
    }
    if (auto it = meta.find("conflict_resolution"); it != meta.end() && it->is_string()) {
        if (auto parsed = parse_conflict_resolution(it->get<std::string>())) {
            log.metadata.conflict_resolution = *parsed;
        }
    }
}

}  // namespace jsondelta_cpp
