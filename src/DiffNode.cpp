/**
 * @file DiffNode.cpp
 * @brief Diff node builders, validation and statistics
 */

#include "ndiff/DiffNode.hpp"
#include "ndiff/Errors.hpp"

#include <cstdint>
#include <limits>
#include <cstring>

namespace ndiff {

namespace {

bool is_known_key(const std::string& k) {
    return k.size() == 1 && std::strchr("UARNODI", k[0]) != nullptr;
}

void validate_node(const Value& node, const std::string& path, bool sequence_item) {
    if (!node.is_object()) {
        throw InvalidDiffStructure(path, "expected mapping, got " + type_name(node));
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!is_known_key(it.key())) {
            throw InvalidDiffStructure(path, "unknown key '" + it.key() + "'");
        }
    }

    if (node.contains(key::I)) {
        if (!sequence_item) {
            throw InvalidDiffStructure(path, "'I' outside of a sequence diff");
        }
        const auto& idx = node[key::I];
        if (!idx.is_number_integer() || (!idx.is_number_unsigned() && idx.get<std::int64_t>() < 0)) {
            throw InvalidDiffStructure(path, "'I' must be a non-negative integer");
        }
        if (idx.is_number_unsigned() &&
            idx.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw InvalidDiffStructure(path, "'I' out of range");
        }
    }

    auto d = node.find(key::D);
    if (d == node.end()) return;

    if (d->is_object()) {
        for (auto it = d->begin(); it != d->end(); ++it) {
            validate_node(it.value(), pointer_append(path, it.key()), false);
        }
    } else if (d->is_array()) {
        for (std::size_t i = 0; i < d->size(); ++i) {
            validate_node((*d)[i], pointer_append(path, i), true);
        }
    } else {
        throw InvalidDiffStructure(path, "unsupported 'D' payload type " + type_name(*d));
    }
}

void count_into(DiffStats& stats, const Value& node) {
    if (!node.is_object()) return;

    if (node.contains(key::A)) ++stats.added;
    if (node.contains(key::R)) ++stats.removed;
    if (node.contains(key::N) || node.contains(key::O)) ++stats.changed;
    if (node.contains(key::U)) ++stats.unchanged;

    auto d = node.find(key::D);
    if (d == node.end() || !is_container(*d)) return;
    for (const auto& child : *d) {
        count_into(stats, child);
    }
}

} // anonymous namespace

Value make_node(const char* op, Value payload) {
    Value node = Value::object();
    node[op] = std::move(payload);
    return node;
}

void validate_diff(const Value& node) {
    validate_node(node, "", false);
}

DiffStats count_ops(const Value& node) {
    DiffStats stats;
    count_into(stats, node);
    return stats;
}

std::string pointer_append(const std::string& path, const std::string& token) {
    std::string out = path;
    out.reserve(path.size() + token.size() + 1);
    out += '/';
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string pointer_append(const std::string& path, std::size_t index) {
    return path + "/" + std::to_string(index);
}

} // namespace ndiff
