/**
 * @file Patch.cpp
 * @brief Implementation of the patch applier
 */

#include "ndiff/Patch.hpp"
#include "ndiff/DiffNode.hpp"
#include "ndiff/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>

namespace ndiff {

namespace {

void apply(Value& target, const Value& node, const std::string& path);

void require_node(const Value& node, const std::string& path) {
    if (!node.is_object()) {
        throw InvalidDiffStructure(path, "diff node must be a mapping, got " + type_name(node));
    }
}

std::int64_t read_index(const Value& child, const std::string& path) {
    const auto& idx = child[key::I];
    if (idx.is_number_unsigned()) {
        const auto u = idx.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw InvalidDiffStructure(path, "'I' out of range: " + idx.dump());
        }
        return static_cast<std::int64_t>(u);
    }
    if (idx.is_number_integer() && idx.get<std::int64_t>() >= 0) {
        return idx.get<std::int64_t>();
    }
    throw InvalidDiffStructure(path, "'I' must be a non-negative integer, got " + idx.dump());
}

void patch_mapping(Value& target, const Value& children, const std::string& path) {
    if (!target.is_object()) {
        throw TargetMismatch(path, "expected mapping, got " + type_name(target));
    }

    for (auto it = children.begin(); it != children.end(); ++it) {
        const auto& k = it.key();
        const auto& child = it.value();
        const std::string child_path = pointer_append(path, k);
        require_node(child, child_path);

        if (child.contains(key::D) || child.contains(key::N)) {
            auto found = target.find(k);
            if (found == target.end()) {
                throw TargetMismatch(child_path, "key not found");
            }
            apply(*found, child, child_path);
        } else if (child.contains(key::A)) {
            target[k] = child[key::A];
        } else if (child.contains(key::R)) {
            if (target.erase(k) == 0) {
                throw TargetMismatch(child_path, "cannot remove absent key");
            }
        }
    }
}

void patch_sequence(Value& target, const Value& items, const std::string& path) {
    if (!target.is_array()) {
        throw TargetMismatch(path, "expected sequence, got " + type_name(target));
    }

    std::size_t i = 0;
    std::int64_t offset = 0;  // net insertions so far

    for (std::size_t n = 0; n < items.size(); ++n) {
        const auto& child = items[n];
        require_node(child, pointer_append(path, n));

        if (child.contains(key::I)) {
            const std::int64_t idx = read_index(child, pointer_append(path, n));
            // checked before adding: idx may be near INT64_MAX
            if (idx > static_cast<std::int64_t>(target.size()) - offset) {
                throw TargetMismatch(pointer_append(path, static_cast<std::size_t>(idx)),
                                     "index resolves past the end of the sequence (size " +
                                     std::to_string(target.size()) + ")");
            }
            const std::int64_t pos = idx + offset;
            if (pos < 0) {
                throw TargetMismatch(path, "index " + child[key::I].dump() +
                                     " resolves before the start of the sequence");
            }
            i = static_cast<std::size_t>(pos);
        }

        if (child.contains(key::D) || child.contains(key::N)) {
            if (i >= target.size()) {
                throw TargetMismatch(pointer_append(path, i),
                                     "index out of range (size " + std::to_string(target.size()) + ")");
            }
            apply(target[i], child, pointer_append(path, i));
        } else if (child.contains(key::A)) {
            if (i > target.size()) {
                throw TargetMismatch(pointer_append(path, i),
                                     "insert position out of range (size " + std::to_string(target.size()) + ")");
            }
            target.insert(target.begin() + static_cast<std::ptrdiff_t>(i), child[key::A]);
            ++offset;
        } else if (child.contains(key::R)) {
            if (i >= target.size()) {
                throw TargetMismatch(pointer_append(path, i),
                                     "cannot remove, index out of range (size " + std::to_string(target.size()) + ")");
            }
            target.erase(i);
            --offset;
            continue;  // next item slid into position i
        }

        ++i;
    }
}

void apply(Value& target, const Value& node, const std::string& path) {
    require_node(node, path);

    auto d = node.find(key::D);
    if (d != node.end()) {
        if (d->is_object()) {
            patch_mapping(target, *d, path);
        } else if (d->is_array()) {
            patch_sequence(target, *d, path);
        } else {
            throw InvalidDiffStructure(path, "unsupported 'D' payload type " + type_name(*d));
        }
    } else if (node.contains(key::N)) {
        target = node[key::N];
    }
}

} // anonymous namespace

Value& patch(Value& target, const Value& node) {
    apply(target, node, "");
    return target;
}

Value patched(Value target, const Value& node) {
    patch(target, node);
    return target;
}

} // namespace ndiff
