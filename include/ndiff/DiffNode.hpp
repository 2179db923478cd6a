/**
 * @file DiffNode.hpp
 * @brief Diff node schema, builders and structure checks
 *
 * A diff node is a plain Value: a mapping whose keys are drawn from
 *
 * - `U` unchanged value
 * - `A` added value
 * - `R` removed value (null when trimmed)
 * - `N` new value of a changed leaf
 * - `O` old value of a changed leaf
 * - `D` nested diff: mapping key -> node, or sequence of nodes
 * - `I` original index of a sequence item, present only when it can't be
 *       inferred from the preceding siblings
 *
 * The empty mapping `{}` means "nothing to record".
 *
 * Example:
 * ```
 * a:    {"one": [5, 7]}
 * b:    {"one": [5], "two": 2}
 * diff: {"D": {"one": {"D": [{"I": 1, "R": 7}]}, "two": {"A": 2}}}   (U off)
 * ```
 */

#ifndef NDIFF_DIFFNODE_HPP
#define NDIFF_DIFFNODE_HPP

#include "ndiff/Value.hpp"

#include <cstddef>
#include <string>

namespace ndiff {

/// Diff node keys
namespace key {
inline constexpr char U[] = "U";
inline constexpr char A[] = "A";
inline constexpr char R[] = "R";
inline constexpr char N[] = "N";
inline constexpr char O[] = "O";
inline constexpr char D[] = "D";
inline constexpr char I[] = "I";
} // namespace key

/**
 * @brief The empty diff node
 */
inline Value empty_node() {
    return Value::object();
}

/**
 * @brief True for `{}` (no change recorded)
 */
inline bool is_empty_node(const Value& node) {
    return node.is_object() && node.empty();
}

/**
 * @brief True if node is a mapping carrying the given op key
 */
inline bool has_op(const Value& node, const char* op) {
    return node.is_object() && node.contains(op);
}

/**
 * @brief Build a single-op node, e.g. `{"A": value}`
 */
Value make_node(const char* op, Value payload);

/**
 * @brief Check a diff tree against the node schema
 *
 * Verifies that every node is a mapping with known keys, that `D` holds a
 * mapping or sequence of nodes and that `I` only appears on sequence items
 * as a non-negative integer.
 *
 * @param node Root diff node
 * @throws InvalidDiffStructure naming the first offending location
 */
void validate_diff(const Value& node);

/**
 * @brief Leaf op counters for a diff tree
 */
struct DiffStats {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t changed = 0;   ///< nodes carrying N and/or O
    std::size_t unchanged = 0;

    bool has_changes() const noexcept {
        return added != 0 || removed != 0 || changed != 0;
    }
};

/**
 * @brief Count leaf ops recursively
 *
 * Nodes are not validated; unknown keys are ignored.
 */
DiffStats count_ops(const Value& node);

/**
 * @brief Append a JSON-pointer token to a path ("~" and "/" escaped)
 */
std::string pointer_append(const std::string& path, const std::string& token);

/**
 * @brief Append a sequence index to a JSON-pointer path
 */
std::string pointer_append(const std::string& path, std::size_t index);

} // namespace ndiff

#endif // NDIFF_DIFFNODE_HPP
