/**
 * @file Patch.hpp
 * @brief Apply diff nodes to Values
 */

#ifndef NDIFF_PATCH_HPP
#define NDIFF_PATCH_HPP

#include "ndiff/Value.hpp"

namespace ndiff {

/**
 * @brief Patch a value in place
 *
 * Walks the diff node:
 * - `D` over a mapping: per key, children with `D` or `N` are applied
 *   recursively, `A` sets the key, `R` erases it, anything else is left
 *   alone.
 * - `D` over a sequence: items are applied in order against a cursor. An
 *   item's `I` moves the cursor to `I` plus the net number of items
 *   inserted so far; `A` inserts, `R` erases, `D`/`N` patch the item under
 *   the cursor.
 * - otherwise `N` replaces the target; `{}`, `U` and `O` leave it as is.
 *
 * On error the target may be left partially patched.
 *
 * @param target Value to modify
 * @param node Diff node, usually produced by diff()
 * @return Reference to target
 * @throws InvalidDiffStructure if node (or a nested node) is malformed
 * @throws TargetMismatch if node addresses a key or index target lacks
 *
 * Example:
 * ```cpp
 * Value v = {0, 1, 2, 3};
 * patch(v, Value::parse(R"({"D": [{"R": 0}, {"I": 3, "N": 4}, {"A": 5}]})"));
 * // v == [1, 2, 4, 5]
 * ```
 */
Value& patch(Value& target, const Value& node);

/**
 * @brief Patch a copy and return it
 */
Value patched(Value target, const Value& node);

} // namespace ndiff

#endif // NDIFF_PATCH_HPP
