/**
 * @file Value.hpp
 * @brief Value type for diffable nested data
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...})
 *
 * Diff nodes produced by the engine are Values too, so anything that can
 * serialize a Value can serialize a diff.
 */

#ifndef NDIFF_VALUE_HPP
#define NDIFF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace ndiff {

/**
 * @brief JSON-like value type for diff operands and diff nodes
 *
 * This is an alias for nlohmann::json. Mappings are stored key-sorted, so
 * insertion order never influences equality or encoding.
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    if (val.is_binary()) return "binary";
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Structural (deep) equality
 *
 * Sequences compare by position, mappings by key. Numbers compare by
 * numeric value, so `1 == 1.0`.
 */
inline bool deep_equal(const Value& a, const Value& b) {
    return a == b;
}

/**
 * @brief Deterministic encoding used as an equality surrogate
 *
 * Two values produce the same encoding iff they are deep_equal(), with two
 * numeric exceptions:
 * - NaN encodes like every other NaN although NaN != NaN
 * - an integer beyond 2^53 and the float it rounds to compare equal under
 *   deep_equal() but encode differently (the integer is kept exact)
 *
 * Strings are length-prefixed, mapping keys are emitted in sorted order
 * and numbers are normalized (an integral float encodes like the integer,
 * -0.0 like 0).
 *
 * The encoding is stable within one process run; it is not a wire format.
 *
 * Examples:
 * ```cpp
 * canonical_encoding(Value(1)) == canonical_encoding(Value(1.0)); // true
 * canonical_encoding(Value("1")) == canonical_encoding(Value(1)); // false
 * ```
 */
std::string canonical_encoding(const Value& val);

} // namespace ndiff

#endif // NDIFF_VALUE_HPP
