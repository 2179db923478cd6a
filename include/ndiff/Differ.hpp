/**
 * @file Differ.hpp
 * @brief Recursive diff for nested Values
 *
 * Mappings and sequences are traversed recursively, everything else is
 * compared by value. The result is a diff node (see DiffNode.hpp).
 *
 * Examples:
 * ```cpp
 * DiffOptions opts;
 * opts.emit_unchanged = false;
 *
 * Value a = {{"one", {5, 7}}};
 * Value b = {{"one", {5}}, {"two", 2}};
 * diff(a, b, opts);
 * // {"D": {"one": {"D": [{"I": 1, "R": 7}]}, "two": {"A": 2}}}
 *
 * opts.emit_old = false;
 * diff(Value{0, 1, 2, 3}, Value{1, 2, 4, 5}, opts);
 * // {"D": [{"R": 0}, {"I": 3, "N": 4}, {"A": 5}]}
 * ```
 */

#ifndef NDIFF_DIFFER_HPP
#define NDIFF_DIFFER_HPP

#include "ndiff/Options.hpp"
#include "ndiff/Value.hpp"

namespace ndiff {

/**
 * @brief Computes diff nodes for a fixed set of options
 *
 * Holds no state besides its options; a single Differ may be used from
 * several threads at once.
 */
class Differ {
public:
    Differ() = default;
    explicit Differ(DiffOptions options) : options_(options) {}

    const DiffOptions& options() const noexcept { return options_; }

    /**
     * @brief Diff two arbitrary values
     *
     * Dispatches to diff_mappings() when both are mappings, to
     * diff_sequences() when both are sequences and to default_diff()
     * otherwise. Equal values give `{"U": a}`, or `{}` when unchanged
     * items are not reported.
     */
    Value diff(const Value& a, const Value& b) const;

    /**
     * @brief Diff two mappings
     *
     * ```cpp
     * Value a = {{"one", 1}, {"two", 2}, {"three", 3}};
     * Value b = {{"one", 1}, {"two", 42}};
     * Differ(parse_option_list("O=0,U=0")).diff_mappings(a, b);
     * // {"D": {"three": {"R": 3}, "two": {"N": 42}}}
     * ```
     */
    Value diff_mappings(const Value& a, const Value& b) const;

    /**
     * @brief Diff two sequences
     *
     * Items are aligned with matching_blocks(); items between matches are
     * paired up and diffed, leftovers become removals or additions. When
     * an item is left out of the output, the next emitted one carries its
     * original index in `I`.
     */
    Value diff_sequences(const Value& a, const Value& b) const;

    /**
     * @brief Diff for values that are neither equal nor both containers
     *
     * `{"N": b, "O": a}`, minus the disabled ops.
     */
    Value default_diff(const Value& a, const Value& b) const;

private:
    DiffOptions options_;
};

/**
 * @brief Compute recursive diff for two values
 *
 * Shortcut for `Differ(options).diff(a, b)`.
 */
Value diff(const Value& a, const Value& b, const DiffOptions& options = {});

} // namespace ndiff

#endif // NDIFF_DIFFER_HPP
