/**
 * @file Options.hpp
 * @brief Differ configuration
 *
 * Six independent toggles. Each op except the structural `D` and `I` can
 * be dropped from the output:
 *
 * | Field            | Key     | Default |
 * |------------------|---------|---------|
 * | emit_added       | `A`     | true    |
 * | emit_new         | `N`     | true    |
 * | emit_old         | `O`     | true    |
 * | emit_removed     | `R`     | true    |
 * | emit_unchanged   | `U`     | true    |
 * | trim_removed     | `trimR` | false   |
 *
 * Disabling A, N or R makes the produced diff unable to reconstruct the
 * new value by patching; that is a caller choice, not an engine error.
 */

#ifndef NDIFF_OPTIONS_HPP
#define NDIFF_OPTIONS_HPP

#include "ndiff/Value.hpp"

#include <string>

namespace ndiff {

/**
 * @brief Options for Differ.
 */
struct DiffOptions {
    bool emit_added = true;
    bool emit_new = true;
    bool emit_old = true;
    bool emit_removed = true;
    bool emit_unchanged = true;
    bool trim_removed = false; // replace removed payloads with null

    /**
     * @brief Build options from a mapping, starting from the defaults
     *
     * Accepts the short keys (`A`, `N`, `O`, `R`, `U`, `trimR`) and the
     * field names above. Values must be booleans or the integers 0/1.
     *
     * @throws OptionsError on unknown keys or non-boolean values
     */
    static DiffOptions from_value(const Value& v);

    /**
     * @brief Overlay the keys present in a mapping onto this object
     * @throws OptionsError on unknown keys or non-boolean values
     */
    void update(const Value& v);

    /**
     * @brief Set a single option by key
     * @throws OptionsError on unknown key
     */
    void set(const std::string& name, bool value);

    /**
     * @brief Mapping with the short keys, suitable for from_value()
     */
    Value to_value() const;

    /**
     * @brief True when forward patching can reconstruct the new value
     */
    bool is_patchable() const noexcept {
        return emit_added && emit_new && emit_removed;
    }
};

/**
 * @brief Parse a comma-separated option list
 *
 * Format: `KEY[=BOOL],...` where a bare key means true and BOOL is one of
 * true/false/yes/no/on/off/1/0 (case-insensitive).
 *
 * ```cpp
 * auto opts = parse_option_list("U=0, trimR");
 * // opts.emit_unchanged == false, opts.trim_removed == true
 * ```
 *
 * @param list Option list
 * @param base Options to start from
 * @throws OptionsError on unknown keys or unparsable values
 */
DiffOptions parse_option_list(const std::string& list, DiffOptions base = {});

} // namespace ndiff

#endif // NDIFF_OPTIONS_HPP
