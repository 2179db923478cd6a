/**
 * @file Loader.hpp
 * @brief File loading and writing for diff operands and diff nodes
 *
 * Supports:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The diff engine itself does no I/O; these helpers serve the CLI and
 * other callers that keep values on disk.
 */

#ifndef NDIFF_LOADER_HPP
#define NDIFF_LOADER_HPP

#include "ndiff/Value.hpp"
#include <string>

namespace ndiff {

/**
 * @brief Serialization formats known to the loader
 */
enum class Format {
    Json,
    Toml
};

/**
 * @brief Parse a format name ("json", "toml", case-insensitive)
 * @throws std::invalid_argument for unknown names
 */
Format parse_format(const std::string& name);

/**
 * @brief Format name as accepted by parse_format()
 */
std::string format_name(Format fmt);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Guess format from the file extension
 *
 * `.json` -> Json, `.toml` -> Toml, anything else -> fallback.
 */
Format format_from_extension(const std::string& path, Format fallback = Format::Json);

/**
 * @brief Load a value from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a value from a TOML file.
 *
 * Tables map to mappings, arrays to sequences. Dates and times become
 * strings in their TOML textual form.
 *
 * @param path Path to the TOML file
 * @return Parsed Value (always a mapping)
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a value, detecting the format by extension.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if file has syntax errors
 * @throws std::runtime_error if extension is not .json or .toml
 */
Value load_file(const std::string& path);

/**
 * @brief Serialize a value
 *
 * JSON is indented by 2 spaces. TOML has no null, so nulls are written as
 * empty strings, and a non-mapping root is wrapped under the key "value".
 */
std::string dump_value(const Value& v, Format fmt);

/**
 * @brief Write a value to a file, replacing its contents
 * @throws std::runtime_error if the file cannot be opened
 */
void write_file(const std::string& path, const Value& v, Format fmt);

} // namespace ndiff

#endif // NDIFF_LOADER_HPP
