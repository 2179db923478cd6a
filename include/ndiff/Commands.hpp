/**
 * @file Commands.hpp
 * @brief File-level diff and patch flows behind the ndiff CLI
 *
 * The CLI only parses arguments and prints; loading, diffing, patching,
 * exit status and output placement live here so they can be tested.
 */

#ifndef NDIFF_COMMANDS_HPP
#define NDIFF_COMMANDS_HPP

#include "ndiff/DiffNode.hpp"
#include "ndiff/Loader.hpp"
#include "ndiff/Options.hpp"
#include "ndiff/Value.hpp"

#include <string>

namespace ndiff {

/// Exit codes follow diff(1): 0 same, 1 different, 2 trouble
namespace exit_code {
constexpr int kSame = 0;
constexpr int kDifferent = 1;
constexpr int kError = 2;
} // namespace exit_code

/**
 * @brief Result of diffing two files
 */
struct FileDiff {
    Value node;
    DiffStats stats;
    int status = exit_code::kSame;
};

/**
 * @brief Resolve an output format name for a destination
 *
 * "auto" picks from the destination's extension and falls back to JSON
 * (also for stdout, i.e. an empty destination).
 *
 * @throws std::invalid_argument for names other than auto/json/toml
 */
Format resolve_output_format(const std::string& ofmt, const std::string& dest);

/**
 * @brief Load two files and diff them
 *
 * status is exit_code::kSame when the values are deep_equal() and
 * exit_code::kDifferent otherwise, whatever the options suppress.
 */
FileDiff diff_files(const std::string& old_path, const std::string& new_path,
                    const DiffOptions& options);

/**
 * @brief Patch a file with a diff node stored in another file
 *
 * The node is validated before it is applied. The result is written to
 * `out`, or back to `target_path` when `out` is empty. Nothing is written
 * if loading, validation or patching throws.
 *
 * @return Path that was written
 * @throws InvalidDiffStructure, TargetMismatch, FileNotFoundError, ParseError
 */
std::string patch_file(const std::string& target_path, const std::string& patch_path,
                       const std::string& out = "", const std::string& ofmt = "auto");

} // namespace ndiff

#endif // NDIFF_COMMANDS_HPP
