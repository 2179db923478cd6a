/**
 * @file Commands.cpp
 * @brief File-level diff and patch flows
 */

#include "ndiff/Commands.hpp"
#include "ndiff/Differ.hpp"
#include "ndiff/Patch.hpp"

namespace ndiff {

Format resolve_output_format(const std::string& ofmt, const std::string& dest) {
    if (ofmt == "auto") return format_from_extension(dest, Format::Json);
    return parse_format(ofmt);
}

FileDiff diff_files(const std::string& old_path, const std::string& new_path,
                    const DiffOptions& options) {
    Value old_val = load_file(old_path);
    Value new_val = load_file(new_path);

    FileDiff result;
    result.node = Differ(options).diff(old_val, new_val);
    result.stats = count_ops(result.node);
    result.status = deep_equal(old_val, new_val) ? exit_code::kSame : exit_code::kDifferent;
    return result;
}

std::string patch_file(const std::string& target_path, const std::string& patch_path,
                       const std::string& out, const std::string& ofmt) {
    Value target = load_file(target_path);
    Value node = load_file(patch_path);
    validate_diff(node);

    patch(target, node);

    const std::string dest = out.empty() ? target_path : out;
    write_file(dest, target, resolve_output_format(ofmt, dest));
    return dest;
}

} // namespace ndiff
