/**
 * @file Errors.hpp
 * @brief Exception types for ndiff
 *
 * Error taxonomy:
 * - DiffError: Base class
 * - InvalidDiffStructure: Diff node is malformed (e.g. `D` neither mapping
 *   nor sequence)
 * - TargetMismatch: Patch addresses a key/index the target doesn't have
 * - OptionsError: Unknown or ill-typed differ option
 * - FileNotFoundError: Input file not found
 * - ParseError: JSON/TOML syntax errors
 *
 * None of these are retried; all indicate inconsistent input.
 */

#ifndef NDIFF_ERRORS_HPP
#define NDIFF_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ndiff {

/**
 * @brief Base class for all ndiff exceptions
 */
class DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Diff node has a shape the patch applier cannot interpret
 */
class InvalidDiffStructure : public DiffError {
public:
    /**
     * @brief Construct with location and error details
     * @param path Pointer-style location of the offending node (e.g., "/a/0")
     * @param details What is wrong with it
     */
    InvalidDiffStructure(std::string path, std::string details)
        : DiffError("Invalid diff structure at '" + display(path) + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the location of the malformed node
     */
    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;

    static std::string display(const std::string& path) {
        return path.empty() ? std::string("/") : path;
    }
};

/**
 * @brief Patch target does not match the diff
 *
 * Raised when a patch removes or descends into an absent key, indexes
 * past the end of a sequence, or expects a container the target doesn't
 * hold. The target may be partially patched when this is thrown.
 */
class TargetMismatch : public DiffError {
public:
    /**
     * @brief Construct with location and error details
     * @param path Pointer-style location in the target (e.g., "/a/0")
     * @param details Description of the mismatch
     */
    TargetMismatch(std::string path, std::string details)
        : DiffError("Patch target mismatch at '" + (path.empty() ? std::string("/") : path) +
                    "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Differ option is unknown or has the wrong type
 */
class OptionsError : public DiffError {
public:
    /**
     * @param option Option name as given by the caller
     * @param details Reason it was rejected
     */
    OptionsError(std::string option, std::string details)
        : DiffError("Invalid option '" + option + "': " + details)
        , option_(std::move(option))
    {}

    const std::string& option() const noexcept {
        return option_;
    }

private:
    std::string option_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public DiffError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DiffError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input file parse error (JSON/TOML syntax)
 */
class ParseError : public DiffError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line of the error, 0 if unknown
     * @param column 1-based column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : DiffError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace ndiff

#endif // NDIFF_ERRORS_HPP
