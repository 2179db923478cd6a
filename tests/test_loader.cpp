/**
 * @file test_loader.cpp
 * @brief Tests for file loading and writing
 *
 * Tests cover:
 * - JSON file loading
 * - TOML file loading
 * - Auto-detect loading by extension
 * - Writing JSON/TOML and reading back (including diff nodes)
 */

#include <gtest/gtest.h>
#include "ndiff/Loader.hpp"
#include "ndiff/Errors.hpp"
#include "ndiff/Differ.hpp"
#include "ndiff/Patch.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace ndiff;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("ndiff_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// Formats
// ============================================================================

TEST(Formats, ParseFormat) {
    EXPECT_EQ(parse_format("json"), Format::Json);
    EXPECT_EQ(parse_format(" TOML "), Format::Toml);
    EXPECT_THROW(parse_format("yaml"), std::invalid_argument);
}

TEST(Formats, FromExtension) {
    EXPECT_EQ(format_from_extension("a/b.JSON"), Format::Json);
    EXPECT_EQ(format_from_extension("cfg.toml"), Format::Toml);
    EXPECT_EQ(format_from_extension("diff.out", Format::Toml), Format::Toml);
    EXPECT_EQ(format_from_extension(""), Format::Json);
    EXPECT_EQ(get_file_extension("x/y.Toml"), ".toml");
    EXPECT_EQ(format_name(Format::Toml), "toml");
}

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJson, Simple) {
    TempFile f(R"({"a": [1, 2], "b": {"c": null}})");
    EXPECT_EQ(load_json_file(f.path()), Value::parse(R"({"a": [1, 2], "b": {"c": null}})"));
}

TEST(LoadJson, ScalarRoot) {
    TempFile f("42");
    EXPECT_EQ(load_file(f.path()), Value(42));
}

TEST(LoadJson, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/ndiff/file.json"), FileNotFoundError);
}

TEST(LoadJson, SyntaxError) {
    TempFile f(R"({"a": )");
    try {
        load_json_file(f.path());
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.file(), f.path());
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadToml, TablesAndArrays) {
    TempFile f(
        "name = \"svc\"\n"
        "ports = [80, 443]\n"
        "[db]\n"
        "host = \"localhost\"\n"
        "ratio = 0.5\n"
        "enabled = true\n",
        ".toml");

    Value expected = Value::parse(R"({
        "name": "svc",
        "ports": [80, 443],
        "db": {"host": "localhost", "ratio": 0.5, "enabled": true}
    })");
    EXPECT_EQ(load_file(f.path()), expected);
}

TEST(LoadToml, SyntaxErrorHasPosition) {
    TempFile f("a = \n", ".toml");
    try {
        load_toml_file(f.path());
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_GT(e.line(), 0);
    }
}

TEST(LoadToml, MissingFile) {
    EXPECT_THROW(load_toml_file("/nonexistent/ndiff/file.toml"), FileNotFoundError);
}

// ============================================================================
// Auto-detect
// ============================================================================

TEST(LoadFile, UnsupportedExtension) {
    TempFile f("a: 1\n", ".yaml");
    EXPECT_THROW(load_file(f.path()), std::runtime_error);
}

TEST(LoadFile, MissingFile) {
    EXPECT_THROW(load_file("/nonexistent/ndiff/file.json"), FileNotFoundError);
}

// ============================================================================
// Writing
// ============================================================================

TEST(WriteFile, JsonRoundTrip) {
    TempFile f("", ".json");
    Value v = Value::parse(R"({"D": [{"R": 0}, {"I": 3, "N": 4}, {"A": 5}]})");
    write_file(f.path(), v, Format::Json);
    EXPECT_EQ(load_file(f.path()), v);
}

TEST(WriteFile, TomlDiffNodeStillApplies) {
    Value a = Value::parse(R"({"hosts": ["a", "b", "c"], "port": 80, "old": 1})");
    Value b = Value::parse(R"({"hosts": ["b", "c", "d"], "port": 8080})");

    DiffOptions opts;
    opts.emit_unchanged = false;
    Value node = diff(a, b, opts);

    TempFile f("", ".toml");
    write_file(f.path(), node, Format::Toml);
    Value loaded = load_file(f.path());

    EXPECT_EQ(loaded, node);
    EXPECT_EQ(patched(a, loaded), b);
}

TEST(WriteFile, TomlNullBecomesEmptyString) {
    TempFile f("", ".toml");
    write_file(f.path(), Value::parse(R"({"D": {"k": {"R": null}}})"), Format::Toml);
    EXPECT_EQ(load_file(f.path()), Value::parse(R"({"D": {"k": {"R": ""}}})"));
}

TEST(WriteFile, TomlWrapsNonMappingRoot) {
    TempFile f("", ".toml");
    write_file(f.path(), Value::parse("[1, 2]"), Format::Toml);
    EXPECT_EQ(load_file(f.path()), Value::parse(R"({"value": [1, 2]})"));
}

TEST(DumpValue, JsonIndented) {
    EXPECT_EQ(dump_value(Value::parse(R"({"A": 1})"), Format::Json), "{\n  \"A\": 1\n}");
}
