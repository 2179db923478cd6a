/**
 * @file Loader.cpp
 * @brief Reading and writing diff operands and diff nodes
 *
 * JSON goes through nlohmann::json directly. TOML is parsed with toml++ and
 * converted node by node; dates and times become their TOML text since a
 * Value has no date type.
 */

#include "ndiff/Loader.hpp"
#include "ndiff/Errors.hpp"
#include "ndiff/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;

namespace ndiff {

namespace {

bool is_readable_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ---- TOML -> Value ---------------------------------------------------------

Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using N = std::decay_t<decltype(n)>;

        if constexpr (toml::is_table<N>) {
            Value obj = Value::object();
            for (const auto& [k, child] : n) {
                obj[std::string(k.str())] = from_toml(child);
            }
            return obj;
        } else if constexpr (toml::is_array<N>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(from_toml(child));
            }
            return arr;
        } else if constexpr (toml::is_date<N> || toml::is_time<N> || toml::is_date_time<N>) {
            std::ostringstream text;
            text << *n;
            return Value(text.str());
        } else {
            return Value(*n);
        }
    });
}

// ---- Value -> TOML (value-based construction) ------------------------------

toml::table make_table(const Value& o);
toml::array make_array(const Value& a);

template <typename Sink>
void put_scalar(const Value& v, Sink&& sink) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_integer() && !v.is_number_unsigned()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sink(static_cast<std::int64_t>(u));
        } else {
            // Oversize for TOML int
            sink(static_cast<double>(u));
        }
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else if (v.is_null()) {
        // No TOML null
        sink(std::string{});
    } else {
        sink(v.dump());
    }
}

toml::array make_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_array(elem));
        } else {
            put_scalar(elem, [&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
        }
    }
    return out;
}

toml::table make_table(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const auto& k = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(k, make_table(v));
        } else if (v.is_array()) {
            tbl.insert(k, make_array(v));
        } else {
            put_scalar(v, [&tbl, &k](auto&& x) { tbl.insert(k, std::forward<decltype(x)>(x)); });
        }
    }
    return tbl;
}

toml::table to_toml_root(const Value& v) {
    // TOML requires a table at the root
    if (v.is_object()) return make_table(v);
    Value wrapped = Value::object();
    wrapped["value"] = v;
    return make_table(wrapped);
}

} // anonymous namespace

// ============================================================================
// Formats
// ============================================================================

Format parse_format(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "json") return Format::Json;
    if (n == "toml") return Format::Toml;
    throw std::invalid_argument("Unsupported format: " + name + " (expected json or toml)");
}

std::string format_name(Format fmt) {
    return fmt == Format::Toml ? "toml" : "json";
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Format format_from_extension(const std::string& path, Format fallback) {
    std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".toml") return Format::Toml;
    return fallback;
}

// ============================================================================
// Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!is_readable_file(path)) {
        throw FileNotFoundError(path);
    }

    const std::string text = read_text(path);
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        // byte offset only; nlohmann doesn't report line/column separately
        throw ParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!is_readable_file(path)) {
        throw FileNotFoundError(path);
    }

    const std::string text = read_text(path);
    toml::table table;
    try {
        table = toml::parse(text, path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return from_toml(table);
}

Value load_file(const std::string& path) {
    if (!is_readable_file(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);

    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    } else {
        throw std::runtime_error(
            "Unsupported file type: " + ext + " (expected .json or .toml)"
        );
    }
}

// ============================================================================
// Writing
// ============================================================================

std::string dump_value(const Value& v, Format fmt) {
    if (fmt == Format::Toml) {
        std::ostringstream oss;
        oss << to_toml_root(v);
        return oss.str();
    }
    return v.dump(2);
}

void write_file(const std::string& path, const Value& v, Format fmt) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Failed to open for write: " + path);
    ofs << dump_value(v, fmt);
    if (fmt == Format::Json) ofs << "\n";
}

} // namespace ndiff
