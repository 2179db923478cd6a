/**
 * @file Value.cpp
 * @brief Canonical encoding of Values
 */

#include "ndiff/Value.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace ndiff {

namespace {

void encode_string(std::string& out, char tag, const std::string& s) {
    out += tag;
    out += std::to_string(s.size());
    out += ':';
    out += s;
}

void encode_float(std::string& out, double d) {
    // 2^63 and 2^64 are exactly representable as doubles
    constexpr double kInt64Min = -9223372036854775808.0;
    constexpr double kUint64End = 18446744073709551616.0;

    if (std::isfinite(d) && std::trunc(d) == d && d >= kInt64Min && d < kUint64End) {
        out += 'i';
        if (d < 0.0) {
            out += std::to_string(static_cast<std::int64_t>(d));
        } else {
            out += std::to_string(static_cast<std::uint64_t>(d));
        }
        return;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    out += 'd';
    out += buf;
}

void encode(std::string& out, const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
            out += 'z';
            break;

        case Value::value_t::boolean:
            out += val.get<bool>() ? 't' : 'f';
            break;

        case Value::value_t::number_integer:
            out += 'i';
            out += std::to_string(val.get<std::int64_t>());
            break;

        case Value::value_t::number_unsigned:
            out += 'i';
            out += std::to_string(val.get<std::uint64_t>());
            break;

        case Value::value_t::number_float:
            encode_float(out, val.get<double>());
            break;

        case Value::value_t::string:
            encode_string(out, 's', val.get_ref<const std::string&>());
            break;

        case Value::value_t::array:
            out += '[';
            out += std::to_string(val.size());
            out += ':';
            for (const auto& elem : val) {
                encode(out, elem);
            }
            out += ']';
            break;

        case Value::value_t::object:
            // object_t is key-sorted, iteration order is canonical
            out += '{';
            out += std::to_string(val.size());
            out += ':';
            for (auto it = val.begin(); it != val.end(); ++it) {
                encode_string(out, 's', it.key());
                encode(out, it.value());
            }
            out += '}';
            break;

        case Value::value_t::binary: {
            const auto& bin = val.get_binary();
            out += 'b';
            out += bin.has_subtype() ? std::to_string(bin.subtype()) : std::string("-");
            out += '/';
            out += std::to_string(bin.size());
            out += ':';
            out.append(bin.begin(), bin.end());
            break;
        }

        case Value::value_t::discarded:
            out += 'x';
            break;
    }
}

} // anonymous namespace

std::string canonical_encoding(const Value& val) {
    std::string out;
    encode(out, val);
    return out;
}

} // namespace ndiff
