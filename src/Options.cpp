/**
 * @file Options.cpp
 * @brief DiffOptions loading and serialization
 */

#include "ndiff/Options.hpp"
#include "ndiff/Errors.hpp"
#include "ndiff/Util.hpp"

#include <cstdint>

namespace ndiff {

namespace {

bool* field_for(DiffOptions& opts, const std::string& name) {
    if (name == "A" || name == "emit_added") return &opts.emit_added;
    if (name == "N" || name == "emit_new") return &opts.emit_new;
    if (name == "O" || name == "emit_old") return &opts.emit_old;
    if (name == "R" || name == "emit_removed") return &opts.emit_removed;
    if (name == "U" || name == "emit_unchanged") return &opts.emit_unchanged;
    if (name == "trimR" || name == "trim_removed") return &opts.trim_removed;
    return nullptr;
}

bool to_flag(const std::string& name, const Value& v) {
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number_integer()) {
        auto n = v.get<std::int64_t>();
        if (n == 0 || n == 1) return n == 1;
    }
    throw OptionsError(name, "expected boolean, got " + v.dump());
}

} // anonymous namespace

void DiffOptions::set(const std::string& name, bool value) {
    bool* field = field_for(*this, name);
    if (field == nullptr) {
        throw OptionsError(name, "unknown option (expected one of A, N, O, R, U, trimR)");
    }
    *field = value;
}

void DiffOptions::update(const Value& v) {
    if (!v.is_object()) {
        throw OptionsError("<root>", "options must be a mapping, got " + type_name(v));
    }
    for (auto it = v.begin(); it != v.end(); ++it) {
        set(it.key(), to_flag(it.key(), it.value()));
    }
}

DiffOptions DiffOptions::from_value(const Value& v) {
    DiffOptions opts;
    opts.update(v);
    return opts;
}

Value DiffOptions::to_value() const {
    return Value{
        {"A", emit_added},
        {"N", emit_new},
        {"O", emit_old},
        {"R", emit_removed},
        {"U", emit_unchanged},
        {"trimR", trim_removed}
    };
}

DiffOptions parse_option_list(const std::string& list, DiffOptions base) {
    for (const auto& item : split(list, ',')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            base.set(item, true);
            continue;
        }

        std::string name = trim(item.substr(0, eq));
        std::string raw = item.substr(eq + 1);
        auto flag = parse_flag(raw);
        if (!flag) {
            throw OptionsError(name, "cannot parse '" + trim(raw) + "' as boolean");
        }
        base.set(name, *flag);
    }
    return base;
}

} // namespace ndiff
