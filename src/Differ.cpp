/**
 * @file Differ.cpp
 * @brief Implementation of recursive diff
 */

#include "ndiff/Differ.hpp"
#include "ndiff/DiffNode.hpp"
#include "ndiff/SequenceMatcher.hpp"

#include <cstddef>
#include <utility>

namespace ndiff {

namespace {

/**
 * @brief Collects sequence items and tracks whether positions still line up
 *
 * While every item is emitted, an item's position in the output equals its
 * index in the old sequence (after accounting for insertions). Once an item
 * is skipped the tracker is Desynced and the next emitted item records its
 * index in `I`, which brings it back to Synced.
 */
class SequenceEmitter {
public:
    void skip() noexcept {
        state_ = State::Desynced;
    }

    void emit(Value node, std::size_t index) {
        if (state_ == State::Desynced) {
            node[key::I] = index;
            state_ = State::Synced;
        }
        items_.push_back(std::move(node));
    }

    Value finish() {
        if (items_.empty()) return empty_node();
        return make_node(key::D, std::move(items_));
    }

private:
    enum class State { Synced, Desynced };

    State state_ = State::Synced;
    Value items_ = Value::array();
};

} // anonymous namespace

Value Differ::diff(const Value& a, const Value& b) const {
    if (deep_equal(a, b)) {
        return options_.emit_unchanged ? make_node(key::U, a) : empty_node();
    }

    if (a.is_object() && b.is_object()) {
        return diff_mappings(a, b);
    }

    if (a.is_array() && b.is_array()) {
        return diff_sequences(a, b);
    }

    return default_diff(a, b);
}

Value Differ::diff_mappings(const Value& a, const Value& b) const {
    Value children = Value::object();

    for (auto it = a.begin(); it != a.end(); ++it) {
        const auto& k = it.key();
        auto other = b.find(k);

        if (other == b.end()) {
            if (options_.emit_removed) {
                children[k] = make_node(key::R, options_.trim_removed ? Value() : it.value());
            }
            continue;
        }

        if (deep_equal(it.value(), *other)) {
            if (options_.emit_unchanged) {
                children[k] = make_node(key::U, it.value());
            }
            continue;
        }

        Value sub = diff(it.value(), *other);
        if (!is_empty_node(sub)) {
            children[k] = std::move(sub);
        }
    }

    if (options_.emit_added) {
        for (auto it = b.begin(); it != b.end(); ++it) {
            if (!a.contains(it.key())) {
                children[it.key()] = make_node(key::A, it.value());
            }
        }
    }

    if (children.empty()) return empty_node();
    return make_node(key::D, std::move(children));
}

Value Differ::diff_sequences(const Value& a, const Value& b) const {
    SequenceEmitter out;
    std::size_t i = 0;
    std::size_t j = 0;

    // Cursors stop at the start of each block; the block's own items are
    // walked by the pairing loop of the following iteration.
    for (const auto& block : matching_blocks(a, b)) {
        for (; i < block.a && j < block.b; ++i, ++j) {
            Value sub = diff(a[i], b[j]);
            if (is_empty_node(sub)) {
                out.skip();
            } else {
                out.emit(std::move(sub), i);
            }
        }

        for (; i < block.a; ++i) {
            if (options_.emit_removed) {
                out.emit(make_node(key::R, options_.trim_removed ? Value() : a[i]), i);
            } else {
                out.skip();
            }
        }

        for (; j < block.b; ++j) {
            if (options_.emit_added) {
                out.emit(make_node(key::A, b[j]), i);
            } else {
                out.skip();
            }
        }
    }

    return out.finish();
}

Value Differ::default_diff(const Value& a, const Value& b) const {
    Value node = empty_node();

    if (options_.emit_new) node[key::N] = b;
    if (options_.emit_old) node[key::O] = a;

    return node;
}

Value diff(const Value& a, const Value& b, const DiffOptions& options) {
    return Differ(options).diff(a, b);
}

} // namespace ndiff
