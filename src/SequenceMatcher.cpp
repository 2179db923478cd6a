/**
 * @file SequenceMatcher.cpp
 * @brief Implementation of matching-block alignment
 */

#include "ndiff/SequenceMatcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <utility>

namespace ndiff {

namespace {

/// element -> ascending positions in b
using PositionIndex = std::unordered_map<std::string, std::vector<std::size_t>>;

PositionIndex index_positions(const std::vector<std::string>& b) {
    PositionIndex index;
    for (std::size_t j = 0; j < b.size(); ++j) {
        index[b[j]].push_back(j);
    }
    return index;
}

MatchingBlock longest_match(const std::vector<std::string>& a,
                            const PositionIndex& b2j,
                            std::size_t alo, std::size_t ahi,
                            std::size_t blo, std::size_t bhi) {
    MatchingBlock best{alo, blo, 0};

    // j2len[j + 1]: length of the run ending at a[i - 1], b[j]
    std::unordered_map<std::size_t, std::size_t> j2len;
    std::unordered_map<std::size_t, std::size_t> next_j2len;

    for (std::size_t i = alo; i < ahi; ++i) {
        next_j2len.clear();
        auto found = b2j.find(a[i]);
        if (found != b2j.end()) {
            for (std::size_t j : found->second) {
                if (j < blo) continue;
                if (j >= bhi) break;

                std::size_t k = 1;
                auto prev = j2len.find(j);  // run ending at b[j - 1]
                if (prev != j2len.end()) k += prev->second;
                next_j2len[j + 1] = k;

                // strict: keeps the earliest run in a, then in b
                if (k > best.size) {
                    best = {i + 1 - k, j + 1 - k, k};
                }
            }
        }
        std::swap(j2len, next_j2len);
    }

    return best;
}

} // anonymous namespace

MatchingBlock find_longest_match(const std::vector<std::string>& a,
                                 const std::vector<std::string>& b,
                                 std::size_t alo, std::size_t ahi,
                                 std::size_t blo, std::size_t bhi) {
    return longest_match(a, index_positions(b), alo, ahi, blo, bhi);
}

std::vector<MatchingBlock> matching_blocks(const std::vector<std::string>& a,
                                           const std::vector<std::string>& b) {
    const PositionIndex b2j = index_positions(b);

    std::vector<MatchingBlock> blocks;
    std::vector<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> pending;
    pending.emplace_back(0, a.size(), 0, b.size());

    while (!pending.empty()) {
        auto [alo, ahi, blo, bhi] = pending.back();
        pending.pop_back();

        MatchingBlock m = longest_match(a, b2j, alo, ahi, blo, bhi);
        if (m.size == 0) continue;

        blocks.push_back(m);
        if (alo < m.a && blo < m.b) {
            pending.emplace_back(alo, m.a, blo, m.b);
        }
        if (m.a + m.size < ahi && m.b + m.size < bhi) {
            pending.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
        }
    }

    std::sort(blocks.begin(), blocks.end(), [](const MatchingBlock& l, const MatchingBlock& r) {
        return std::tie(l.a, l.b, l.size) < std::tie(r.a, r.b, r.size);
    });

    std::vector<MatchingBlock> merged;
    merged.reserve(blocks.size() + 1);
    for (const auto& block : blocks) {
        if (!merged.empty()) {
            auto& last = merged.back();
            if (last.a + last.size == block.a && last.b + last.size == block.b) {
                last.size += block.size;
                continue;
            }
        }
        merged.push_back(block);
    }

    merged.push_back({a.size(), b.size(), 0});
    return merged;
}

std::vector<MatchingBlock> matching_blocks(const Value& a, const Value& b) {
    if (!a.is_array() || !b.is_array()) {
        throw std::invalid_argument("matching_blocks: both operands must be sequences");
    }

    std::vector<std::string> ea;
    std::vector<std::string> eb;
    ea.reserve(a.size());
    eb.reserve(b.size());
    for (const auto& v : a) ea.push_back(canonical_encoding(v));
    for (const auto& v : b) eb.push_back(canonical_encoding(v));

    return matching_blocks(ea, eb);
}

} // namespace ndiff
