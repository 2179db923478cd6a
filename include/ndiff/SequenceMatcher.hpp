/**
 * @file SequenceMatcher.hpp
 * @brief Longest-matching-block alignment of two sequences
 *
 * Elements are compared by their canonical encoding, so composite values
 * match when they are deep-equal. Every element is eligible for matching;
 * there is no junk filter and no popularity heuristic.
 *
 * Both functions are pure: no state survives between calls, so concurrent
 * use needs no synchronization.
 */

#ifndef NDIFF_SEQUENCEMATCHER_HPP
#define NDIFF_SEQUENCEMATCHER_HPP

#include "ndiff/Value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ndiff {

/**
 * @brief Run of equal elements: a[a .. a+size) == b[b .. b+size)
 */
struct MatchingBlock {
    std::size_t a = 0;
    std::size_t b = 0;
    std::size_t size = 0;

    bool operator==(const MatchingBlock& other) const noexcept {
        return a == other.a && b == other.b && size == other.size;
    }
    bool operator!=(const MatchingBlock& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Longest run of equal elements within a[alo, ahi) and b[blo, bhi)
 *
 * Among runs of maximal length the one starting earliest in `a` wins, then
 * the one starting earliest in `b`. Returns `{alo, blo, 0}` when the ranges
 * share no element.
 */
MatchingBlock find_longest_match(const std::vector<std::string>& a,
                                 const std::vector<std::string>& b,
                                 std::size_t alo, std::size_t ahi,
                                 std::size_t blo, std::size_t bhi);

/**
 * @brief All matching blocks of a and b, ordered left to right
 *
 * Finds the longest match, then recurses into the ranges left and right
 * of it. Adjacent blocks are merged. The list always ends with the
 * sentinel `{a.size(), b.size(), 0}`.
 *
 * Example:
 * ```
 * a = [0, 1, 2, 3]
 * b = [1, 2, 4, 5]
 * matching_blocks(a, b) == [{1, 0, 2}, {4, 4, 0}]
 * ```
 */
std::vector<MatchingBlock> matching_blocks(const std::vector<std::string>& a,
                                           const std::vector<std::string>& b);

/**
 * @brief matching_blocks() over two sequence Values
 *
 * @throws std::invalid_argument if either operand is not a sequence
 */
std::vector<MatchingBlock> matching_blocks(const Value& a, const Value& b);

} // namespace ndiff

#endif // NDIFF_SEQUENCEMATCHER_HPP
