#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdint>
#include <vector>


///////////////////////////
///     ENUMERATOR      ///
///////////////////////////
/**
 * @brief Bounded Cartesian product over offering groups.
 *
 * Produces one selection (one catalog index per group, in group order) per
 * call to next(). Order is an odometer: the first group varies slowest and
 * the last group fastest. Every selection has an ordinal, its 0-based
 * position in that order, so parallel backends can split the ordinal range
 * and rebuild selections with decode().
 *
 * The product size is computed up front (saturating at UINT64_MAX), so the
 * caller knows before enumerating whether the cap will truncate the run.
 * An enumerator is single-pass: once exhausted or capped it stays so.
 */
class CombinationEnumerator {
public:
    /**
     * @brief Prepare an enumeration.
     *
     * @param groups        Offering groups; must outlive the enumerator.
     * @param maxCandidates Hard cap on emitted selections.
     * @throws std::invalid_argument if maxCandidates is zero.
     */
    CombinationEnumerator(const std::vector<OfferingGroup>& groups, std::uint64_t maxCandidates);

    /**
     * @brief Produce the next selection.
     *
     * @param selection Output; resized to the number of groups.
     * @return false once the product is exhausted or the cap is reached.
     */
    bool next(std::vector<int>& selection);

    /// Ordinal of the selection returned by the last successful next().
    std::uint64_t lastOrdinal() const { return emitted_ - 1; }

    /// Full product size (saturated), independent of the cap.
    std::uint64_t productSize() const { return productSize_; }

    /// min(productSize(), maxCandidates): how many selections will be emitted.
    std::uint64_t plannedCount() const { return plannedCount_; }

    /// True if the cap is smaller than the product.
    bool willTruncate() const { return productSize_ > maxCandidates_; }

    /// True once the cap actually stopped enumeration early.
    bool truncated() const { return emitted_ >= plannedCount_ && willTruncate(); }

    /// Number of selections emitted so far.
    std::uint64_t emitted() const { return emitted_; }

    /**
     * @brief Rebuild the selection at a given ordinal without iterating.
     *
     * @param ordinal   Position in enumeration order, < productSize().
     * @param selection Output; resized to the number of groups.
     */
    void decode(std::uint64_t ordinal, std::vector<int>& selection) const;

    /**
     * @brief Saturating product of group sizes; 0 if there are no groups
     *        or any group is empty.
     */
    static std::uint64_t computeProductSize(const std::vector<OfferingGroup>& groups);

private:
    const std::vector<OfferingGroup>& groups_;
    std::uint64_t maxCandidates_;
    std::uint64_t productSize_;
    std::uint64_t plannedCount_;
    std::uint64_t emitted_ = 0;

    /// Odometer digits, one per group (index into offeringIndices).
    std::vector<size_t> digits_;
};
