///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "enumerator.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>


///////////////////////////
///     ENUMERATOR      ///
///////////////////////////
CombinationEnumerator::CombinationEnumerator(const std::vector<OfferingGroup>& groups, std::uint64_t maxCandidates)
        : groups_(groups),
          maxCandidates_(maxCandidates),
          productSize_(computeProductSize(groups)),
          plannedCount_(0),
          digits_(groups.size(), 0) {
    if (maxCandidates_ == 0) {
        throw std::invalid_argument("maxCandidates must be a positive integer");
    }
    plannedCount_ = std::min(productSize_, maxCandidates_);
}

std::uint64_t CombinationEnumerator::computeProductSize(const std::vector<OfferingGroup>& groups) {
    if (groups.empty()) return 0;
    const std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t product = 1;
    for (const OfferingGroup& g : groups) {
        std::uint64_t n = g.offeringIndices.size();
        if (n == 0) return 0;
        // Saturate instead of wrapping; keep scanning so an empty group still yields 0.
        if (product > kMax / n) {
            product = kMax;
        } else {
            product *= n;
        }
    }
    return product;
}

bool CombinationEnumerator::next(std::vector<int>& selection) {
    if (emitted_ >= plannedCount_) return false;

    // Digits already point at the next tuple; advance after reading.
    selection.resize(groups_.size());
    for (size_t g = 0; g < groups_.size(); ++g) {
        selection[g] = groups_[g].offeringIndices[digits_[g]];
    }
    ++emitted_;

    // Odometer increment: last group is the fastest digit.
    for (size_t g = groups_.size(); g-- > 0;) {
        if (++digits_[g] < groups_[g].offeringIndices.size()) break;
        digits_[g] = 0;
    }
    return true;
}

void CombinationEnumerator::decode(std::uint64_t ordinal, std::vector<int>& selection) const {
    if (ordinal >= productSize_) {
        throw std::out_of_range("Ordinal outside of the combination range");
    }
    selection.resize(groups_.size());
    // Mixed-radix decomposition, least significant digit = last group.
    for (size_t g = groups_.size(); g-- > 0;) {
        std::uint64_t radix = groups_[g].offeringIndices.size();
        selection[g] = groups_[g].offeringIndices[(size_t)(ordinal % radix)];
        ordinal /= radix;
    }
}
