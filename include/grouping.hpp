#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief A mandatory course has no available (non-excluded) offering.
 *
 * Raised by the pre-check before any enumeration work starts.
 */
class MandatoryUnsatisfiable : public std::runtime_error {
public:
    explicit MandatoryUnsatisfiable(const std::string& courseName);

    /// Name of the course that cannot be satisfied.
    const std::string& courseName() const { return courseName_; }

private:
    std::string courseName_;
};


///////////////////////////
///      GROUPING       ///
///////////////////////////
/**
 * @brief Partition a catalog into offering groups and check feasibility.
 *
 * Steps:
 *  - an empty catalog yields no groups,
 *  - mandatory names are collected over the whole catalog (excluded
 *    offerings included) and each must keep at least one available
 *    offering,
 *  - excluded offerings are dropped and the rest grouped by name, groups
 *    ordered by first appearance of the name,
 *  - inside a group, mandatory offerings come first, then higher priority,
 *    then catalog order.
 *
 * @param catalog Offering snapshot; group entries index into it.
 * @return One group per distinct available name (possibly none).
 * @throws MandatoryUnsatisfiable naming the first unsatisfiable course.
 */
std::vector<OfferingGroup> buildOfferingGroups(const std::vector<Offering>& catalog);
