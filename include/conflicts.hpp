#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <map>
#include <utility>
#include <vector>


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
/**
 * @brief A (day, period) occupied by two or more offerings of one candidate.
 */
struct SlotConflict {
    Day day; ///< Day of the collision.
    int period; ///< Period of the collision.
    std::vector<int> offeringIndices; ///< Colliding catalog indices, in selection order.
};

/**
 * @brief Occupancy index of one candidate's time slots.
 *
 * Maps every (day, period) to the offerings of the candidate meeting then.
 * Any slot with two or more occupants is a conflict; conflictCount() counts
 * such slots, not pairs of offerings.
 */
class SlotOccupancy {
public:
    /**
     * @brief Create an empty occupancy index over a catalog.
     *
     * The catalog must outlive the index.
     */
    explicit SlotOccupancy(const std::vector<Offering>& catalog);

    /**
     * @brief Record every time slot of one offering.
     *
     * @param offeringIndex Index into the catalog.
     */
    void occupy(int offeringIndex);

    /**
     * @brief Record a whole selection (one offering per group).
     */
    void occupyAll(const std::vector<int>& selection);

    /// Forget all recorded slots so the index can be reused.
    void clear() { slots_.clear(); }

    /**
     * @brief Offerings occupying (day, period), empty if none.
     */
    const std::vector<int>& occupants(Day day, int period) const;

    /**
     * @brief All collisions in ascending (day, period) order.
     */
    std::vector<SlotConflict> conflicts() const;

    /**
     * @brief Number of distinct slots with two or more occupants.
     */
    int conflictCount() const;

    /// Number of distinct occupied slots.
    size_t occupiedSlots() const { return slots_.size(); }

private:
    using SlotKey = std::pair<int, int>; ///< (day index, period)

    /// Catalog the recorded indices refer to.
    const std::vector<Offering>& catalog_;

    /// slots_[(day, period)] = catalog indices meeting then.
    std::map<SlotKey, std::vector<int>> slots_;
};

/**
 * @brief Conflicts of one selection (pure function of the selection).
 */
std::vector<SlotConflict> detectConflicts(const std::vector<Offering>& catalog, const std::vector<int>& selection);
