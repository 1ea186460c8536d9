///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflicts.hpp"
#include <stdexcept>


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
SlotOccupancy::SlotOccupancy(const std::vector<Offering>& catalog) : catalog_(catalog) {}

void SlotOccupancy::occupy(int offeringIndex) {
    if (offeringIndex < 0 || offeringIndex >= (int)catalog_.size()) {
        throw std::out_of_range("Offering index " + std::to_string(offeringIndex) + " outside of catalog");
    }
    // Time slots are duplicate-free per offering, so each offering appears once per key.
    for (const TimeSlot& ts : catalog_[offeringIndex].timeSlots) {
        slots_[SlotKey(dayIndex(ts.day), ts.period)].push_back(offeringIndex);
    }
}

void SlotOccupancy::occupyAll(const std::vector<int>& selection) {
    for (int idx : selection) occupy(idx);
}

const std::vector<int>& SlotOccupancy::occupants(Day day, int period) const {
    static const std::vector<int> kEmpty;
    auto it = slots_.find(SlotKey(dayIndex(day), period));
    return it == slots_.end() ? kEmpty : it->second;
}

std::vector<SlotConflict> SlotOccupancy::conflicts() const {
    std::vector<SlotConflict> out;
    for (const auto& entry : slots_) {
        if (entry.second.size() < 2) continue;
        SlotConflict c;
        c.day = static_cast<Day>(entry.first.first);
        c.period = entry.first.second;
        c.offeringIndices = entry.second;
        out.push_back(c);
    }
    return out;
}

int SlotOccupancy::conflictCount() const {
    int count = 0;
    for (const auto& entry : slots_) {
        if (entry.second.size() >= 2) ++count;
    }
    return count;
}

std::vector<SlotConflict> detectConflicts(const std::vector<Offering>& catalog, const std::vector<int>& selection) {
    SlotOccupancy occupancy(catalog);
    occupancy.occupyAll(selection);
    return occupancy.conflicts();
}
