#pragma once

#include "model.hpp"
#include <string>
#include <utility>
#include <vector>

// Offering with the fields the engine cares about; everything else defaulted.
inline Offering makeOffering(const std::string& name,
                             std::vector<TimeSlot> slots,
                             int priority = DEFAULT_PRIORITY,
                             int credits = 2,
                             Category category = Category::REQUIRED,
                             bool mandatory = false,
                             bool excluded = false,
                             const std::string& section = "01") {
    return Offering(name, category, section, credits, priority, std::move(slots), mandatory, excluded);
}

inline TimeSlot at(Day day, int period) {
    return TimeSlot{day, period, ""};
}
