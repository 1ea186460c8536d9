#include <catch2/catch.hpp>
#include "conflicts.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

// ============================================================================
// Slot occupancy and conflict detection
// ============================================================================

TEST_CASE("Disjoint selections have no conflicts", "[conflicts]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1), at(Day::MON, 2)}),
            makeOffering("B", {at(Day::TUE, 1)}),
    };
    REQUIRE(detectConflicts(catalog, {0, 1}).empty());
}

TEST_CASE("Shared slot is one conflict regardless of occupants", "[conflicts]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}),
            makeOffering("B", {at(Day::MON, 1)}),
            makeOffering("C", {at(Day::MON, 1), at(Day::FRI, 4)}),
    };
    SlotOccupancy occ(catalog);
    occ.occupyAll({0, 1, 2});

    REQUIRE(occ.conflictCount() == 1);
    REQUIRE(occ.occupiedSlots() == 2);

    auto conflicts = occ.conflicts();
    REQUIRE(conflicts.size() == 1);
    REQUIRE(conflicts[0].day == Day::MON);
    REQUIRE(conflicts[0].period == 1);
    REQUIRE(conflicts[0].offeringIndices == std::vector<int>{0, 1, 2});
    REQUIRE(occ.occupants(Day::FRI, 4) == std::vector<int>{2});
    REQUIRE(occ.occupants(Day::SAT, 1).empty());
}

TEST_CASE("Conflicts are ordered by day then period", "[conflicts]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::WED, 2), at(Day::MON, 5), at(Day::MON, 3)}),
            makeOffering("B", {at(Day::MON, 3), at(Day::WED, 2), at(Day::MON, 5)}),
    };
    auto conflicts = detectConflicts(catalog, {1, 0});

    REQUIRE(conflicts.size() == 3);
    REQUIRE(conflicts[0].period == 3);
    REQUIRE(conflicts[1].period == 5);
    REQUIRE(conflicts[2].day == Day::WED);
    // Occupants keep selection order.
    REQUIRE(conflicts[0].offeringIndices == std::vector<int>{1, 0});
}

TEST_CASE("Rooms do not affect conflicts", "[conflicts]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {TimeSlot{Day::THU, 2, "A101"}}),
            makeOffering("B", {TimeSlot{Day::THU, 2, "B202"}}),
    };
    REQUIRE(detectConflicts(catalog, {0, 1}).size() == 1);
}

TEST_CASE("Occupancy can be reused", "[conflicts]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}),
            makeOffering("B", {at(Day::MON, 1)}),
    };
    SlotOccupancy occ(catalog);
    occ.occupyAll({0, 1});
    REQUIRE(occ.conflictCount() == 1);

    occ.clear();
    occ.occupy(0);
    REQUIRE(occ.conflictCount() == 0);
    REQUIRE_THROWS_AS(occ.occupy(2), std::out_of_range);
}
