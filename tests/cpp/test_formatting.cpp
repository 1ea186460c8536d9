#include <catch2/catch.hpp>
#include "formatting.hpp"
#include "sequential_solver.hpp"
#include "demo_instances.hpp"
#include "grouping.hpp"
#include "ranking.hpp"
#include "test_helpers.hpp"

#include <sstream>

// ============================================================================
// Text reporting
// ============================================================================

TEST_CASE("describeConflict names the slot and the courses", "[formatting]") {
    std::vector<Offering> catalog = {
            Offering("A", Category::REQUIRED, "01", 2, 3, {at(Day::MON, 1)}, false, false, "Prof. X"),
            Offering("B", Category::ELECTIVE, "01", 2, 3, {at(Day::MON, 1)}),
    };
    SlotConflict c{Day::MON, 1, {0, 1}};

    REQUIRE(describeConflict(catalog, c) == "Mon period 1: A (Prof. X), B");
}

TEST_CASE("Candidate listing shows a table per day", "[formatting]") {
    std::vector<Offering> catalog = {
            Offering("Algebra", Category::REQUIRED, "02", 3, 4,
                     {TimeSlot{Day::TUE, 3, "A101"}, TimeSlot{Day::MON, 1, ""}}, false, false, "Prof. Y"),
            Offering("Drawing", Category::ELECTIVE, "01", 1, 2, {at(Day::MON, 1)}),
    };
    ScheduleCandidate c = evaluateCandidate(catalog, {0, 1}, 0);

    std::ostringstream out;
    printCandidate(out, catalog, c, 1);
    std::string text = out.str();

    REQUIRE(text.find("#1") != std::string::npos);
    REQUIRE(text.find("conflicts=1") != std::string::npos);
    REQUIRE(text.find("Mon:") != std::string::npos);
    REQUIRE(text.find("Tue:") != std::string::npos);
    REQUIRE(text.find("Mon:") < text.find("Tue:"));
    REQUIRE(text.find("A101") != std::string::npos);
    REQUIRE(text.find("Elective") != std::string::npos);
    REQUIRE(text.find("Mon period 1: Algebra (Prof. Y), Drawing") != std::string::npos);
}

TEST_CASE("Result summary reports truncation and failures", "[formatting]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::S).listOfferings();

    SECTION("truncated run") {
        SequentialScheduleSolver solver(2);
        ScheduleResult r = solver.solve(catalog);

        std::ostringstream out;
        printScheduleResult(out, catalog, r, 5);
        std::string text = out.str();

        REQUIRE(text.find("State: DONE") != std::string::npos);
        REQUIRE(text.find("Warning") != std::string::npos);
        REQUIRE(text.find("Generated: 2") != std::string::npos);
    }

    SECTION("failed run") {
        ScheduleResult r = failedResult(MandatoryUnsatisfiable("Calculus"), RankingPolicy::CONFLICT_FIRST);

        std::ostringstream out;
        printScheduleResult(out, catalog, r, 5);

        REQUIRE(out.str().find("Mandatory course 'Calculus' has no available offering") != std::string::npos);
    }

    SECTION("top limits the listing") {
        SequentialScheduleSolver solver(100);
        ScheduleResult r = solver.solve(catalog);
        REQUIRE(r.clean.size() == 3);

        std::ostringstream out;
        printScheduleResult(out, catalog, r, 1);
        std::string text = out.str();

        REQUIRE(text.find("#1") != std::string::npos);
        REQUIRE(text.find("#2") == std::string::npos);
    }
}
