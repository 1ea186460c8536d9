#include <catch2/catch.hpp>
#include "ranking.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

static ScheduleCandidate candidate(int conflicts, int priority, int credits, std::uint64_t ordinal) {
    ScheduleCandidate c;
    c.conflictCount = conflicts;
    c.totalPriority = priority;
    c.totalCredits = credits;
    c.ordinal = ordinal;
    return c;
}

// ============================================================================
// Metrics
// ============================================================================

TEST_CASE("evaluateCandidate sums credits and priorities", "[ranking]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 5, 4, Category::REQUIRED),
            makeOffering("B", {at(Day::MON, 1)}, 2, 3, Category::ELECTIVE),
            makeOffering("C", {at(Day::TUE, 3)}, 1, 1, Category::REQUIRED),
    };
    ScheduleCandidate c = evaluateCandidate(catalog, {0, 1, 2}, 7);

    REQUIRE(c.ordinal == 7);
    REQUIRE(c.selection == std::vector<int>{0, 1, 2});
    REQUIRE(c.totalPriority == 8);
    REQUIRE(c.totalCredits == 8);
    REQUIRE(c.requiredCredits == 5);
    REQUIRE(c.electiveCredits == 3);
    REQUIRE(c.totalCredits == c.requiredCredits + c.electiveCredits);
    REQUIRE(c.conflictCount == 1);
    REQUIRE(c.conflicts.size() == 1);
}

TEST_CASE("Credit sums stay exact at the credit bound", "[ranking]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 5, MAX_CREDITS, Category::REQUIRED),
            makeOffering("B", {at(Day::TUE, 1)}, 5, MAX_CREDITS, Category::ELECTIVE),
            makeOffering("C", {at(Day::WED, 1)}, 5, MAX_CREDITS, Category::REQUIRED),
    };
    ScheduleCandidate c = evaluateCandidate(catalog, {0, 1, 2}, 0);

    REQUIRE(c.totalCredits == 3 * MAX_CREDITS);
    REQUIRE(c.requiredCredits == 2 * MAX_CREDITS);
    REQUIRE(c.electiveCredits == MAX_CREDITS);
    REQUIRE(c.totalCredits == c.requiredCredits + c.electiveCredits);
}

// ============================================================================
// Policies
// ============================================================================

TEST_CASE("Conflict-first ranks fewer conflicts first", "[ranking]") {
    std::vector<ScheduleCandidate> cs = {
            candidate(2, 10, 0, 0),
            candidate(0, 1, 0, 1),
            candidate(1, 5, 0, 2),
            candidate(0, 4, 0, 3),
    };
    rankCandidates(cs, RankingPolicy::CONFLICT_FIRST);

    REQUIRE(cs[0].ordinal == 3);
    REQUIRE(cs[1].ordinal == 1);
    REQUIRE(cs[2].ordinal == 2);
    REQUIRE(cs[3].ordinal == 0);
}

TEST_CASE("Priority-first ranks higher priority first", "[ranking]") {
    std::vector<ScheduleCandidate> cs = {
            candidate(2, 10, 0, 0),
            candidate(0, 1, 0, 1),
            candidate(1, 10, 0, 2),
    };
    rankCandidates(cs, RankingPolicy::PRIORITY_FIRST);

    REQUIRE(cs[0].ordinal == 2);
    REQUIRE(cs[1].ordinal == 0);
    REQUIRE(cs[2].ordinal == 1);
}

TEST_CASE("Ties go to credits, then enumeration order", "[ranking]") {
    ScheduleCandidate a = candidate(0, 5, 10, 4);
    ScheduleCandidate b = candidate(0, 5, 12, 9);
    ScheduleCandidate c = candidate(0, 5, 12, 2);

    REQUIRE(rankedBefore(b, a, RankingPolicy::CONFLICT_FIRST));
    REQUIRE(rankedBefore(c, b, RankingPolicy::CONFLICT_FIRST));
    REQUIRE(!rankedBefore(b, c, RankingPolicy::PRIORITY_FIRST));
    REQUIRE(!rankedBefore(c, c, RankingPolicy::PRIORITY_FIRST));
}

// ============================================================================
// Result assembly
// ============================================================================

TEST_CASE("assembleResult splits clean and conflicting candidates", "[ranking]") {
    std::vector<ScheduleCandidate> cs = {
            candidate(1, 3, 0, 0),
            candidate(0, 2, 0, 1),
            candidate(0, 4, 0, 2),
    };
    ScheduleResult r = assembleResult(cs, RankingPolicy::CONFLICT_FIRST, true, 99);

    REQUIRE(r.ok());
    REQUIRE(r.truncated);
    REQUIRE(r.productSize == 99);
    REQUIRE(r.generated == 3);
    REQUIRE(r.candidateCount() == 3);
    REQUIRE(r.clean.size() == 2);
    REQUIRE(r.clean[0].ordinal == 2);
    REQUIRE(r.conflicting.size() == 1);
}

TEST_CASE("failedResult carries the missing course", "[ranking]") {
    ScheduleResult r = failedResult(MandatoryUnsatisfiable("Physics"), RankingPolicy::PRIORITY_FIRST);

    REQUIRE(r.state == EngineState::FAILED);
    REQUIRE(!r.ok());
    REQUIRE(r.missingCourse == "Physics");
    REQUIRE(r.failureReason == "Mandatory course 'Physics' has no available offering");
    REQUIRE(r.candidateCount() == 0);
}

TEST_CASE("Policy and state names", "[ranking]") {
    REQUIRE(parsePolicy("conflict") == RankingPolicy::CONFLICT_FIRST);
    REQUIRE(parsePolicy("priority-first") == RankingPolicy::PRIORITY_FIRST);
    REQUIRE(parsePolicy("B") == RankingPolicy::PRIORITY_FIRST);
    REQUIRE_THROWS_AS(parsePolicy("random"), std::invalid_argument);
    REQUIRE(policyName(RankingPolicy::CONFLICT_FIRST) == "conflict-first");
    REQUIRE(stateName(EngineState::CANCELLED) == "CANCELLED");
}
