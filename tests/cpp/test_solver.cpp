#include <catch2/catch.hpp>
#include "sequential_solver.hpp"
#include "threaded_solver.hpp"
#include "demo_instances.hpp"
#include "enumerator.hpp"
#include "grouping.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>

// Same ranked order, compared by enumeration ordinal.
static std::vector<std::uint64_t> ordinals(const std::vector<ScheduleCandidate>& cs) {
    std::vector<std::uint64_t> out;
    for (const auto& c : cs) out.push_back(c.ordinal);
    return out;
}

static void waitUntilEvaluating(const ISolver& solver) {
    while (solver.state() != EngineState::EVALUATING) {
        std::this_thread::yield();
    }
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("Mandatory course colliding with another course", "[solver]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 3, 2, Category::REQUIRED, /*mandatory=*/true),
            makeOffering("B", {at(Day::MON, 1)}),
    };
    SequentialScheduleSolver solver(100);
    ScheduleResult r = solver.solve(catalog);

    REQUIRE(r.ok());
    REQUIRE(r.generated == 1);
    REQUIRE(r.clean.empty());
    REQUIRE(r.conflicting.size() == 1);
    REQUIRE(r.conflicting[0].conflictCount == 1);
    REQUIRE(r.conflicting[0].conflicts[0].day == Day::MON);
    REQUIRE(r.conflicting[0].conflicts[0].period == 1);
}

TEST_CASE("Excluded mandatory course fails the run", "[solver]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 3, 2, Category::REQUIRED, /*mandatory=*/true, /*excluded=*/true),
    };
    SequentialScheduleSolver solver(100);
    ScheduleResult r = solver.solve(catalog);

    REQUIRE(r.state == EngineState::FAILED);
    REQUIRE(solver.state() == EngineState::FAILED);
    REQUIRE(r.missingCourse == "A");
    REQUIRE(r.candidateCount() == 0);
    REQUIRE(r.generated == 0);
}

TEST_CASE("Cap of one truncates a larger product", "[solver]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 3, 2, Category::REQUIRED, false, false, "A1"),
            makeOffering("A", {at(Day::TUE, 1)}, 3, 2, Category::REQUIRED, false, false, "A2"),
    };
    SequentialScheduleSolver solver(1);
    ScheduleResult r = solver.solve(catalog);

    REQUIRE(r.ok());
    REQUIRE(r.generated == 1);
    REQUIRE(r.truncated);
    REQUIRE(r.productSize == 2);
}

TEST_CASE("Two compatible courses give one clean candidate", "[solver]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 5),
            makeOffering("B", {at(Day::TUE, 2)}, 1),
    };
    SequentialScheduleSolver solver(100);
    ScheduleResult r = solver.solve(catalog);

    REQUIRE(r.ok());
    REQUIRE(!r.truncated);
    REQUIRE(r.clean.size() == 1);
    REQUIRE(r.conflicting.empty());
    REQUIRE(r.clean[0].conflictCount == 0);
    REQUIRE(r.clean[0].totalPriority == 6);
}

TEST_CASE("Empty catalogs succeed with no candidates", "[solver]") {
    SequentialScheduleSolver solver(10);

    SECTION("no offerings") {
        ScheduleResult r = solver.solve({});
        REQUIRE(r.ok());
        REQUIRE(r.candidateCount() == 0);
        REQUIRE(!r.truncated);
    }

    SECTION("everything excluded") {
        std::vector<Offering> catalog = {
                makeOffering("A", {at(Day::MON, 1)}, 3, 2, Category::REQUIRED, false, /*excluded=*/true),
        };
        ScheduleResult r = solver.solve(catalog);
        REQUIRE(r.ok());
        REQUIRE(r.candidateCount() == 0);
    }
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("Candidate count is min(cap, product)", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::M).listOfferings();
    std::vector<OfferingGroup> groups = buildOfferingGroups(catalog);
    std::uint64_t product = CombinationEnumerator::computeProductSize(groups);
    REQUIRE(product == 2 * 2 * 1 * 3 * 2 * 2 * 2);

    for (std::uint64_t cap : {std::uint64_t(1), std::uint64_t(7), product - 1, product, product + 50}) {
        SequentialScheduleSolver solver(cap);
        ScheduleResult r = solver.solve(catalog);
        REQUIRE(r.generated == std::min(cap, product));
        REQUIRE(r.candidateCount() == std::min(cap, product));
        REQUIRE(r.truncated == (cap < product));
    }
}

TEST_CASE("Every candidate satisfies the metric invariants", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::M).listOfferings();
    SequentialScheduleSolver solver(10000);
    ScheduleResult r = solver.solve(catalog);

    std::set<std::vector<int>> unique;
    auto check = [&](const ScheduleCandidate& c) {
        REQUIRE(c.totalCredits == c.requiredCredits + c.electiveCredits);
        REQUIRE(c.conflictCount == (int)c.conflicts.size());

        // conflictCount == 0 iff no slot is shared.
        std::set<std::pair<int, int>> slots;
        bool collision = false;
        for (int idx : c.selection) {
            for (const TimeSlot& ts : catalog[idx].timeSlots) {
                if (!slots.insert({dayIndex(ts.day), ts.period}).second) collision = true;
            }
        }
        REQUIRE((c.conflictCount == 0) == !collision);

        // Mandatory courses are always present.
        bool hasCalculus = false;
        bool hasProgramming = false;
        for (int idx : c.selection) {
            if (catalog[idx].name == "Calculus") hasCalculus = true;
            if (catalog[idx].name == "Programming") hasProgramming = true;
            REQUIRE(!catalog[idx].excluded);
        }
        REQUIRE(hasCalculus);
        REQUIRE(hasProgramming);

        unique.insert(c.selection);
    };
    for (const auto& c : r.clean) check(c);
    for (const auto& c : r.conflicting) check(c);

    REQUIRE(unique.size() == r.candidateCount());
    REQUIRE(!r.clean.empty());
    REQUIRE(!r.conflicting.empty());
}

TEST_CASE("Ranked sets obey the policy order", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::M).listOfferings();

    SECTION("conflict-first") {
        SequentialScheduleSolver solver(10000, RankingPolicy::CONFLICT_FIRST);
        ScheduleResult r = solver.solve(catalog);
        const auto& cs = r.conflicting;
        for (size_t i = 1; i < cs.size(); ++i) {
            const auto& x = cs[i - 1];
            const auto& y = cs[i];
            REQUIRE((x.conflictCount < y.conflictCount ||
                     (x.conflictCount == y.conflictCount && x.totalPriority >= y.totalPriority)));
        }
    }

    SECTION("priority-first") {
        SequentialScheduleSolver solver(10000, RankingPolicy::PRIORITY_FIRST);
        ScheduleResult r = solver.solve(catalog);
        const auto& cs = r.conflicting;
        for (size_t i = 1; i < cs.size(); ++i) {
            const auto& x = cs[i - 1];
            const auto& y = cs[i];
            REQUIRE((x.totalPriority > y.totalPriority ||
                     (x.totalPriority == y.totalPriority && x.conflictCount <= y.conflictCount)));
        }
    }
}

TEST_CASE("Repeated runs give identical results", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::L).listOfferings();
    SequentialScheduleSolver solver(5000, RankingPolicy::PRIORITY_FIRST);

    ScheduleResult first = solver.solve(catalog);
    ScheduleResult second = solver.solve(catalog);

    REQUIRE(ordinals(first.clean) == ordinals(second.clean));
    REQUIRE(ordinals(first.conflicting) == ordinals(second.conflicting));
}

// ============================================================================
// Threaded backend
// ============================================================================

TEST_CASE("Threaded solver matches the sequential solver", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::L).listOfferings();

    for (RankingPolicy policy : {RankingPolicy::CONFLICT_FIRST, RankingPolicy::PRIORITY_FIRST}) {
        SequentialScheduleSolver seq(20000, policy);
        ThreadedScheduleSolver par(20000, 4, policy, 37);

        ScheduleResult a = seq.solve(catalog);
        ScheduleResult b = par.solve(catalog);

        REQUIRE(b.ok());
        REQUIRE(a.generated == b.generated);
        REQUIRE(a.truncated == b.truncated);
        REQUIRE(a.productSize == b.productSize);
        REQUIRE(ordinals(a.clean) == ordinals(b.clean));
        REQUIRE(ordinals(a.conflicting) == ordinals(b.conflicting));
    }
}

TEST_CASE("Threaded solver honors the cap", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::M).listOfferings();
    ThreadedScheduleSolver solver(10, 8, RankingPolicy::CONFLICT_FIRST, 3);
    ScheduleResult r = solver.solve(catalog);

    REQUIRE(r.generated == 10);
    REQUIRE(r.candidateCount() == 10);
    REQUIRE(r.truncated);

    std::set<std::uint64_t> seen;
    for (const auto& c : r.clean) seen.insert(c.ordinal);
    for (const auto& c : r.conflicting) seen.insert(c.ordinal);
    REQUIRE(seen.size() == 10);
    REQUIRE(*seen.rbegin() == 9);
}

TEST_CASE("Threaded solver reports failures", "[solver]") {
    std::vector<Offering> catalog = {
            makeOffering("A", {at(Day::MON, 1)}, 3, 2, Category::REQUIRED, /*mandatory=*/true, /*excluded=*/true),
            makeOffering("B", {at(Day::MON, 1)}),
    };
    ThreadedScheduleSolver solver(10, 2);
    ScheduleResult r = solver.solve(catalog);
    REQUIRE(r.state == EngineState::FAILED);
    REQUIRE(r.missingCourse == "A");
}

TEST_CASE("Solvers reject invalid configuration", "[solver]") {
    REQUIRE_THROWS_AS(SequentialScheduleSolver(0), std::invalid_argument);
    REQUIRE_THROWS_AS(ThreadedScheduleSolver(0, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(ThreadedScheduleSolver(10, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(ThreadedScheduleSolver(10, 2, RankingPolicy::CONFLICT_FIRST, 0), std::invalid_argument);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Solver state follows the run", "[solver]") {
    SequentialScheduleSolver solver(5);
    REQUIRE(solver.state() == EngineState::IDLE);

    solver.solve(makeDemoCatalog(DemoSize::S).listOfferings());
    REQUIRE(solver.state() == EngineState::DONE);
}

TEST_CASE("stop() cancels a running sequential solve", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::XL).listOfferings();
    SequentialScheduleSolver solver(1000000);

    auto run = std::async(std::launch::async, [&]() { return solver.solve(catalog); });
    waitUntilEvaluating(solver);
    solver.stop();
    ScheduleResult r = run.get();

    REQUIRE(r.state == EngineState::CANCELLED);
    REQUIRE(solver.state() == EngineState::CANCELLED);
    REQUIRE(r.candidateCount() == 0);
}

TEST_CASE("stop() cancels a running threaded solve", "[solver]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::XL).listOfferings();
    ThreadedScheduleSolver solver(300000, 2);

    auto run = std::async(std::launch::async, [&]() { return solver.solve(catalog); });
    waitUntilEvaluating(solver);
    solver.stop();
    ScheduleResult r = run.get();

    REQUIRE(r.state == EngineState::CANCELLED);
    REQUIRE(r.candidateCount() == 0);

    SECTION("the next run starts fresh") {
        ScheduleResult again = solver.solve(makeDemoCatalog(DemoSize::S).listOfferings());
        REQUIRE(again.ok());
        REQUIRE(again.generated == 4);
    }
}

TEST_CASE("An exception leaving a run marks it FAILED", "[solver]") {
    std::atomic<EngineState> state{EngineState::IDLE};

    SECTION("exception path") {
        auto run = [&state]() {
            EvaluationGuard running(state);
            REQUIRE(state.load() == EngineState::EVALUATING);
            throw std::runtime_error("device lost");
        };
        REQUIRE_THROWS_AS(run(), std::runtime_error);
        REQUIRE(state.load() == EngineState::FAILED);
    }

    SECTION("normal exits keep their final state") {
        {
            EvaluationGuard running(state);
            state = EngineState::CANCELLED;
        }
        REQUIRE(state.load() == EngineState::CANCELLED);

        {
            EvaluationGuard running(state);
            state = EngineState::DONE;
        }
        REQUIRE(state.load() == EngineState::DONE);
    }
}
