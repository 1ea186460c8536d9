#include <catch2/catch.hpp>
#include "candidate_buffer.hpp"
#include "demo_instances.hpp"
#include "sequential_solver.hpp"

#include <limits>
#include <stdexcept>

// ============================================================================
// Candidate buffer exchanged between MPI ranks
// ============================================================================

static void requireSameCandidate(const ScheduleCandidate& a, const ScheduleCandidate& b) {
    REQUIRE(a.ordinal == b.ordinal);
    REQUIRE(a.selection == b.selection);
    REQUIRE(a.totalCredits == b.totalCredits);
    REQUIRE(a.requiredCredits == b.requiredCredits);
    REQUIRE(a.electiveCredits == b.electiveCredits);
    REQUIRE(a.totalPriority == b.totalPriority);
    REQUIRE(a.conflictCount == b.conflictCount);
    REQUIRE(a.conflicts.size() == b.conflicts.size());
    for (size_t i = 0; i < a.conflicts.size(); ++i) {
        REQUIRE(a.conflicts[i].day == b.conflicts[i].day);
        REQUIRE(a.conflicts[i].period == b.conflicts[i].period);
        REQUIRE(a.conflicts[i].offeringIndices == b.conflicts[i].offeringIndices);
    }
}

TEST_CASE("Solved candidates survive the buffer unchanged", "[buffer]") {
    std::vector<Offering> catalog = makeDemoCatalog(DemoSize::M).listOfferings();
    SequentialScheduleSolver solver(1000);
    ScheduleResult r = solver.solve(catalog);

    std::vector<ScheduleCandidate> sent = r.conflicting;
    sent.insert(sent.end(), r.clean.begin(), r.clean.end());
    REQUIRE(!r.conflicting.empty());

    std::vector<long long> buf;
    serializeCandidates(sent, buf);

    std::vector<ScheduleCandidate> received;
    deserializeCandidates(buf, received);

    REQUIRE(received.size() == sent.size());
    for (size_t i = 0; i < sent.size(); ++i) {
        requireSameCandidate(sent[i], received[i]);
    }
}

TEST_CASE("Deserializing appends to existing candidates", "[buffer]") {
    ScheduleCandidate c;
    c.ordinal = 41;
    c.selection = {3, 1};
    c.totalCredits = 5;

    std::vector<long long> buf;
    serializeCandidates({c}, buf);

    std::vector<ScheduleCandidate> out(2);
    deserializeCandidates(buf, out);
    REQUIRE(out.size() == 3);
    REQUIRE(out[2].ordinal == 41);
    REQUIRE(out[2].selection == std::vector<int>{3, 1});
}

TEST_CASE("Empty and malformed buffers", "[buffer]") {
    std::vector<ScheduleCandidate> out;

    SECTION("no candidates gives an empty buffer") {
        std::vector<long long> buf = {1, 2, 3};
        serializeCandidates({}, buf);
        REQUIRE(buf.empty());
        deserializeCandidates(buf, out);
        REQUIRE(out.empty());
    }

    SECTION("truncated buffer") {
        ScheduleCandidate c;
        c.selection = {0, 1, 2};
        std::vector<long long> buf;
        serializeCandidates({c}, buf);
        buf.pop_back();
        REQUIRE_THROWS_AS(deserializeCandidates(buf, out), std::runtime_error);
    }

    SECTION("day outside the week") {
        // ordinal, credits x3, priority, 0 selections, 1 conflict on day 9
        std::vector<long long> buf = {0, 0, 0, 0, 0, 0, 1, 9, 1, 0};
        REQUIRE_THROWS_AS(deserializeCandidates(buf, out), std::runtime_error);
    }

    SECTION("negative length") {
        std::vector<long long> buf = {0, 0, 0, 0, 0, -1};
        REQUIRE_THROWS_AS(deserializeCandidates(buf, out), std::runtime_error);
    }
}

TEST_CASE("Message counts must fit in an int", "[buffer]") {
    REQUIRE(messageCount(0) == 0);
    REQUIRE(messageCount(12345) == 12345);
    REQUIRE(messageCount(std::numeric_limits<int>::max()) == std::numeric_limits<int>::max());
    REQUIRE_THROWS_AS(messageCount((long long)std::numeric_limits<int>::max() + 1), std::runtime_error);
    REQUIRE_THROWS_AS(messageCount(-1), std::runtime_error);
}
