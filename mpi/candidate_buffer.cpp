///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "candidate_buffer.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>


///////////////////////////
///   CANDIDATE BUFFER  ///
///////////////////////////
void serializeCandidates(const std::vector<ScheduleCandidate>& candidates, std::vector<long long>& buffer) {
    buffer.clear();
    for (const ScheduleCandidate& c : candidates) {
        buffer.push_back((long long)c.ordinal);
        buffer.push_back(c.totalCredits);
        buffer.push_back(c.requiredCredits);
        buffer.push_back(c.electiveCredits);
        buffer.push_back(c.totalPriority);
        buffer.push_back((long long)c.selection.size());
        for (int idx : c.selection) buffer.push_back(idx);
        buffer.push_back((long long)c.conflicts.size());
        for (const SlotConflict& sc : c.conflicts) {
            buffer.push_back(dayIndex(sc.day));
            buffer.push_back(sc.period);
            buffer.push_back((long long)sc.offeringIndices.size());
            for (int idx : sc.offeringIndices) buffer.push_back(idx);
        }
    }
}

/**
 * @brief Deserialize a flat integer buffer into candidates.
 *
 * Walks the buffer with a read cursor; reading past the end means the
 * sender and receiver disagree on the layout and raises.
 */
void deserializeCandidates(const std::vector<long long>& buffer, std::vector<ScheduleCandidate>& candidates) {
    size_t pos = 0;
    auto take = [&buffer, &pos]() -> long long {
        if (pos >= buffer.size()) {
            throw std::runtime_error("Truncated candidate buffer received via MPI");
        }
        return buffer[pos++];
    };
    auto takeLength = [&take]() -> long long {
        long long n = take();
        if (n < 0) throw std::runtime_error("Negative length in candidate buffer received via MPI");
        return n;
    };

    while (pos < buffer.size()) {
        ScheduleCandidate c;
        c.ordinal = (std::uint64_t)take();
        c.totalCredits = (int)take();
        c.requiredCredits = (int)take();
        c.electiveCredits = (int)take();
        c.totalPriority = (int)take();

        long long selectionSize = takeLength();
        for (long long i = 0; i < selectionSize; ++i) c.selection.push_back((int)take());

        long long conflictCount = takeLength();
        for (long long i = 0; i < conflictCount; ++i) {
            SlotConflict sc;
            long long day = take();
            if (day < 0 || day >= DAYS) {
                throw std::runtime_error("Invalid day in candidate buffer received via MPI");
            }
            sc.day = static_cast<Day>(day);
            sc.period = (int)take();
            long long occupants = takeLength();
            for (long long j = 0; j < occupants; ++j) sc.offeringIndices.push_back((int)take());
            c.conflicts.push_back(std::move(sc));
        }
        c.conflictCount = (int)c.conflicts.size();
        candidates.push_back(std::move(c));
    }
}

int messageCount(long long length) {
    if (length < 0 || length > (long long)std::numeric_limits<int>::max()) {
        std::stringstream ss;
        ss << "Candidate buffer of " << length << " elements cannot be sent in one MPI message";
        throw std::runtime_error(ss.str());
    }
    return (int)length;
}
