///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "ranking.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>


///////////////////////////
///       METRICS       ///
///////////////////////////
void computeMetrics(const std::vector<Offering>& catalog, ScheduleCandidate& candidate) {
    candidate.totalCredits = 0;
    candidate.requiredCredits = 0;
    candidate.electiveCredits = 0;
    candidate.totalPriority = 0;
    for (int idx : candidate.selection) {
        const Offering& o = catalog[idx];
        candidate.totalCredits += o.credits;
        candidate.totalPriority += o.priority;
        if (o.category == Category::REQUIRED) {
            candidate.requiredCredits += o.credits;
        } else {
            candidate.electiveCredits += o.credits;
        }
    }
}

ScheduleCandidate evaluateCandidate(const std::vector<Offering>& catalog,
                                    const std::vector<int>& selection,
                                    std::uint64_t ordinal) {
    ScheduleCandidate candidate;
    candidate.selection = selection;
    candidate.ordinal = ordinal;
    computeMetrics(catalog, candidate);

    SlotOccupancy occupancy(catalog);
    occupancy.occupyAll(selection);
    candidate.conflicts = occupancy.conflicts();
    candidate.conflictCount = (int)candidate.conflicts.size();
    return candidate;
}


///////////////////////////
///       RANKING       ///
///////////////////////////
bool rankedBefore(const ScheduleCandidate& a, const ScheduleCandidate& b, RankingPolicy policy) {
    if (policy == RankingPolicy::CONFLICT_FIRST) {
        if (a.conflictCount != b.conflictCount) return a.conflictCount < b.conflictCount;
        if (a.totalPriority != b.totalPriority) return a.totalPriority > b.totalPriority;
    } else {
        if (a.totalPriority != b.totalPriority) return a.totalPriority > b.totalPriority;
        if (a.conflictCount != b.conflictCount) return a.conflictCount < b.conflictCount;
    }
    if (a.totalCredits != b.totalCredits) return a.totalCredits > b.totalCredits;
    return a.ordinal < b.ordinal;
}

void rankCandidates(std::vector<ScheduleCandidate>& candidates, RankingPolicy policy) {
    std::sort(candidates.begin(), candidates.end(),
              [policy](const ScheduleCandidate& a, const ScheduleCandidate& b) {
                  return rankedBefore(a, b, policy);
              });
}

ScheduleResult assembleResult(std::vector<ScheduleCandidate> candidates,
                              RankingPolicy policy,
                              bool truncated,
                              std::uint64_t productSize) {
    ScheduleResult result;
    result.state = EngineState::DONE;
    result.policy = policy;
    result.truncated = truncated;
    result.productSize = productSize;
    result.generated = candidates.size();

    for (ScheduleCandidate& c : candidates) {
        if (c.conflictCount == 0) {
            result.clean.push_back(std::move(c));
        } else {
            result.conflicting.push_back(std::move(c));
        }
    }
    rankCandidates(result.clean, policy);
    rankCandidates(result.conflicting, policy);
    return result;
}

ScheduleResult failedResult(const MandatoryUnsatisfiable& error, RankingPolicy policy) {
    ScheduleResult result;
    result.state = EngineState::FAILED;
    result.policy = policy;
    result.failureReason = error.what();
    result.missingCourse = error.courseName();
    return result;
}

ScheduleResult cancelledResult(RankingPolicy policy, std::uint64_t productSize) {
    ScheduleResult result;
    result.state = EngineState::CANCELLED;
    result.policy = policy;
    result.productSize = productSize;
    return result;
}

std::string policyName(RankingPolicy policy) {
    switch (policy) {
        case RankingPolicy::CONFLICT_FIRST: return "conflict-first";
        case RankingPolicy::PRIORITY_FIRST: return "priority-first";
    }
    return "unknown";
}

RankingPolicy parsePolicy(const std::string& text) {
    if (text == "conflict" || text == "conflict-first" || text == "A") {
        return RankingPolicy::CONFLICT_FIRST;
    }
    if (text == "priority" || text == "priority-first" || text == "B") {
        return RankingPolicy::PRIORITY_FIRST;
    }
    throw std::invalid_argument("Unknown ranking policy '" + text + "'");
}

std::string stateName(EngineState state) {
    switch (state) {
        case EngineState::IDLE:       return "IDLE";
        case EngineState::EVALUATING: return "EVALUATING";
        case EngineState::DONE:       return "DONE";
        case EngineState::FAILED:     return "FAILED";
        case EngineState::CANCELLED:  return "CANCELLED";
    }
    return "UNKNOWN";
}
