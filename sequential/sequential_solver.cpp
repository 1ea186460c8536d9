///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "enumerator.hpp"
#include "grouping.hpp"
#include "ranking.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct a sequential solver with a candidate cap.
 *
 * @param maxCandidates Maximum number of candidates to evaluate.
 * @param policy        Ranking policy of the result.
 */
SequentialScheduleSolver::SequentialScheduleSolver(std::uint64_t maxCandidates, RankingPolicy policy)
        : maxCandidates_(maxCandidates),
          policy_(policy) {
    if (maxCandidates_ == 0) {
        throw std::invalid_argument("maxCandidates must be a positive integer");
    }
}

/**
 * @brief Run pre-check, enumeration, evaluation and ranking.
 *
 * Feasibility is checked before any selection is produced. Selections are
 * evaluated one by one in enumeration order until the product is exhausted
 * or the cap is reached; the candidates are ranked afterwards.
 */
ScheduleResult SequentialScheduleSolver::solve(const std::vector<Offering>& catalog) {
    stopped_ = false;
    EvaluationGuard running(state_);

    std::vector<OfferingGroup> groups;
    try {
        groups = buildOfferingGroups(catalog);
    } catch (const MandatoryUnsatisfiable& e) {
        if (verbose_) std::cerr << "SequentialScheduleSolver: " << e.what() << "\n";
        state_ = EngineState::FAILED;
        return failedResult(e, policy_);
    }

    CombinationEnumerator enumerator(groups, maxCandidates_);
    if (verbose_) {
        std::cerr << "SequentialScheduleSolver: groups=" << groups.size()
                  << ", productSize=" << enumerator.productSize()
                  << ", planned=" << enumerator.plannedCount()
                  << (enumerator.willTruncate() ? " (truncated)" : "") << "\n";
    }

    std::vector<ScheduleCandidate> candidates;

    std::vector<int> selection;
    while (enumerator.next(selection)) {
        if (stopped_) {
            state_ = EngineState::CANCELLED;
            return cancelledResult(policy_, enumerator.productSize());
        }
        candidates.push_back(evaluateCandidate(catalog, selection, enumerator.lastOrdinal()));
    }

    ScheduleResult result = assembleResult(std::move(candidates), policy_,
                                           enumerator.truncated(), enumerator.productSize());
    state_ = EngineState::DONE;
    return result;
}
