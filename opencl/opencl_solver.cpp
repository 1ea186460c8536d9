///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include "conflicts.hpp"
#include "enumerator.hpp"
#include "grouping.hpp"
#include "ranking.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the OpenCL solver; the device context is created here.
 */
OpenCLScheduleSolver::OpenCLScheduleSolver(std::uint64_t maxCandidates, int batchSize, RankingPolicy policy)
        : maxCandidates_(maxCandidates),
          batchSize_(batchSize),
          policy_(policy) {
    if (maxCandidates_ == 0) {
        throw std::invalid_argument("maxCandidates must be a positive integer");
    }
    if (batchSize_ < 1) {
        throw std::invalid_argument("batchSize must be at least 1");
    }
}

/**
 * @brief Send the accumulated batch of selections to the device.
 *
 * Metrics come from the kernel; conflicting candidates get their conflict
 * list from the host-side occupancy index, which must agree with the
 * kernel's count.
 */
void OpenCLScheduleSolver::flushBatch(const std::vector<Offering>& catalog) {
    if (batch_.empty()) return;

    std::vector<int> conflictCounts;
    std::vector<int> totalPriorities;
    std::vector<int> totalCredits;
    std::vector<int> requiredCredits;

    clctx_.evaluateBatch(catalog, batch_, conflictCounts, totalPriorities, totalCredits, requiredCredits);

    for (size_t i = 0; i < batch_.size(); ++i) {
        ScheduleCandidate c;
        c.selection = std::move(batch_[i]);
        c.ordinal = batchOrdinals_[i];
        c.totalPriority = totalPriorities[i];
        c.totalCredits = totalCredits[i];
        c.requiredCredits = requiredCredits[i];
        c.electiveCredits = totalCredits[i] - requiredCredits[i];
        c.conflictCount = conflictCounts[i];

        if (c.conflictCount > 0) {
            c.conflicts = detectConflicts(catalog, c.selection);
            if ((int)c.conflicts.size() != c.conflictCount) {
                std::stringstream ss;
                ss << "OpenCL conflict count " << c.conflictCount << " disagrees with host count "
                   << c.conflicts.size() << " for ordinal " << c.ordinal;
                throw std::runtime_error(ss.str());
            }
        }
        candidates_.push_back(std::move(c));
    }

    batch_.clear();
    batchOrdinals_.clear();
}

/**
 * @brief Run the CPU enumeration + device evaluation pipeline.
 *
 * Feasibility is checked first; selections are then produced lazily,
 * flushed to the device every batchSize_ selections and once more at the
 * end, and finally ranked.
 */
ScheduleResult OpenCLScheduleSolver::solve(const std::vector<Offering>& catalog) {
    stopped_ = false;
    EvaluationGuard running(state_);
    batch_.clear();
    batchOrdinals_.clear();
    candidates_.clear();

    std::vector<OfferingGroup> groups;
    try {
        groups = buildOfferingGroups(catalog);
    } catch (const MandatoryUnsatisfiable& e) {
        if (verbose_) std::cerr << "OpenCLScheduleSolver: " << e.what() << "\n";
        state_ = EngineState::FAILED;
        return failedResult(e, policy_);
    }

    CombinationEnumerator enumerator(groups, maxCandidates_);
    if (verbose_) {
        std::cerr << "OpenCLScheduleSolver: device=" << clctx_.deviceName()
                  << ", batchSize=" << batchSize_
                  << ", productSize=" << enumerator.productSize()
                  << ", planned=" << enumerator.plannedCount()
                  << (enumerator.willTruncate() ? " (truncated)" : "") << "\n";
    }

    std::vector<int> selection;
    while (enumerator.next(selection)) {
        if (stopped_) {
            batch_.clear();
            batchOrdinals_.clear();
            candidates_.clear();
            state_ = EngineState::CANCELLED;
            return cancelledResult(policy_, enumerator.productSize());
        }
        batch_.push_back(selection);
        batchOrdinals_.push_back(enumerator.lastOrdinal());

        // When we reach batchSize_, push work to the device.
        if ((int)batch_.size() >= batchSize_) {
            flushBatch(catalog);
        }
    }

    // Evaluate any remaining selections that did not trigger a flush.
    flushBatch(catalog);

    ScheduleResult result = assembleResult(std::move(candidates_), policy_,
                                           enumerator.truncated(), enumerator.productSize());
    candidates_.clear();
    state_ = EngineState::DONE;
    return result;
}
