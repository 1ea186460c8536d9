///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "grouping.hpp"
#include "ranking.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the threaded solver with given limits.
 *
 * Validates configuration; per-run state is reset in solve().
 */
ThreadedScheduleSolver::ThreadedScheduleSolver(std::uint64_t maxCandidates,
                                               int numThreads,
                                               RankingPolicy policy,
                                               std::uint64_t chunkSize)
        : maxCandidates_(maxCandidates),
          numThreads_(numThreads),
          policy_(policy),
          chunkSize_(chunkSize) {
    if (maxCandidates_ == 0) {
        throw std::invalid_argument("maxCandidates must be a positive integer");
    }
    if (numThreads_ < 1) {
        throw std::invalid_argument("numThreads must be at least 1");
    }
    if (chunkSize_ == 0) {
        throw std::invalid_argument("chunkSize must be at least 1");
    }
}

/**
 * @brief Entry point for solving a catalog.
 *
 * Runs the pre-check on the calling thread, evaluates the whole planned
 * range with the worker pool and ranks the collected candidates.
 */
ScheduleResult ThreadedScheduleSolver::solve(const std::vector<Offering>& catalog) {
    stopped_ = false;
    EvaluationGuard running(state_);

    std::vector<OfferingGroup> groups;
    try {
        groups = buildOfferingGroups(catalog);
    } catch (const MandatoryUnsatisfiable& e) {
        if (verbose_) std::cerr << "ThreadedScheduleSolver: " << e.what() << "\n";
        state_ = EngineState::FAILED;
        return failedResult(e, policy_);
    }

    CombinationEnumerator enumerator(groups, maxCandidates_);
    if (verbose_) {
        std::cerr << "ThreadedScheduleSolver: groups=" << groups.size()
                  << ", productSize=" << enumerator.productSize()
                  << ", planned=" << enumerator.plannedCount()
                  << ", threads=" << numThreads_
                  << (enumerator.willTruncate() ? " (truncated)" : "") << "\n";
    }

    std::vector<ScheduleCandidate> candidates = evaluateRange(catalog, enumerator, 0, enumerator.plannedCount());

    if (stopped_) {
        state_ = EngineState::CANCELLED;
        return cancelledResult(policy_, enumerator.productSize());
    }

    ScheduleResult result = assembleResult(std::move(candidates), policy_,
                                           enumerator.willTruncate(), enumerator.productSize());
    state_ = EngineState::DONE;
    return result;
}

/**
 * @brief Evaluate a contiguous ordinal range with std::async workers.
 *
 * Each ordinal owns one slot of the output vector, so workers write
 * disjoint entries without locking. All workers are joined before the
 * slots are read.
 */
std::vector<ScheduleCandidate> ThreadedScheduleSolver::evaluateRange(const std::vector<Offering>& catalog,
                                                                     const CombinationEnumerator& enumerator,
                                                                     std::uint64_t begin,
                                                                     std::uint64_t end) {
    if (end > enumerator.plannedCount() || begin > end) {
        throw std::out_of_range("Ordinal range outside of the planned enumeration");
    }
    std::vector<ScheduleCandidate> slots((size_t)(end - begin));
    if (slots.empty()) return slots;

    cursor_ = begin;

    // No point starting more workers than there are chunks.
    std::uint64_t chunks = (end - begin + chunkSize_ - 1) / chunkSize_;
    int workers = (int)std::min<std::uint64_t>((std::uint64_t)numThreads_, chunks);

    std::vector<std::future<std::uint64_t>> tasks;
    for (int t = 0; t < workers; ++t) {
        tasks.push_back(std::async(std::launch::async,
                                   [this, &catalog, &enumerator, begin, end, &slots]() {
                                       return this->work(catalog, enumerator, begin, end, slots);
                                   }));
    }

    // wait() joins everyone first; get() then rethrows any worker exception.
    for (auto& t : tasks) t.wait();
    std::uint64_t evaluated = 0;
    for (auto& t : tasks) evaluated += t.get();

    if (evaluated != slots.size()) {
        // Interrupted by stop(): the tail of the range was never evaluated.
        slots.clear();
    }
    return slots;
}

/**
 * @brief Claim and evaluate chunks of ordinals from the shared cursor.
 *
 * fetch_add hands out disjoint chunks; anything at or past the end of the
 * range is discarded, so the cap holds across all workers.
 */
std::uint64_t ThreadedScheduleSolver::work(const std::vector<Offering>& catalog,
                                           const CombinationEnumerator& enumerator,
                                           std::uint64_t begin,
                                           std::uint64_t end,
                                           std::vector<ScheduleCandidate>& slots) {
    std::uint64_t evaluated = 0;
    std::vector<int> selection;

    while (!stopped_) {
        std::uint64_t first = cursor_.fetch_add(chunkSize_);
        if (first >= end) break;
        std::uint64_t last = std::min(end, first + chunkSize_);

        for (std::uint64_t ordinal = first; ordinal < last; ++ordinal) {
            if (stopped_) break;
            enumerator.decode(ordinal, selection);
            slots[(size_t)(ordinal - begin)] = evaluateCandidate(catalog, selection, ordinal);
            ++evaluated;
        }
    }
    return evaluated;
}
