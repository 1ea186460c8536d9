#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "enumerator.hpp"
#include <atomic>
#include <cstdint>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded schedule solver.
 *
 * The ordinal range [0, plannedCount) of the bounded product is shared by
 * all worker threads through one atomic cursor: each worker claims the next
 * chunk of ordinals, decodes them into selections, evaluates them and
 * stores each candidate at its ordinal. The cursor is the only cap, so the
 * total never exceeds maxCandidates regardless of the thread count. Workers
 * are joined before ranking, which makes the result identical to the
 * sequential solver's.
 */
class ThreadedScheduleSolver : public ISolver {
public:
    /**
     * @brief Create a threaded solver.
     *
     * @param maxCandidates Hard cap on evaluated candidates (> 0).
     * @param numThreads    Number of worker threads (>= 1).
     * @param policy        Ranking policy applied to the result sets.
     * @param chunkSize     Ordinals claimed per cursor increment (>= 1).
     * @throws std::invalid_argument on a zero cap, thread count or chunk size.
     */
    ThreadedScheduleSolver(std::uint64_t maxCandidates,
                           int numThreads,
                           RankingPolicy policy = RankingPolicy::CONFLICT_FIRST,
                           std::uint64_t chunkSize = 64);

    /**
     * @brief Solve the given catalog with the worker pool.
     *
     * @param catalog Offering snapshot, read-only for the whole run.
     * @return Ranked result; FAILED on pre-check failure, CANCELLED if stopped.
     */
    ScheduleResult solve(const std::vector<Offering>& catalog) override;

    /**
     * @brief Evaluate the ordinals [begin, end) with the worker pool.
     *
     * Building block of solve(), also used by the MPI backend to evaluate
     * one rank's block. Candidates come back in ordinal order; the result
     * is shorter than end - begin only if stop() interrupted the run.
     *
     * @param catalog    Offering snapshot.
     * @param enumerator Enumerator over the catalog's groups (decode only).
     * @param begin      First ordinal, inclusive.
     * @param end        Last ordinal, exclusive; <= enumerator.plannedCount().
     */
    std::vector<ScheduleCandidate> evaluateRange(const std::vector<Offering>& catalog,
                                                 const CombinationEnumerator& enumerator,
                                                 std::uint64_t begin,
                                                 std::uint64_t end);

    void stop() override { stopped_ = true; }
    EngineState state() const override { return state_; }

    /// True if stop() was called since the last run started.
    bool isStopped() const { return stopped_; }

    /// Clear the stop flag (solve() does this itself).
    void resetStop() { stopped_ = false; }

    /// Print progress diagnostics to stderr.
    void setVerbose(bool enabled) { verbose_ = enabled; }

private:
    std::uint64_t maxCandidates_; ///< Global cap shared by all workers.
    int numThreads_;              ///< Number of worker threads.
    RankingPolicy policy_;        ///< Ordering of both result sets.
    std::uint64_t chunkSize_;     ///< Ordinals claimed per fetch.

    // Shared state across workers
    std::atomic<std::uint64_t> cursor_{0}; ///< Next unclaimed ordinal.
    std::atomic<bool> stopped_{false};     ///< Signals early termination to all threads.
    std::atomic<EngineState> state_{EngineState::IDLE};
    bool verbose_ = false;

    /**
     * @brief Worker loop: claim chunks, decode and evaluate until the range is used up.
     *
     * @param catalog    Offering snapshot.
     * @param enumerator Provides decode().
     * @param begin      First ordinal of the range; slots[0] belongs to it.
     * @param end        End of the range (exclusive).
     * @param slots      Output, one entry per ordinal of the range.
     * @return Number of candidates this worker evaluated.
     */
    std::uint64_t work(const std::vector<Offering>& catalog,
                       const CombinationEnumerator& enumerator,
                       std::uint64_t begin,
                       std::uint64_t end,
                       std::vector<ScheduleCandidate>& slots);
};
