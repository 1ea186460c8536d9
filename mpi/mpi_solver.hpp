#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "../threads/threaded_solver.hpp"
#include "candidate_buffer.hpp"
#include <atomic>
#include <cstdint>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI-distributed wrapper around the threaded schedule solver.
 *
 * Every rank holds the same catalog, runs the same pre-check and splits the
 * planned ordinal range into one contiguous block per rank. Each rank
 * evaluates its block with an internal ThreadedScheduleSolver (intra-node
 * parallelism), then ships the candidates to rank 0, which ranks the union.
 * Rank 0 returns the full result; other ranks return a DONE result with
 * empty candidate sets.
 */
class MPIScheduleSolver : public ISolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param maxCandidates Global cap on evaluated candidates, over all ranks.
     * @param numThreads    Number of worker threads used inside each rank.
     * @param policy        Ranking policy applied on rank 0.
     */
    MPIScheduleSolver(std::uint64_t maxCandidates, int numThreads,
                      RankingPolicy policy = RankingPolicy::CONFLICT_FIRST);

    /**
     * @brief Solve the catalog cooperatively across all MPI ranks.
     *
     * Must be called on every rank of MPI_COMM_WORLD with the same catalog.
     *
     * @throws std::runtime_error if an MPI call fails.
     */
    ScheduleResult solve(const std::vector<Offering>& catalog) override;

    void stop() override { threadedSolver_.stop(); }
    EngineState state() const override { return state_; }

    /// Print progress diagnostics to stderr.
    void setVerbose(bool enabled) { verbose_ = enabled; }

private:
    /// Global cap; each rank evaluates its share of min(product, cap).
    std::uint64_t maxCandidates_;

    /// Ordering applied to the gathered candidates.
    RankingPolicy policy_;

    /// Intra-rank worker pool.
    ThreadedScheduleSolver threadedSolver_;

    std::atomic<EngineState> state_{EngineState::IDLE};
    bool verbose_ = false;
};
