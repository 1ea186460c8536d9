#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <cstdint>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded schedule solver.
 *
 * Groups the catalog, walks the bounded Cartesian product with the lazy
 * enumerator, evaluates every selection in enumeration order and ranks
 * the collected candidates once enumeration ends.
 */
class SequentialScheduleSolver : public ISolver {
public:
    /**
     * @brief Construct a sequential solver.
     *
     * @param maxCandidates Hard cap on evaluated candidates (> 0).
     * @param policy        Ranking policy applied to the result sets.
     * @throws std::invalid_argument if maxCandidates is zero.
     */
    explicit SequentialScheduleSolver(std::uint64_t maxCandidates,
                                      RankingPolicy policy = RankingPolicy::CONFLICT_FIRST);

    /**
     * @brief Enumerate and rank every candidate of the catalog.
     *
     * Returns FAILED if the pre-check rejects the catalog, CANCELLED if
     * stop() was called during the run, DONE otherwise.
     */
    ScheduleResult solve(const std::vector<Offering>& catalog) override;

    void stop() override { stopped_ = true; }
    EngineState state() const override { return state_; }

    /// Print progress diagnostics to stderr.
    void setVerbose(bool enabled) { verbose_ = enabled; }

private:
    /// Maximum number of candidates evaluated per run.
    std::uint64_t maxCandidates_;

    /// Ordering applied to both result sets.
    RankingPolicy policy_;

    std::atomic<EngineState> state_{EngineState::IDLE};
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;
};
