#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "opencl_evaluator.hpp"
#include <atomic>
#include <cstdint>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Schedule solver that offloads candidate metrics to OpenCL.
 *
 * Enumerates selections on the CPU, collects them in batches, and uses an
 * OpenCL kernel to compute conflict counts, priority and credit sums for
 * all selections of a batch at once. The host attaches the detailed
 * conflict list to conflicting candidates only.
 */
class OpenCLScheduleSolver : public ISolver {
public:
    /**
     * @brief Construct an OpenCL-based solver.
     *
     * @param maxCandidates Hard cap on evaluated candidates (> 0).
     * @param batchSize     Number of selections sent to the device per batch.
     * @param policy        Ranking policy applied to the result sets.
     * @throws std::invalid_argument on a zero cap or batch size.
     * @throws std::runtime_error if OpenCL cannot be initialized.
     */
    OpenCLScheduleSolver(std::uint64_t maxCandidates, int batchSize,
                         RankingPolicy policy = RankingPolicy::CONFLICT_FIRST);

    /**
     * @brief Enumerate on the CPU, evaluate on the device, rank on the CPU.
     */
    ScheduleResult solve(const std::vector<Offering>& catalog) override;

    void stop() override { stopped_ = true; }
    EngineState state() const override { return state_; }

    /// Print progress diagnostics to stderr.
    void setVerbose(bool enabled) { verbose_ = enabled; }

    /// Name of the OpenCL device in use.
    const std::string& deviceName() const { return clctx_.deviceName(); }

private:
    /// Maximum number of candidates evaluated per run.
    std::uint64_t maxCandidates_;

    /// Target number of selections per device batch.
    int batchSize_;

    /// Ordering applied to both result sets.
    RankingPolicy policy_;

    /// OpenCL context and kernel used for batched evaluation.
    ScheduleOpenCLContext clctx_;

    /// Selections awaiting evaluation, with their ordinals.
    std::vector<std::vector<int>> batch_;
    std::vector<std::uint64_t> batchOrdinals_;

    /// Evaluated candidates of the current run.
    std::vector<ScheduleCandidate> candidates_;

    std::atomic<EngineState> state_{EngineState::IDLE};
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    /**
     * @brief Send the current batch to the device and collect candidates.
     *
     * @param catalog Offering snapshot the batch refers to.
     * @throws std::runtime_error if the device and host disagree on a
     *         conflict count.
     */
    void flushBatch(const std::vector<Offering>& catalog);
};
