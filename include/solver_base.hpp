#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "conflicts.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Total order used to rank candidates.
 */
enum class RankingPolicy {
    CONFLICT_FIRST, ///< conflictCount ascending, then totalPriority descending.
    PRIORITY_FIRST  ///< totalPriority descending, then conflictCount ascending.
};

/**
 * @brief Lifecycle of one solver.
 *
 * IDLE until the first solve(); EVALUATING while a run is in progress;
 * DONE, FAILED (pre-check) or CANCELLED (stop()) afterwards.
 */
enum class EngineState { IDLE, EVALUATING, DONE, FAILED, CANCELLED };

/**
 * @brief One complete selection plus its derived metrics.
 *
 * Offerings are referenced by catalog index; renderers resolve them
 * against the same catalog snapshot that was solved.
 */
struct ScheduleCandidate {
    /// One catalog index per offering group, in group order.
    std::vector<int> selection;

    /// Position of the selection in enumeration order (final tie-break).
    std::uint64_t ordinal = 0;

    int totalCredits = 0; ///< Sum of credits.
    int requiredCredits = 0; ///< Sum of credits of REQUIRED offerings.
    int electiveCredits = 0; ///< Sum of credits of ELECTIVE offerings.
    int totalPriority = 0; ///< Sum of priorities.

    /// Slot collisions in ascending (day, period) order.
    std::vector<SlotConflict> conflicts;

    /// Number of colliding slots (== conflicts.size()).
    int conflictCount = 0;
};

/**
 * @brief Ranked outcome of a run.
 *
 * On FAILED, failureReason/missingCourse are set and both sets are empty.
 * On DONE, clean holds conflict-free candidates and conflicting the rest,
 * each sorted under policy. truncated is a warning, not an error.
 */
struct ScheduleResult {
    EngineState state = EngineState::IDLE;
    RankingPolicy policy = RankingPolicy::CONFLICT_FIRST;

    std::string failureReason; ///< Human-readable pre-check failure.
    std::string missingCourse; ///< Course named by MandatoryUnsatisfiable.

    std::vector<ScheduleCandidate> clean; ///< conflictCount == 0.
    std::vector<ScheduleCandidate> conflicting; ///< conflictCount > 0.

    bool truncated = false; ///< Cap reached before the product was exhausted.
    std::uint64_t productSize = 0; ///< Full product size (saturated).
    std::uint64_t generated = 0; ///< Candidates evaluated.

    bool ok() const { return state == EngineState::DONE; }
    size_t candidateCount() const { return clean.size() + conflicting.size(); }
};


/**
 * @brief Marks a solver EVALUATING for the duration of one solve().
 *
 * Every normal exit of solve() stores DONE, FAILED or CANCELLED before
 * returning. If an exception leaves solve() instead, the state would still
 * read EVALUATING; the destructor turns that into FAILED.
 */
class EvaluationGuard {
public:
    explicit EvaluationGuard(std::atomic<EngineState>& state) : state_(state) {
        state_ = EngineState::EVALUATING;
    }
    ~EvaluationGuard() {
        EngineState expected = EngineState::EVALUATING;
        state_.compare_exchange_strong(expected, EngineState::FAILED);
    }

    EvaluationGuard(const EvaluationGuard&) = delete;
    EvaluationGuard& operator=(const EvaluationGuard&) = delete;

private:
    std::atomic<EngineState>& state_;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for schedule solvers.
 *
 * Implementations may be sequential, multithreaded, GPU-accelerated,
 * or distributed via MPI, but all expose the same solve() contract and
 * return identical rankings for identical input.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Enumerate, evaluate and rank every candidate of a catalog.
     *
     * A mandatory course without available offering yields a FAILED
     * result; nothing is enumerated in that case.
     *
     * @throws std::invalid_argument if the solver's cap is invalid.
     */
    virtual ScheduleResult solve(const std::vector<Offering>& catalog) = 0;

    /**
     * @brief Ask a running solve() to stop; safe from another thread.
     */
    virtual void stop() = 0;

    /**
     * @brief Current lifecycle state.
     */
    virtual EngineState state() const = 0;
};
