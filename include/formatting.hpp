#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "conflicts.hpp"
#include "solver_base.hpp"
#include <iosfwd>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief One-line description of a conflict, e.g. "Mon period 1: A (teacher), B".
 */
std::string describeConflict(const std::vector<Offering>& catalog, const SlotConflict& conflict);

/**
 * @brief Print one candidate: metrics, per-day table and conflict details.
 *
 * @param rank Position shown in the heading (1-based).
 */
void printCandidate(std::ostream& out, const std::vector<Offering>& catalog,
                    const ScheduleCandidate& candidate, int rank);

/**
 * @brief Print a run summary followed by the best candidates of each set.
 *
 * @param top Maximum number of candidates printed per set.
 */
void printScheduleResult(std::ostream& out, const std::vector<Offering>& catalog,
                         const ScheduleResult& result, int top);
