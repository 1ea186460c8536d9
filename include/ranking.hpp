#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "grouping.hpp"
#include <cstdint>
#include <string>
#include <vector>


///////////////////////////
///       METRICS       ///
///////////////////////////
/**
 * @brief Credit and priority sums of a selection (conflicts untouched).
 */
void computeMetrics(const std::vector<Offering>& catalog, ScheduleCandidate& candidate);

/**
 * @brief Build a fully evaluated candidate: metrics plus conflict list.
 *
 * Pure function of (catalog, selection); safe to call concurrently.
 */
ScheduleCandidate evaluateCandidate(const std::vector<Offering>& catalog,
                                    const std::vector<int>& selection,
                                    std::uint64_t ordinal);


///////////////////////////
///       RANKING       ///
///////////////////////////
/**
 * @brief Strict weak order of the active policy.
 *
 * After the two policy keys, ties go to higher totalCredits, then to the
 * lower enumeration ordinal, so the order is total for distinct ordinals.
 */
bool rankedBefore(const ScheduleCandidate& a, const ScheduleCandidate& b, RankingPolicy policy);

/**
 * @brief Sort candidates in place under a policy.
 */
void rankCandidates(std::vector<ScheduleCandidate>& candidates, RankingPolicy policy);

/**
 * @brief Split evaluated candidates into clean / conflicting sets and rank both.
 *
 * @param candidates  All evaluated candidates of the run (consumed).
 * @param policy      Active ranking policy.
 * @param truncated   Whether the cap stopped enumeration early.
 * @param productSize Full (saturated) product size.
 * @return DONE result.
 */
ScheduleResult assembleResult(std::vector<ScheduleCandidate> candidates,
                              RankingPolicy policy,
                              bool truncated,
                              std::uint64_t productSize);

/**
 * @brief FAILED result for a pre-check failure; no candidates.
 */
ScheduleResult failedResult(const MandatoryUnsatisfiable& error, RankingPolicy policy);

/**
 * @brief CANCELLED result; partial candidates are discarded.
 */
ScheduleResult cancelledResult(RankingPolicy policy, std::uint64_t productSize);

/// "conflict-first" or "priority-first".
std::string policyName(RankingPolicy policy);

/**
 * @brief Parse "conflict"/"conflict-first" or "priority"/"priority-first".
 *
 * @throws std::invalid_argument for anything else.
 */
RankingPolicy parsePolicy(const std::string& text);

/// "IDLE", "EVALUATING", "DONE", "FAILED" or "CANCELLED".
std::string stateName(EngineState state);
