#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include <vector>


///////////////////////////
///   CANDIDATE BUFFER  ///
///////////////////////////
/**
 * @brief Serialize candidates into a flat integer buffer.
 *
 * Layout per candidate:
 * (ordinal, totalCredits, requiredCredits, electiveCredits, totalPriority,
 *  selectionSize, selection..., conflictCount,
 *  [day, period, occupantCount, occupants...] per conflict).
 *
 * @param candidates Input candidates.
 * @param buffer     Output flat buffer; cleared and filled.
 */
void serializeCandidates(const std::vector<ScheduleCandidate>& candidates, std::vector<long long>& buffer);

/**
 * @brief Rebuild candidates from a buffer produced by serializeCandidates().
 *
 * @param buffer     Flat buffer received via MPI.
 * @param candidates Output; decoded candidates are appended.
 * @throws std::runtime_error if the buffer is truncated or holds an
 *         out-of-range day or negative length.
 */
void deserializeCandidates(const std::vector<long long>& buffer, std::vector<ScheduleCandidate>& candidates);

/**
 * @brief Convert a buffer length to an MPI element count.
 *
 * @throws std::runtime_error if the length is negative or exceeds INT_MAX.
 */
int messageCount(long long length);
