#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <vector>


///////////////////////////
///     MULTI-START     ///
///////////////////////////
/**
 * @brief Number of attempts a process runs out of the total budget.
 *
 * The remainder goes to the lowest ranks; a rank may get zero. Shares
 * over all ranks sum to totalAttempts.
 */
int attemptsForRank(int totalAttempts, int rank, int size);

/**
 * @brief Serialize a placement vector into a flat integer buffer.
 *
 * Encodes (courseIndex, day, slot, roomIndex) for each placement in order,
 * so it can be sent via MPI as a contiguous array of ints. Unplaced
 * entries keep their courseIndex of -1.
 */
void serializePlacements(const std::vector<Placement>& placements, std::vector<int>& buffer);

/**
 * @brief Deserialize a flat integer buffer into a placement vector.
 *
 * Assumes groups of four ints per placement, as produced by
 * serializePlacements(); a trailing partial group is ignored.
 */
void deserializePlacements(const std::vector<int>& buffer, std::vector<Placement>& placements);
