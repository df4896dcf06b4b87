#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include <random>
#include <vector>


///////////////////////////
///       ATTEMPT       ///
///////////////////////////
/**
 * @brief Raw result of a single randomized greedy pass.
 */
struct AttemptOutcome {
    std::vector<Placement> placements; ///< Indexed by course index; -1 when unplaced.
    bool complete = false; ///< True iff every course was placed.
    int placedCount = 0; ///< Number of courses placed before success or failure.
    int penalty = 0; ///< Sum of the chosen candidates' penalties.
};

/**
 * @brief Run one randomized greedy pass over the whole roster.
 *
 * Shuffles the course order, then for each course shuffles the DAYS ×
 * SLOTS_PER_DAY candidates and commits the feasible candidate with the
 * lowest load penalty (ties resolved per config.tieBreak). Stops at the
 * first course with no feasible candidate.
 *
 * All randomness comes from rng, so a fixed seed reproduces the pass.
 */
AttemptOutcome runGreedyAttempt(const RosterIndex& index,
                                const GeneratorConfig& config,
                                std::mt19937& rng);

/**
 * @brief Whether attempt a is a better best-effort candidate than b.
 *
 * Complete beats incomplete, then more courses placed, then lower penalty.
 */
bool isBetterEffort(const AttemptOutcome& a, const AttemptOutcome& b);

/**
 * @brief Wrap an attempt into the public result type.
 *
 * Fills the completeness flag and the names of unplaced courses.
 */
GenerationResult makeResult(const CourseRoster& roster, AttemptOutcome outcome, int attemptsUsed);

/**
 * @brief Reject configurations no solver can run with.
 *
 * @throws std::invalid_argument on a non-positive attempt budget, room
 *         pool or daily cap, or a negative threshold or time limit.
 */
void validateConfig(const GeneratorConfig& config);
