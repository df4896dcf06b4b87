///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "greedy_attempt.hpp"
#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>


///////////////////////////
///       ATTEMPT       ///
///////////////////////////
/**
 * @brief One full randomized greedy pass.
 *
 * The course permutation differentiates attempts; the per-course candidate
 * shuffle removes the bias of a fixed scan order when penalties tie.
 */
AttemptOutcome runGreedyAttempt(const RosterIndex& index,
                                const GeneratorConfig& config,
                                std::mt19937& rng) {
    int numCourses = index.numCourses();

    AttemptOutcome outcome;
    outcome.placements.assign(numCourses, Placement{-1, 0, 0, 0});

    // Fresh per-student occupancy for this attempt.
    StudentScheduleState state(index, config.rules);

    std::vector<int> order(numCourses);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    std::uniform_int_distribution<int> roomDist(0, config.roomCount - 1);

    std::vector<std::pair<int, int>> candidates;
    candidates.reserve(DAYS * SLOTS_PER_DAY);

    for (int course : order) {
        candidates.clear();
        for (int day = 0; day < DAYS; ++day) {
            for (int slot = 0; slot < SLOTS_PER_DAY; ++slot) {
                candidates.emplace_back(day, slot);
            }
        }
        std::shuffle(candidates.begin(), candidates.end(), rng);

        int bestDay = -1;
        int bestSlot = -1;
        int bestPenalty = std::numeric_limits<int>::max();

        for (const auto& cand : candidates) {
            int penalty = 0;
            if (!state.evaluate(course, cand.first, cand.second, penalty)) continue;

            bool better = penalty < bestPenalty;
            if (!better && penalty == bestPenalty &&
                config.tieBreak == TieBreak::LEXICOGRAPHIC) {
                better = cand < std::make_pair(bestDay, bestSlot);
            }
            if (better) {
                bestDay = cand.first;
                bestSlot = cand.second;
                bestPenalty = penalty;
            }
        }

        // No candidate passes both hard rules: this attempt is over.
        if (bestDay < 0) {
            outcome.complete = false;
            return outcome;
        }

        state.place(course, bestDay, bestSlot);
        outcome.placements[course] = Placement{course, bestDay, bestSlot, roomDist(rng)};
        outcome.penalty += bestPenalty;
        outcome.placedCount++;
    }

    outcome.complete = true;
    return outcome;
}

bool isBetterEffort(const AttemptOutcome& a, const AttemptOutcome& b) {
    if (a.complete != b.complete) return a.complete;
    if (a.placedCount != b.placedCount) return a.placedCount > b.placedCount;
    return a.penalty < b.penalty;
}

GenerationResult makeResult(const CourseRoster& roster, AttemptOutcome outcome, int attemptsUsed) {
    GenerationResult result;
    result.placements = std::move(outcome.placements);
    result.attemptsUsed = attemptsUsed;
    result.penalty = outcome.penalty;

    // Courses absent from the placements are reported by name.
    for (int c = 0; c < (int)roster.size(); ++c) {
        if (c >= (int)result.placements.size() || result.placements[c].courseIndex < 0) {
            result.unplacedCourses.push_back(roster[c].name);
        }
    }
    result.fullyPlaced = result.unplacedCourses.empty();
    return result;
}

void validateConfig(const GeneratorConfig& config) {
    if (config.maxAttempts <= 0)
        throw std::invalid_argument("maxAttempts must be positive");
    if (config.roomCount <= 0)
        throw std::invalid_argument("roomCount must be positive");
    if (config.rules.dailyCap <= 0)
        throw std::invalid_argument("dailyCap must be positive");
    if (config.rules.lightDayThreshold < 0)
        throw std::invalid_argument("lightDayThreshold must not be negative");
    if (config.timeLimit.count() < 0)
        throw std::invalid_argument("timeLimit must not be negative");
}
