///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "greedy_attempt.hpp"
#include <random>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct a sequential greedy solver.
 *
 * @param config Solver configuration; rejected early if unusable.
 */
SequentialGreedySolver::SequentialGreedySolver(const GeneratorConfig& config)
        : config_(config) {
    validateConfig(config_);
}

/**
 * @brief Restart loop around runGreedyAttempt().
 *
 * Attempt state never crosses attempt boundaries; only the random engine
 * is carried from one attempt to the next.
 */
GenerationResult SequentialGreedySolver::generate(const CourseRoster& roster) {
    RosterIndex index = buildRosterIndex(roster);

    // Injected random source: the only origin of randomness for this run.
    std::mt19937 rng(config_.seed);

    auto start = std::chrono::steady_clock::now();

    AttemptOutcome last;
    AttemptOutcome best;
    bool haveBest = false;
    int attemptsUsed = 0;

    for (int attempt = 0; attempt < config_.maxAttempts; ++attempt) {
        // Out of time: hand back the best pass seen so far.
        if (attempt > 0 && deadlineReached(start)) {
            return makeResult(roster, std::move(best), attemptsUsed);
        }

        AttemptOutcome outcome = runGreedyAttempt(index, config_, rng);
        ++attemptsUsed;

        // Every course placed: stop searching.
        if (outcome.complete) {
            return makeResult(roster, std::move(outcome), attemptsUsed);
        }

        if (!haveBest || isBetterEffort(outcome, best)) {
            best = outcome;
            haveBest = true;
        }
        last = std::move(outcome);
    }

    // Budget exhausted: the final attempt is the best-effort answer.
    return makeResult(roster, std::move(last), attemptsUsed);
}

bool SequentialGreedySolver::deadlineReached(std::chrono::steady_clock::time_point start) const {
    if (config_.timeLimit.count() == 0) return false;
    return std::chrono::steady_clock::now() - start >= config_.timeLimit;
}
