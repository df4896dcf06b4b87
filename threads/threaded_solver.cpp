///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include <algorithm>
#include <future>
#include <random>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the threaded restart solver with given limits.
 *
 * Configuration is validated here; shared search state is reset in generate().
 */
ThreadedRestartSolver::ThreadedRestartSolver(const GeneratorConfig& config, int numThreads)
        : config_(config),
          numThreads_(std::max(1, numThreads)) {
    validateConfig(config_);
}

std::uint32_t ThreadedRestartSolver::workerSeed(std::uint32_t baseSeed, int worker) {
    return baseSeed + 7919u * (std::uint32_t)worker;
}

/**
 * @brief Entry point for generating a timetable.
 *
 * Resets shared state, launches one async task per worker and waits for all
 * of them. The roster index is built once and shared read-only.
 */
GenerationResult ThreadedRestartSolver::generate(const CourseRoster& roster) {
    RosterIndex index = buildRosterIndex(roster);

    // Reset shared state before starting a new search.
    best_ = AttemptOutcome{};
    haveBest_ = false;
    found_ = false;
    nextAttempt_ = 0;
    attemptsRun_ = 0;

    auto start = std::chrono::steady_clock::now();

    // Never start more workers than there are attempts to run.
    int workers = std::min(numThreads_, config_.maxAttempts);

    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async,
                                   [this, &index, w, start]() {
                                       this->worker(index, w, start);
                                   }));
    }
    for (auto& t : tasks) t.get();

    return makeResult(roster, std::move(best_), attemptsRun_.load());
}

/**
 * @brief Run attempts on one worker with its own random engine.
 *
 * Stops when another worker succeeded, the attempt budget is used up, or
 * the time limit has elapsed (checked before each attempt except the very
 * first of the run, so at least one attempt always completes).
 */
void ThreadedRestartSolver::worker(const RosterIndex& index, int workerIndex,
                                   std::chrono::steady_clock::time_point start) {
    std::mt19937 rng(workerSeed(config_.seed, workerIndex));

    while (!found_) {
        int attempt = nextAttempt_.fetch_add(1);
        if (attempt >= config_.maxAttempts) return;

        if (attempt > 0 && config_.timeLimit.count() > 0 &&
            std::chrono::steady_clock::now() - start >= config_.timeLimit) {
            return;
        }

        AttemptOutcome outcome = runGreedyAttempt(index, config_, rng);
        attemptsRun_.fetch_add(1);

        if (outcome.complete) {
            found_ = true;
        }
        offer(std::move(outcome));
    }
}

void ThreadedRestartSolver::offer(AttemptOutcome outcome) {
    std::lock_guard<std::mutex> lock(bestMutex_);
    // Once a complete outcome is stored, later complete ones do not replace it.
    if (haveBest_ && best_.complete) return;
    if (!haveBest_ || isBetterEffort(outcome, best_)) {
        best_ = std::move(outcome);
        haveBest_ = true;
    }
}
