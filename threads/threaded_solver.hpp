#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "greedy_attempt.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded restart solver for timetable generation.
 *
 * Attempts are independent, so worker threads pull attempt numbers from a
 * shared counter and run full greedy passes in parallel, each with its own
 * random engine seeded from config.seed and the worker index. The first
 * complete pass stops every worker; otherwise the best effort among all
 * passes (most courses placed, then lowest penalty) is returned.
 */
class ThreadedRestartSolver : public ISolver {
public:
    /**
     * @brief Create a threaded restart solver.
     *
     * @param config     Restart budget, room pool, rules, seed and time limit.
     * @param numThreads Number of worker threads (at least one is used).
     * @throws std::invalid_argument if config is unusable.
     */
    ThreadedRestartSolver(const GeneratorConfig& config, int numThreads);

    /**
     * @brief Generate a timetable for the roster.
     *
     * @param roster Courses with their enrolled students.
     * @return First complete assignment found, or the best effort.
     */
    GenerationResult generate(const CourseRoster& roster) override;

    /**
     * @brief Seed used by a given worker for a given base seed.
     */
    static std::uint32_t workerSeed(std::uint32_t baseSeed, int worker);

private:
    GeneratorConfig config_; ///< Solver configuration.
    int numThreads_;         ///< Number of worker threads.

    // Shared state across workers
    AttemptOutcome best_;       ///< Best outcome so far.
    bool haveBest_ = false;     ///< Whether best_ holds an outcome.
    std::mutex bestMutex_;      ///< Guards best_ and haveBest_.
    std::atomic<bool> found_{false};   ///< Signals early termination to all workers.
    std::atomic<int> nextAttempt_{0};  ///< Next attempt number to hand out.
    std::atomic<int> attemptsRun_{0};  ///< Attempts actually completed.

    /**
     * @brief Worker loop: run attempts until success, budget or deadline.
     */
    void worker(const RosterIndex& index, int workerIndex,
                std::chrono::steady_clock::time_point start);

    /**
     * @brief Fold one outcome into the shared best under the lock.
     */
    void offer(AttemptOutcome outcome);
};
