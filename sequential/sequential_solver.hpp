#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include <chrono>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded randomized greedy solver with bounded restarts.
 *
 * Runs up to config.maxAttempts independent greedy passes, all drawing from
 * one std::mt19937 seeded with config.seed. The first complete pass is
 * returned immediately; if every pass fails, the final pass is returned as
 * best effort. With a time limit, a run cut short returns the best pass so
 * far instead.
 */
class SequentialGreedySolver : public ISolver {
public:
    /**
     * @brief Construct a sequential solver.
     *
     * @param config Restart budget, room pool, rules and seed.
     * @throws std::invalid_argument if config is unusable.
     */
    explicit SequentialGreedySolver(const GeneratorConfig& config = GeneratorConfig{});

    /**
     * @brief Generate a timetable for the roster.
     *
     * Deterministic for a fixed config.seed.
     */
    GenerationResult generate(const CourseRoster& roster) override;

private:
    /// Solver configuration, validated at construction.
    GeneratorConfig config_;

    /**
     * @brief Whether the configured time limit has elapsed since start.
     */
    bool deadlineReached(std::chrono::steady_clock::time_point start) const;
};
