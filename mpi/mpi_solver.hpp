#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "multistart.hpp"
#include "../threads/threaded_solver.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI-based multi-start wrapper around the threaded restart solver.
 *
 * The attempt budget is split across ranks; each rank runs its share with
 * a ThreadedRestartSolver seeded differently per rank. The globally best
 * outcome (fewest unplaced courses, then lowest penalty, then lowest rank)
 * is shipped to rank 0, which returns it; other ranks return std::nullopt.
 */
class MPIMultiStartSolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param config     Global configuration; maxAttempts is the total budget
     *                   over all ranks.
     * @param numThreads Number of worker threads used inside each rank.
     * @throws std::invalid_argument if config is unusable.
     */
    MPIMultiStartSolver(const GeneratorConfig& config, int numThreads);

    /**
     * @brief Generate a timetable cooperatively across all MPI ranks.
     *
     * Must be called on every rank with the same roster.
     *
     * @return The best result on rank 0, std::nullopt on other ranks.
     */
    std::optional<GenerationResult> solve(const CourseRoster& roster);

private:
    /// Global configuration shared by all ranks.
    GeneratorConfig config_;

    /// Number of worker threads used within each MPI process.
    int numThreads_;
};
