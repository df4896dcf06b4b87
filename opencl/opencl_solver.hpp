#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "greedy_attempt.hpp"
#include "opencl_evaluator.hpp"
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Best-of-N greedy solver that audits attempts with OpenCL.
 *
 * Runs the whole attempt budget on the CPU (no early exit on the first
 * complete attempt), collects attempts in batches, and audits every batch
 * on the device. Returns the clean candidate with the lowest load penalty;
 * when no candidate is clean, the best effort (most courses placed, then
 * lowest penalty).
 */
class OpenCLBatchSolver : public ISolver {
public:
    /**
     * @brief Construct an OpenCL-audited solver.
     *
     * @param config    Attempt budget, rules, seed and time limit.
     * @param batchSize Number of attempts to accumulate per device audit.
     * @throws std::invalid_argument if config or batchSize is unusable.
     * @throws std::runtime_error if no OpenCL device can be set up.
     */
    OpenCLBatchSolver(const GeneratorConfig& config, int batchSize);

    /**
     * @brief Generate a timetable for the roster.
     *
     * Deterministic for a fixed config.seed.
     */
    GenerationResult generate(const CourseRoster& roster) override;

private:
    /// Solver configuration.
    GeneratorConfig config_;

    /// Target number of attempts per device audit.
    int batchSize_;

    /// OpenCL context and kernel used for batched auditing.
    AssignmentOpenCLContext clctx_;

    /// Attempts awaiting the next audit.
    std::vector<AttemptOutcome> batch_;

    /// Best audited outcome so far.
    AttemptOutcome best_;

    /// Whether best_ holds an outcome.
    bool haveBest_ = false;

    /**
     * @brief Audit the pending batch on the device and update best_.
     *
     * The device verdict replaces each attempt's own completeness flag and
     * penalty, so only audited-clean candidates count as complete.
     */
    void flushBatchToDevice(const RosterIndex& index);
};
