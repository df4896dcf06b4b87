///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the OpenCL batch solver and set up the device.
 */
OpenCLBatchSolver::OpenCLBatchSolver(const GeneratorConfig& config, int batchSize)
        : config_(config),
          batchSize_(batchSize) {
    validateConfig(config_);
    if (batchSize_ <= 0)
        throw std::invalid_argument("batchSize must be positive");
}

/**
 * @brief Send the accumulated attempts to the device for auditing.
 *
 * Uses the OpenCL context to audit every attempt in batch_, updates best_
 * if any attempt is better, and clears the batch for reuse.
 */
void OpenCLBatchSolver::flushBatchToDevice(const RosterIndex& index) {
    if (batch_.empty()) return;

    std::vector<std::vector<Placement>> placements;
    placements.reserve(batch_.size());
    for (const AttemptOutcome& o : batch_) {
        placements.push_back(o.placements);
    }

    std::vector<AssignmentAudit> audits;
    clctx_.evaluateBatch(index, config_.rules, placements, audits);

    // Scan audits and keep the best outcome.
    for (int i = 0; i < (int)batch_.size(); ++i) {
        AttemptOutcome& outcome = batch_[i];
        outcome.complete = audits[i].clean();
        outcome.penalty = audits[i].penalty;

        if (!haveBest_ || isBetterEffort(outcome, best_)) {
            best_ = std::move(outcome);
            haveBest_ = true;
        }
    }

    batch_.clear();
}

/**
 * @brief Run the full attempt budget with device-side auditing.
 *
 * Attempts are generated sequentially from one seeded engine, so the
 * result is reproducible. The time limit is checked between attempts.
 */
GenerationResult OpenCLBatchSolver::generate(const CourseRoster& roster) {
    RosterIndex index = buildRosterIndex(roster);
    std::mt19937 rng(config_.seed);

    // Reset solver state for this run.
    batch_.clear();
    best_ = AttemptOutcome{};
    haveBest_ = false;

    auto start = std::chrono::steady_clock::now();
    int attemptsUsed = 0;

    for (int attempt = 0; attempt < config_.maxAttempts; ++attempt) {
        if (attempt > 0 && config_.timeLimit.count() > 0 &&
            std::chrono::steady_clock::now() - start >= config_.timeLimit) {
            break;
        }

        batch_.push_back(runGreedyAttempt(index, config_, rng));
        ++attemptsUsed;

        // When we reach batchSize_, push work to the device.
        if ((int)batch_.size() >= batchSize_) {
            flushBatchToDevice(index);
        }
    }

    // Audit any remaining attempts that did not trigger a flush.
    flushBatchToDevice(index);

    std::cout << "OpenCLBatchSolver: " << attemptsUsed << " attempts audited, best penalty = "
              << best_.penalty << (best_.complete ? "" : " (incomplete)") << "\n";
    return makeResult(roster, std::move(best_), attemptsUsed);
}
