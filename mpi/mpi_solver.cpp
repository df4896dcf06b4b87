///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "greedy_attempt.hpp"
#include <mpi.h>
#include <algorithm>
#include <limits>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the hybrid MPI + threaded multi-start solver.
 */
MPIMultiStartSolver::MPIMultiStartSolver(const GeneratorConfig& config, int numThreads)
        : config_(config),
          numThreads_(numThreads) {
    validateConfig(config_);
}

/**
 * @brief Run this rank's share of attempts, then agree on the global best.
 *
 * Three reductions pick the winner: minimum unplaced count, minimum
 * penalty among ranks at that count, then minimum rank among those. The
 * winner sends its placements to rank 0 unless it is rank 0 itself.
 */
std::optional<GenerationResult> MPIMultiStartSolver::solve(const CourseRoster& roster) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const int kNone = std::numeric_limits<int>::max();

    // Rank-local configuration: own share of the budget, own seed.
    GeneratorConfig localConfig = config_;
    localConfig.maxAttempts = attemptsForRank(config_.maxAttempts, rank, size);
    localConfig.seed = config_.seed + 104729u * (std::uint32_t)rank;

    GenerationResult local;
    int localUnplaced = kNone;
    int localAttempts = 0;
    if (localConfig.maxAttempts > 0) {
        ThreadedRestartSolver threadedSolver(localConfig, numThreads_);
        local = threadedSolver.generate(roster);
        localUnplaced = (int)local.unplacedCourses.size();
        localAttempts = local.attemptsUsed;
    }

    int globalUnplaced = kNone;
    MPI_Allreduce(&localUnplaced, &globalUnplaced, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

    int localPenalty = (localUnplaced == globalUnplaced) ? local.penalty : kNone;
    int globalPenalty = kNone;
    MPI_Allreduce(&localPenalty, &globalPenalty, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

    int candidateRank = (localUnplaced == globalUnplaced && localPenalty == globalPenalty) ? rank : kNone;
    int winnerRank = kNone;
    MPI_Allreduce(&candidateRank, &winnerRank, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

    int totalAttempts = 0;
    MPI_Allreduce(&localAttempts, &totalAttempts, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);

    const int TAG_META = 300;
    const int TAG_DATA = 301;

    // Winner is a non-root rank: ship its placements to rank 0.
    if (winnerRank != 0 && rank == winnerRank) {
        std::vector<int> buf;
        serializePlacements(local.placements, buf);
        int len = (int)buf.size();

        MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (len > 0) {
            MPI_Send(buf.data(), len, MPI_INT, 0, TAG_DATA, MPI_COMM_WORLD);
        }
    }

    if (rank != 0) {
        return std::nullopt;
    }

    AttemptOutcome best;
    if (winnerRank == 0) {
        best.placements = std::move(local.placements);
    } else {
        int len = 0;
        MPI_Recv(&len, 1, MPI_INT, winnerRank, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

        std::vector<int> buf(len);
        if (len > 0) {
            MPI_Recv(buf.data(), len, MPI_INT, winnerRank, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        }
        deserializePlacements(buf, best.placements);
    }

    best.placedCount = (int)std::count_if(best.placements.begin(), best.placements.end(),
                                          [](const Placement& p) { return p.courseIndex >= 0; });
    best.complete = best.placedCount == (int)roster.size();
    best.penalty = globalPenalty;

    return makeResult(roster, std::move(best), totalAttempts);
}
