///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_solver.hpp"
#include "cli.hpp"
#include "formatting.hpp"
#include <mpi.h>
#include <iostream>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads timetable generator.
 *
 * Every rank parses the same options and loads the same roster, then runs
 * its share of the attempt budget. Rank 0 prints the run header, the best
 * timetable across all ranks and the requested student views.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    int exitCode = 0;
    try {
        RunOptions options = parseRunOptions(argc, argv);
        if (options.showHelp) {
            if (rank == 0) std::cout << usageText(argv[0]);
            MPI_Finalize();
            return 0;
        }

        // Only rank 0 prints a brief header about the MPI configuration.
        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI+THREADS TIMETABLE GENERATOR\n";
            std::cout << "Processes: " << size << "\n";
            std::cout << "Threads per process: " << options.threads << "\n";
            std::cout << "========================================\n";
        }

        RunInput input = loadRunInput(options);

        MPIMultiStartSolver solver(options.config, options.threads);

        double start = MPI_Wtime();
        auto resultOpt = solver.solve(input.roster);
        double ms = (MPI_Wtime() - start) * 1000.0;

        // All ranks participate; rank 0 holds and prints the result.
        if (rank == 0 && resultOpt) {
            printRunSummary("MPI MULTI-START RESULT (" + input.source + ")", input.roster, *resultOpt, ms);
            exitCode = presentResult(input, *resultOpt, options) ? 0 : 1;
        }
    } catch (const std::exception& ex) {
        if (rank == 0) std::cerr << "Error: " << ex.what() << "\n";
        exitCode = 1;
    }

    MPI_Finalize();
    return exitCode;
}
