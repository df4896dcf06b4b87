///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "cli.hpp"
#include "formatting.hpp"
#include "opencl_solver.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the OpenCL-audited best-of-N generator.
 *
 * Runs every attempt of the budget, audits them in device batches and
 * prints the lowest-penalty clean timetable (or the best effort).
 */
int main(int argc, char** argv) {
    try {
        RunOptions options = parseRunOptions(argc, argv);
        if (options.showHelp) {
            std::cout << usageText(argv[0]);
            return 0;
        }

        RunInput input = loadRunInput(options);

        std::cout << "========================================\n";
        std::cout << "OPENCL BEST-OF-N TIMETABLE GENERATOR\n";
        std::cout << "Device batch size: " << options.batchSize << "\n";
        std::cout << "========================================\n";

        OpenCLBatchSolver solver(options.config, options.batchSize);

        // Measure wall-clock time for the OpenCL solver.
        auto start = std::chrono::high_resolution_clock::now();
        GenerationResult result = solver.generate(input.roster);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        printRunSummary("OPENCL RESULT (" + input.source + ")", input.roster, result, ms);
        return presentResult(input, result, options) ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
