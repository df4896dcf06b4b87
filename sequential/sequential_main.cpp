///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
#include "model.hpp"
#include "cli.hpp"
#include "formatting.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the sequential timetable generator.
 *
 * Loads the roster (CSV directory or demo preset), runs the single-threaded
 * restart solver, measures its runtime, and prints the master schedule,
 * the constraint verification and any requested student grids.
 */
int main(int argc, char** argv) {
    try {
        RunOptions options = parseRunOptions(argc, argv);
        if (options.showHelp) {
            std::cout << usageText(argv[0]);
            return 0;
        }

        RunInput input = loadRunInput(options);

        // Restart budget, seed and rules all come from the command line.
        SequentialGreedySolver solver(options.config);

        // Measure wall-clock time of the whole restart loop.
        auto start = std::chrono::high_resolution_clock::now();
        GenerationResult result = solver.generate(input.roster);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        printRunSummary("SEQUENTIAL TIMETABLE GENERATOR (" + input.source + ")", input.roster, result, ms);
        return presentResult(input, result, options) ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
