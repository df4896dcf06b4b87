///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_solver.hpp"
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
 * @brief Entry point for the threaded timetable generator.
 *
 * Same flow as the sequential binary, but attempts are spread over
 * --threads workers with independently seeded random engines.
 */
int main(int argc, char** argv) {
    try {
        RunOptions options = parseRunOptions(argc, argv);
        if (options.showHelp) {
            std::cout << usageText(argv[0]);
            return 0;
        }

        RunInput input = loadRunInput(options);

        ThreadedRestartSolver solver(options.config, options.threads);

        // Measure wall-clock time for the threaded solver.
        auto start = std::chrono::high_resolution_clock::now();
        GenerationResult result = solver.generate(input.roster);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "Threads: " << options.threads << "\n";
        printRunSummary("THREADED TIMETABLE GENERATOR (" + input.source + ")", input.roster, result, ms);
        return presentResult(input, result, options) ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
