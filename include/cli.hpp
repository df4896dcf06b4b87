#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "demo_instances.hpp"
#include <string>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief Everything an entry point needs to know about one run.
 */
struct RunOptions {
    std::string csvDir; ///< Directory of enrollment CSVs; empty selects the demo roster.
    DemoSize demoSize = DemoSize::M; ///< Demo preset when csvDir is empty.
    std::uint32_t demoSeed = 7; ///< Seed of the demo roster generator.
    GeneratorConfig config; ///< Solver configuration (attempts, seed, rules, ...).
    int threads = 4; ///< Worker threads for the threaded and MPI solvers.
    int batchSize = 16; ///< Attempts per OpenCL audit batch.
    std::string studentId; ///< Roll number (or part of it) to show a grid for.
    std::string studentName; ///< Name (or part of it) to show a grid for.
    bool allStudents = false; ///< Print every student's grid.
    bool showHelp = false; ///< --help was given.
};

/**
 * @brief Input of one run, loaded according to RunOptions.
 */
struct RunInput {
    CourseRoster roster;
    EnrollmentData enrollment; ///< Empty for demo rosters.
    std::string source; ///< Human-readable origin of the roster.
};

/**
 * @brief Parse command-line flags into run options.
 *
 * Flags: --csv-dir DIR, --demo S|M|L|XL, --demo-seed N, --seed N,
 * --attempts N, --threads N, --time-limit-ms N, --tie-break shuffle|lex,
 * --batch N, --student-id ID, --student-name NAME, --all-students, --help.
 *
 * @throws std::invalid_argument on unknown flags or malformed values.
 */
RunOptions parseRunOptions(int argc, char** argv);

/**
 * @brief Usage text for an entry point.
 */
std::string usageText(const std::string& program);

/**
 * @brief Load the roster from CSV files or build the demo roster.
 */
RunInput loadRunInput(const RunOptions& options);


///////////////////////////
///      REPORTING      ///
///////////////////////////
/**
 * @brief Print master schedule, verification and requested student views.
 *
 * @return false if a requested student could not be found.
 */
bool presentResult(const RunInput& input, const GenerationResult& result, const RunOptions& options);
