///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cli.hpp"
#include "enrollment_loader.hpp"
#include "formatting.hpp"
#include "query.hpp"
#include "validation.hpp"
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Parse a non-negative integer flag value no larger than maxValue.
 */
static long long parseNumber(const std::string& flag, const std::string& value, long long maxValue) {
    size_t used = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || number < 0) {
        throw std::invalid_argument(flag + " expects a non-negative number, got '" + value + "'");
    }
    if (number > maxValue) {
        throw std::invalid_argument(flag + " must not exceed " + std::to_string(maxValue) +
                                    ", got '" + value + "'");
    }
    return number;
}

static int parseInt(const std::string& flag, const std::string& value) {
    return (int)parseNumber(flag, value, std::numeric_limits<int>::max());
}

static std::uint32_t parseSeed(const std::string& flag, const std::string& value) {
    return (std::uint32_t)parseNumber(flag, value, std::numeric_limits<std::uint32_t>::max());
}

static TieBreak parseTieBreak(const std::string& value) {
    if (value == "shuffle") return TieBreak::SHUFFLE_ORDER;
    if (value == "lex") return TieBreak::LEXICOGRAPHIC;
    throw std::invalid_argument("--tie-break expects 'shuffle' or 'lex', got '" + value + "'");
}


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
RunOptions parseRunOptions(int argc, char** argv) {
    RunOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
            continue;
        }
        if (flag == "--all-students") {
            options.allStudents = true;
            continue;
        }

        // Every remaining flag takes exactly one value.
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--csv-dir") {
            options.csvDir = value;
        } else if (flag == "--demo") {
            options.demoSize = parseDemoSize(value);
        } else if (flag == "--demo-seed") {
            options.demoSeed = parseSeed(flag, value);
        } else if (flag == "--seed") {
            options.config.seed = parseSeed(flag, value);
        } else if (flag == "--attempts") {
            options.config.maxAttempts = parseInt(flag, value);
        } else if (flag == "--threads") {
            options.threads = parseInt(flag, value);
        } else if (flag == "--time-limit-ms") {
            options.config.timeLimit = std::chrono::milliseconds(parseInt(flag, value));
        } else if (flag == "--tie-break") {
            options.config.tieBreak = parseTieBreak(value);
        } else if (flag == "--batch") {
            options.batchSize = parseInt(flag, value);
        } else if (flag == "--student-id") {
            options.studentId = value;
        } else if (flag == "--student-name") {
            options.studentName = value;
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    return options;
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --csv-dir DIR          load enrollment CSV files from DIR\n"
           "  --demo S|M|L|XL        synthetic roster size when no CSV dir (default M)\n"
           "  --demo-seed N          seed of the synthetic roster (default 7)\n"
           "  --seed N               seed of the solver random engine (default 42)\n"
           "  --attempts N           restart budget (default 50)\n"
           "  --threads N            worker threads (default 4)\n"
           "  --time-limit-ms N      stop starting attempts after N ms (0 = none)\n"
           "  --tie-break shuffle|lex  equal-penalty candidate order\n"
           "  --batch N              attempts per OpenCL audit batch (default 16)\n"
           "  --student-id ID        roll number to show a weekly grid for\n"
           "  --student-name NAME    name to match together with --student-id\n"
           "  --all-students         print every student's weekly grid\n"
           "  --help                 show this text\n";
}

/**
 * @brief Load CSV enrollment or fall back to the synthetic roster.
 *
 * Skipped files are reported on stderr but do not stop the run.
 */
RunInput loadRunInput(const RunOptions& options) {
    RunInput input;

    if (options.csvDir.empty()) {
        input.roster = makeDemoRoster(options.demoSize, options.demoSeed);
        input.source = "demo roster";
        return input;
    }

    input.enrollment = loadEnrollmentDirectory(options.csvDir);
    for (const std::string& skipped : input.enrollment.skippedFiles) {
        std::cerr << "Skipped " << skipped << "\n";
    }
    input.roster = buildRoster(input.enrollment);
    input.source = options.csvDir;
    return input;
}


///////////////////////////
///      REPORTING      ///
///////////////////////////
/**
 * @brief Resolve the requested student and print their week.
 *
 * CSV input goes through the name + roll number lookup; demo rosters have
 * no names, so the roll number alone selects the student.
 */
static bool presentStudent(const RunInput& input, const GenerationResult& result, const RunOptions& options) {
    std::string label;
    std::set<std::string> courses;

    if (!input.enrollment.records.empty()) {
        auto profile = findStudent(input.enrollment, options.studentName, options.studentId);
        if (!profile) {
            std::cerr << "Credentials not found. Please verify your Name and Roll Number.\n";
            return false;
        }
        label = profile->studentName + " (" + profile->studentId + ")";
        courses.insert(profile->courses.begin(), profile->courses.end());
    } else {
        std::string id = normalizeStudentId(options.studentId);
        courses = coursesOfStudent(input.roster, id);
        if (courses.empty()) {
            std::cerr << "No enrolled student with roll number " << id << ".\n";
            return false;
        }
        label = id;
    }

    std::vector<ScheduleEntry> entries = filterSchedule(input.roster, result.placements, courses);

    std::cout << "Weekly schedule for " << label << ":\n\n";
    printStudentGrid(buildStudentGrid(entries));
    std::cout << "\nCourse details & faculty:\n";
    printCourseDetails(entries);
    std::cout << "\n";
    return true;
}

bool presentResult(const RunInput& input, const GenerationResult& result, const RunOptions& options) {
    if (input.roster.empty()) {
        std::cout << "No courses found in " << input.source << ".\n";
        return true;
    }

    printMasterSchedule(input.roster, result);
    printValidationReport(validateAssignment(input.roster, result.placements, options.config.rules),
                          options.config.rules);

    bool ok = true;
    if (!options.studentId.empty() || !options.studentName.empty()) {
        ok = presentStudent(input, result, options);
    }
    if (options.allStudents) {
        printAllStudentSchedules(input.roster, result);
    }
    return ok;
}
