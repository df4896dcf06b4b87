///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <iomanip>
#include <iostream>
#include <set>

///////////////////////////
///       HELPERS       ///
///////////////////////////
static constexpr int kSubjectWidth = 22;
static constexpr int kFacultyWidth = 14;
static constexpr int kDayWidth = 10;
static constexpr int kTimeWidth = 19;
static constexpr int kRoomWidth = 6;
static constexpr int kCellWidth = 16;

/**
 * @brief Cut text to a column width so tables stay aligned.
 */
static std::string fit(const std::string& text, int width) {
    if ((int)text.size() <= width) return text;
    return text.substr(0, width - 1) + "~";
}

/**
 * @brief Print the header row of a course table.
 *
 * Uses fixed-width columns for subject, faculty, day, time and room.
 */
static void printCourseTableHeader() {
    std::cout << "    "
              << std::left << std::setw(kSubjectWidth) << "Subject"
              << " | " << std::left << std::setw(kFacultyWidth) << "Faculty"
              << " | " << std::left << std::setw(kDayWidth) << "Day"
              << " | " << std::left << std::setw(kTimeWidth) << "Time Slot"
              << " | " << std::left << std::setw(kRoomWidth) << "Room"
              << "\n";

    // Underline with a matching ASCII separator line.
    std::cout << "    "
              << std::string(kSubjectWidth, '-')
              << "-+-" << std::string(kFacultyWidth, '-')
              << "-+-" << std::string(kDayWidth, '-')
              << "-+-" << std::string(kTimeWidth, '-')
              << "-+-" << std::string(kRoomWidth, '-')
              << "\n";
}

static void printCourseRow(const ScheduleEntry& e) {
    std::cout << "    "
              << std::left << std::setw(kSubjectWidth) << fit(e.course, kSubjectWidth)
              << " | " << std::left << std::setw(kFacultyWidth) << fit(e.faculty, kFacultyWidth)
              << " | " << std::left << std::setw(kDayWidth) << kDayNames[e.day]
              << " | " << std::left << std::setw(kTimeWidth) << kSlotLabels[e.slot]
              << " | " << std::left << std::setw(kRoomWidth) << e.room
              << "\n";
}

void printRunSummary(const std::string& title, const CourseRoster& roster,
                     const GenerationResult& result, double elapsedMs) {
    std::cout << "========================================\n";
    std::cout << title << "\n";
    std::cout << "Courses: " << roster.size() << "\n";
    std::cout << "Attempts: " << result.attemptsUsed << "\n";
    std::cout << "Time: " << elapsedMs << " ms\n";

    if (result.fullyPlaced) {
        std::cout << "Clash-free timetable found, penalty = " << result.penalty << "\n";
    } else {
        std::cout << "Best-effort timetable: " << result.placedCount() << "/" << roster.size()
                  << " courses placed, penalty = " << result.penalty << "\n";
        std::cout << "Unplaced courses:";
        for (const std::string& name : result.unplacedCourses) {
            std::cout << " [" << name << "]";
        }
        std::cout << "\n";
    }
    std::cout << "========================================\n";
}

/**
 * @brief Print the whole assignment through the same projection students see.
 */
void printMasterSchedule(const CourseRoster& roster, const GenerationResult& result) {
    std::set<std::string> all;
    for (const Course& c : roster) all.insert(c.name);

    std::vector<ScheduleEntry> entries = filterSchedule(roster, result.placements, all);
    if (entries.empty()) {
        std::cout << "  (no courses placed)\n";
        return;
    }

    std::cout << "Master schedule:\n";
    printCourseTableHeader();
    for (const ScheduleEntry& e : entries) {
        printCourseRow(e);
    }
    std::cout << "\n";
}

void printValidationReport(const ValidationReport& report, const LoadRules& rules) {
    std::cout << "Constraint verification:\n";

    if (report.clashes.empty()) {
        std::cout << "  [ok]   No student attends two classes in the same slot.\n";
    } else {
        std::cout << "  [FAIL] " << report.clashes.size() << " clash(es):\n";
        for (const ClashViolation& v : report.clashes) {
            std::cout << "         " << v.studentId << " on " << kDayNames[v.day]
                      << " " << kSlotLabels[v.slot] << ":";
            for (const std::string& c : v.courses) std::cout << " [" << c << "]";
            std::cout << "\n";
        }
    }

    if (report.capViolations.empty()) {
        std::cout << "  [ok]   Daily classes capped at " << rules.dailyCap << ".\n";
    } else {
        std::cout << "  [FAIL] " << report.capViolations.size() << " daily cap violation(s):\n";
        for (const CapViolation& v : report.capViolations) {
            std::cout << "         " << v.studentId << " has " << v.classes
                      << " classes on " << kDayNames[v.day] << "\n";
        }
    }

    if (report.unplacedCourses.empty()) {
        std::cout << "  [ok]   All " << report.placedCount << " courses placed.\n";
    } else {
        std::cout << "  [FAIL] " << report.unplacedCourses.size() << " course(s) unplaced.\n";
    }

    std::cout << "  Load penalty: " << report.penalty << "\n\n";
}

/**
 * @brief Render a StudentGrid with calendar-ordered day columns.
 */
void printStudentGrid(const StudentGrid& grid) {
    std::cout << "    " << std::left << std::setw(kTimeWidth) << "Time Slot";
    for (int d = 0; d < DAYS; ++d) {
        std::cout << " | " << std::left << std::setw(kCellWidth) << kDayNames[d];
    }
    std::cout << "\n";

    std::cout << "    " << std::string(kTimeWidth, '-');
    for (int d = 0; d < DAYS; ++d) {
        std::cout << "-+-" << std::string(kCellWidth, '-');
    }
    std::cout << "\n";

    for (int s = 0; s < SLOTS_PER_DAY; ++s) {
        std::cout << "    " << std::left << std::setw(kTimeWidth) << kSlotLabels[s];
        for (int d = 0; d < DAYS; ++d) {
            std::cout << " | " << std::left << std::setw(kCellWidth) << fit(grid[s][d], kCellWidth);
        }
        std::cout << "\n";
    }
}

void printCourseDetails(const std::vector<ScheduleEntry>& entries) {
    if (entries.empty()) {
        std::cout << "  (no classes scheduled)\n";
        return;
    }
    printCourseTableHeader();
    for (const ScheduleEntry& e : entries) {
        printCourseRow(e);
    }
}

/**
 * @brief Print pretty, per-student schedules for a generated timetable.
 *
 * Students are listed in id order; each gets a weekly grid followed by the
 * course detail table.
 */
void printAllStudentSchedules(const CourseRoster& roster, const GenerationResult& result) {
    std::set<std::string> students;
    for (const Course& c : roster) {
        students.insert(c.students.begin(), c.students.end());
    }

    for (const std::string& id : students) {
        std::vector<ScheduleEntry> entries =
                filterSchedule(roster, result.placements, coursesOfStudent(roster, id));

        std::cout << "----------------------------------------\n";
        std::cout << "Schedule for " << id << ":\n\n";
        printStudentGrid(buildStudentGrid(entries));
        std::cout << "\n";
        printCourseDetails(entries);
        std::cout << "\n";
    }
}
