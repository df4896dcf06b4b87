#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include <array>
#include <optional>
#include <set>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief One placed course as seen by a student.
 */
struct ScheduleEntry {
    std::string course;
    std::string faculty;
    int day;
    int slot;
    std::string room;
};

/**
 * @brief A student matched by the login lookup.
 */
struct StudentProfile {
    std::string studentId;
    std::string studentName;
    std::vector<std::string> courses; ///< Subjects in ingestion order, no duplicates.
};

/// grid[slot][day] = cell text; rows are slots, columns are days.
using StudentGrid = std::array<std::array<std::string, DAYS>, SLOTS_PER_DAY>;

/// Text of a grid cell with no class.
static const std::string kEmptyCell = "---";


///////////////////////////
///       QUERIES       ///
///////////////////////////
/**
 * @brief Project an assignment onto a set of courses.
 *
 * Pure: returns the placed courses of courseSet ordered by day, then slot,
 * then course name. Unplaced courses and names not in the roster are
 * skipped. An empty courseSet yields an empty list.
 */
std::vector<ScheduleEntry> filterSchedule(const CourseRoster& roster,
                                          const std::vector<Placement>& placements,
                                          const std::set<std::string>& courseSet);

/**
 * @brief Arrange entries in a slot × day grid, empty cells as kEmptyCell.
 *
 * Entries sharing a cell are joined with " / ".
 */
StudentGrid buildStudentGrid(const std::vector<ScheduleEntry>& entries);

/**
 * @brief Courses of the roster a student is enrolled in.
 */
std::set<std::string> coursesOfStudent(const CourseRoster& roster, const std::string& studentId);

/**
 * @brief Look up a student by partial name and partial id.
 *
 * Both parts are matched case-insensitively as substrings and must be
 * non-empty. The first matching record selects the student; all of that
 * student's subjects are collected.
 *
 * @return The matched profile, or std::nullopt when nothing matches.
 */
std::optional<StudentProfile> findStudent(const EnrollmentData& enrollment,
                                          const std::string& namePart,
                                          const std::string& idPart);
