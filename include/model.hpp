#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <array>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>


///////////////////////////
///      CALENDAR       ///
///////////////////////////
// Time grid: 5 days × 4 slots (90 minutes each)
static constexpr int DAYS = 5;
static constexpr int SLOTS_PER_DAY = 4;

/**
 * @brief Human-readable names for each teaching day, in calendar order.
 */
static const std::array<std::string, DAYS> kDayNames = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"
};

/**
 * @brief Display labels for each slot in a day.
 *
 * Only used for rendering; slot identity is the 0-based index.
 */
static const std::array<std::string, SLOTS_PER_DAY> kSlotLabels = {
        "09:00 AM - 10:30 AM",
        "11:00 AM - 12:30 PM",
        "02:00 PM - 03:30 PM",
        "04:00 PM - 05:30 PM"
};


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief A schedulable course with its faculty and enrolled students.
 */
struct Course {
    std::string name; ///< Subject name, unique within a roster.
    std::string faculty = "Unknown"; ///< Faculty label resolved by the ingestor.
    std::vector<std::string> students; ///< Normalized student ids (sorted, unique).
};

/// All courses of one input batch.
using CourseRoster = std::vector<Course>;

/// Subject name -> faculty name.
using CourseFaculty = std::map<std::string, std::string>;

/**
 * @brief One enrollment row produced by the ingestor.
 */
struct StudentRecord {
    std::string studentId; ///< Trimmed, uppercased id.
    std::string studentName; ///< Trimmed display name.
    std::string subject; ///< Subject the student is enrolled in.
};

/**
 * @brief Everything the ingestor extracted from one batch of source files.
 */
struct EnrollmentData {
    std::vector<StudentRecord> records; ///< One row per (student, subject) enrollment.
    CourseFaculty courseFaculty; ///< Every subject seen, with its faculty.
    std::vector<std::string> skippedFiles; ///< "path: reason" for files that could not be read.
};

/**
 * @brief Dense integer view of a roster shared by all solvers.
 *
 * Students are numbered in order of first appearance while walking the
 * roster, so the numbering is stable for a given roster.
 */
struct RosterIndex {
    std::vector<std::string> studentIds; ///< studentIds[s] = id of student s.
    std::unordered_map<std::string, int> studentIndex; ///< Reverse of studentIds.
    std::vector<std::vector<int>> courseStudents; ///< courseStudents[c] = students of course c.
    std::vector<std::vector<int>> studentCourses; ///< studentCourses[s] = courses of student s.

    int numCourses() const { return (int)courseStudents.size(); }
    int numStudents() const { return (int)studentIds.size(); }
};

/**
 * @brief Build the dense index for a roster.
 */
RosterIndex buildRosterIndex(const CourseRoster& roster);

/**
 * @brief Copy of text without leading and trailing whitespace.
 */
std::string trimWhitespace(const std::string& text);

/**
 * @brief Trim whitespace and uppercase a raw student id.
 */
std::string normalizeStudentId(const std::string& raw);

/**
 * @brief Display label for a room pool index ("CR-1", "CR-2", ...).
 */
std::string roomLabel(int roomIndex);
