///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "query.hpp"
#include <algorithm>
#include <cctype>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return (char)std::tolower(ch); });
    return text;
}

/**
 * @brief Case-insensitive substring test.
 */
static bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}


///////////////////////////
///       QUERIES       ///
///////////////////////////
/**
 * @brief Select the placements of the requested courses.
 *
 * The roster supplies the faculty label; the placement supplies day, slot
 * and room. Sorting makes the output independent of roster order.
 */
std::vector<ScheduleEntry> filterSchedule(const CourseRoster& roster,
                                          const std::vector<Placement>& placements,
                                          const std::set<std::string>& courseSet) {
    std::vector<ScheduleEntry> entries;
    if (courseSet.empty()) return entries;

    for (const Placement& p : placements) {
        if (p.courseIndex < 0 || p.courseIndex >= (int)roster.size()) continue;
        const Course& course = roster[p.courseIndex];
        if (courseSet.count(course.name) == 0) continue;

        entries.push_back({course.name, course.faculty, p.day, p.slot, roomLabel(p.roomIndex)});
    }

    std::sort(entries.begin(), entries.end(),
              [](const ScheduleEntry& a, const ScheduleEntry& b) {
                  if (a.day != b.day) return a.day < b.day;
                  if (a.slot != b.slot) return a.slot < b.slot;
                  return a.course < b.course;
              });
    return entries;
}

StudentGrid buildStudentGrid(const std::vector<ScheduleEntry>& entries) {
    StudentGrid grid;
    for (auto& row : grid) row.fill(kEmptyCell);

    for (const ScheduleEntry& e : entries) {
        if (e.day < 0 || e.day >= DAYS || e.slot < 0 || e.slot >= SLOTS_PER_DAY) continue;
        std::string& cell = grid[e.slot][e.day];
        if (cell == kEmptyCell) {
            cell = e.course;
        } else {
            cell += " / " + e.course;
        }
    }
    return grid;
}

std::set<std::string> coursesOfStudent(const CourseRoster& roster, const std::string& studentId) {
    std::set<std::string> courses;
    for (const Course& c : roster) {
        if (std::find(c.students.begin(), c.students.end(), studentId) != c.students.end()) {
            courses.insert(c.name);
        }
    }
    return courses;
}

/**
 * @brief Login-style lookup over the enrollment records.
 *
 * Substring matching tolerates partial input; the first matching record
 * decides which student id the lookup resolves to.
 */
std::optional<StudentProfile> findStudent(const EnrollmentData& enrollment,
                                          const std::string& namePart,
                                          const std::string& idPart) {
    std::string name = trimWhitespace(namePart);
    std::string id = trimWhitespace(idPart);
    if (name.empty() || id.empty()) return std::nullopt;

    const StudentRecord* match = nullptr;
    for (const StudentRecord& r : enrollment.records) {
        if (containsIgnoreCase(r.studentId, id) && containsIgnoreCase(r.studentName, name)) {
            match = &r;
            break;
        }
    }
    if (!match) return std::nullopt;

    StudentProfile profile;
    profile.studentId = match->studentId;
    profile.studentName = match->studentName;
    for (const StudentRecord& r : enrollment.records) {
        if (r.studentId != profile.studentId) continue;
        if (std::find(profile.courses.begin(), profile.courses.end(), r.subject) != profile.courses.end())
            continue;
        profile.courses.push_back(r.subject);
    }
    return profile;
}
