///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "validation.hpp"
#include <array>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
ValidationReport validateAssignment(const CourseRoster& roster,
                                    const std::vector<Placement>& placements,
                                    const LoadRules& rules) {
    ValidationReport report;
    RosterIndex index = buildRosterIndex(roster);
    int numCourses = index.numCourses();

    // Keep only well-formed placements, one per course.
    std::vector<Placement> placed;
    std::vector<bool> seen(numCourses, false);
    for (const Placement& p : placements) {
        if (p.courseIndex < 0 || p.courseIndex >= numCourses) continue;
        if (p.day < 0 || p.day >= DAYS || p.slot < 0 || p.slot >= SLOTS_PER_DAY) continue;
        if (seen[p.courseIndex]) continue;
        seen[p.courseIndex] = true;
        placed.push_back(p);
    }
    for (int c = 0; c < numCourses; ++c) {
        if (!seen[c]) report.unplacedCourses.push_back(roster[c].name);
    }
    report.placedCount = (int)placed.size();

    // attendance[student][day][slot] = courses the student sits in then.
    using SlotCourses = std::array<std::vector<int>, SLOTS_PER_DAY>;
    std::vector<std::array<SlotCourses, DAYS>> attendance(index.numStudents());
    for (const Placement& p : placed) {
        for (int s : index.courseStudents[p.courseIndex]) {
            attendance[s][p.day][p.slot].push_back(p.courseIndex);
        }
    }

    for (int s = 0; s < index.numStudents(); ++s) {
        for (int d = 0; d < DAYS; ++d) {
            int classes = 0;
            for (int slot = 0; slot < SLOTS_PER_DAY; ++slot) {
                const std::vector<int>& courses = attendance[s][d][slot];
                classes += (int)courses.size();
                if (courses.size() > 1) {
                    ClashViolation clash{index.studentIds[s], d, slot, {}};
                    for (int c : courses) clash.courses.push_back(roster[c].name);
                    report.clashes.push_back(clash);
                }
            }
            if (classes > rules.dailyCap) {
                report.capViolations.push_back({index.studentIds[s], d, classes});
            }
        }
    }

    report.penalty = computeLoadPenalty(index, placed, rules);
    return report;
}
