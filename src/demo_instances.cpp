///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>


///////////////////////////
///       PRESETS       ///
///////////////////////////
/**
 * @brief Shape of a synthetic roster.
 */
struct DemoShape {
    int tracks; ///< Number of independent programme tracks.
    int coursesPerTrack; ///< Courses offered in each track.
    int studentsPerTrack; ///< Students enrolled in each track.
    int coursesPerStudent; ///< Courses each student picks from the track.
};

static DemoShape shapeFor(DemoSize size) {
    switch (size) {
        case DemoSize::S:  return {1, 8, 40, 4};
        case DemoSize::M:  return {2, 10, 60, 6};
        case DemoSize::L:  return {4, 12, 80, 7};
        case DemoSize::XL: return {6, 14, 120, 8};
    }
    return {1, 8, 40, 4};
}

static const std::array<std::string, 6> kTrackNames = {
        "Finance", "Marketing", "Operations", "Strategy", "Analytics", "People"
};

static const std::array<std::string, 8> kFacultyNames = {
        "Prof. Rao", "Prof. Iyer", "Prof. Das", "Prof. Mehta",
        "Prof. Sen", "Prof. Khan", "Prof. Nair", "Prof. Gupta"
};

///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
/**
 * @brief Generate courses track by track, then enrol each student in a
 *        random subset of their track's courses.
 */
CourseRoster makeDemoRoster(DemoSize size, std::uint32_t seed) {
    DemoShape shape = shapeFor(size);
    std::mt19937 rng(seed);

    CourseRoster roster;
    int studentNumber = 1;

    for (int t = 0; t < shape.tracks; ++t) {
        int firstCourse = (int)roster.size();

        for (int k = 0; k < shape.coursesPerTrack; ++k) {
            Course course;
            course.name = kTrackNames[t % kTrackNames.size()] + " " + std::to_string(101 + k);
            course.faculty = kFacultyNames[(t * shape.coursesPerTrack + k) % kFacultyNames.size()];
            roster.push_back(course);
        }

        std::vector<int> pick(shape.coursesPerTrack);
        for (int s = 0; s < shape.studentsPerTrack; ++s) {
            char id[16];
            std::snprintf(id, sizeof(id), "H%03d-24", studentNumber++);

            std::iota(pick.begin(), pick.end(), 0);
            std::shuffle(pick.begin(), pick.end(), rng);
            for (int k = 0; k < shape.coursesPerStudent; ++k) {
                roster[firstCourse + pick[k]].students.push_back(id);
            }
        }
    }

    // Keep the sorted-unique student invariant of Course.
    for (Course& course : roster) {
        std::sort(course.students.begin(), course.students.end());
    }

    // A course nobody picked would be a malformed roster; drop it.
    roster.erase(std::remove_if(roster.begin(), roster.end(),
                                [](const Course& c) { return c.students.empty(); }),
                 roster.end());
    return roster;
}

DemoSize parseDemoSize(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return (char)std::toupper(ch); });
    if (upper == "S") return DemoSize::S;
    if (upper == "M") return DemoSize::M;
    if (upper == "L") return DemoSize::L;
    if (upper == "XL") return DemoSize::XL;
    throw std::invalid_argument("unknown demo size: " + text);
}


///////////////////////////
///     SCENARIOS       ///
///////////////////////////
CourseRoster makeSharedStudentRoster() {
    CourseRoster roster;
    roster.push_back({"MathA", "Prof. Rao", {"S1", "S2"}});
    roster.push_back({"MathB", "Prof. Iyer", {"S1", "S3"}});
    return roster;
}

CourseRoster makeSingleStudentRoster(int numCourses) {
    CourseRoster roster;
    for (int i = 0; i < numCourses; ++i) {
        roster.push_back({"Course " + std::to_string(i + 1), "Unknown", {"S1"}});
    }
    return roster;
}
