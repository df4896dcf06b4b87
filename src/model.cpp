///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <algorithm>
#include <cctype>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Build the dense student/course index for a roster.
 *
 * Walks courses in roster order and numbers each new student id on first
 * sight. Duplicate ids inside one course are collapsed.
 */
RosterIndex buildRosterIndex(const CourseRoster& roster) {
    RosterIndex index;
    index.courseStudents.resize(roster.size());

    for (int c = 0; c < (int)roster.size(); ++c) {
        std::vector<int>& members = index.courseStudents[c];
        for (const std::string& id : roster[c].students) {
            auto it = index.studentIndex.find(id);
            int s;
            if (it == index.studentIndex.end()) {
                s = (int)index.studentIds.size();
                index.studentIds.push_back(id);
                index.studentIndex.emplace(id, s);
                index.studentCourses.emplace_back();
            } else {
                s = it->second;
            }
            if (std::find(members.begin(), members.end(), s) != members.end()) continue;
            members.push_back(s);
            index.studentCourses[s].push_back(c);
        }
    }

    return index;
}

std::string trimWhitespace(const std::string& text) {
    size_t first = 0;
    size_t last = text.size();
    while (first < last && std::isspace((unsigned char)text[first])) ++first;
    while (last > first && std::isspace((unsigned char)text[last - 1])) --last;
    return text.substr(first, last - first);
}

std::string normalizeStudentId(const std::string& raw) {
    std::string id = trimWhitespace(raw);
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char ch) { return (char)std::toupper(ch); });
    return id;
}

std::string roomLabel(int roomIndex) {
    return "CR-" + std::to_string(roomIndex + 1);
}
