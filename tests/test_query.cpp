///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "query.hpp"


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class ScheduleQueryTest : public ::testing::Test {
protected:
    CourseRoster roster = {
            {"Accounting", "Prof. Rao", {"H001-24", "H002-24"}},
            {"Economics", "Prof. Iyer", {"H001-24"}},
            {"Law", "Prof. Das", {"H002-24"}},
            {"Ethics", "Unknown", {"H001-24"}}
    };

    // Ethics was never placed.
    std::vector<Placement> placements = {
            {0, 2, 1, 0},
            {1, 0, 3, 4},
            {2, 0, 3, 7},
            {-1, 0, 0, 0}
    };
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(ScheduleQueryTest, EmptyCourseSetGivesEmptySchedule) {
    EXPECT_TRUE(filterSchedule(roster, placements, {}).empty());
}

TEST_F(ScheduleQueryTest, EntriesAreOrderedByDaySlotAndName) {
    std::vector<ScheduleEntry> entries =
            filterSchedule(roster, placements, {"Accounting", "Economics", "Law"});

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].course, "Economics");
    EXPECT_EQ(entries[1].course, "Law");
    EXPECT_EQ(entries[2].course, "Accounting");

    EXPECT_EQ(entries[0].faculty, "Prof. Iyer");
    EXPECT_EQ(entries[0].day, 0);
    EXPECT_EQ(entries[0].slot, 3);
    EXPECT_EQ(entries[0].room, "CR-5");
    EXPECT_EQ(entries[1].room, "CR-8");
}

TEST_F(ScheduleQueryTest, UnplacedAndUnknownCoursesAreSkipped) {
    std::vector<ScheduleEntry> entries =
            filterSchedule(roster, placements, {"Ethics", "Astronomy", "Law"});

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].course, "Law");
}

TEST_F(ScheduleQueryTest, FilteringIsRepeatable) {
    std::set<std::string> courses = coursesOfStudent(roster, "H001-24");
    std::vector<ScheduleEntry> first = filterSchedule(roster, placements, courses);
    std::vector<ScheduleEntry> second = filterSchedule(roster, placements, courses);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].course, second[i].course);
        EXPECT_EQ(first[i].day, second[i].day);
        EXPECT_EQ(first[i].slot, second[i].slot);
        EXPECT_EQ(first[i].room, second[i].room);
    }
}

TEST_F(ScheduleQueryTest, CoursesOfStudentUsesRosterMembership) {
    std::set<std::string> expected = {"Accounting", "Economics", "Ethics"};
    EXPECT_EQ(coursesOfStudent(roster, "H001-24"), expected);
    EXPECT_TRUE(coursesOfStudent(roster, "H999-24").empty());
}

TEST_F(ScheduleQueryTest, GridPlacesCoursesAndMarksFreeCells) {
    std::vector<ScheduleEntry> entries =
            filterSchedule(roster, placements, coursesOfStudent(roster, "H001-24"));
    StudentGrid grid = buildStudentGrid(entries);

    EXPECT_EQ(grid[1][2], "Accounting");
    EXPECT_EQ(grid[3][0], "Economics");
    EXPECT_EQ(grid[0][0], kEmptyCell);
    EXPECT_EQ(grid[3][4], kEmptyCell);
}

TEST_F(ScheduleQueryTest, GridJoinsEntriesSharingACell) {
    // Economics and Law share Monday slot 3.
    std::vector<ScheduleEntry> entries =
            filterSchedule(roster, placements, {"Economics", "Law"});
    StudentGrid grid = buildStudentGrid(entries);

    EXPECT_EQ(grid[3][0], "Economics / Law");
}

TEST(FindStudent, MatchesPartialNameAndIdIgnoringCase) {
    EnrollmentData data;
    data.records = {
            {"H001-24", "Aakriti Sen", "Accounting"},
            {"H002-24", "Vikram Rao", "Accounting"},
            {"H001-24", "Aakriti Sen", "Economics"},
            {"H001-24", "Aakriti Sen", "Accounting"}
    };

    auto profile = findStudent(data, "  aakriti ", "h001");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->studentId, "H001-24");
    EXPECT_EQ(profile->studentName, "Aakriti Sen");
    std::vector<std::string> expected = {"Accounting", "Economics"};
    EXPECT_EQ(profile->courses, expected);
}

TEST(FindStudent, RequiresBothNameAndId) {
    EnrollmentData data;
    data.records = {{"H001-24", "Aakriti Sen", "Accounting"}};

    EXPECT_FALSE(findStudent(data, "", "H001").has_value());
    EXPECT_FALSE(findStudent(data, "Aakriti", "").has_value());
    EXPECT_FALSE(findStudent(data, "Vikram", "H001").has_value());
    EXPECT_FALSE(findStudent(data, "Aakriti", "H002").has_value());
}

TEST(FindStudent, FirstMatchingRecordDecidesTheStudent) {
    EnrollmentData data;
    data.records = {
            {"H010-24", "Priya Shah", "Law"},
            {"H011-24", "Priya Sharma", "Ethics"}
    };

    auto profile = findStudent(data, "Priya", "H01");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->studentId, "H010-24");
    EXPECT_EQ(profile->courses, std::vector<std::string>{"Law"});
}
