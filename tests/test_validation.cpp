///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "validation.hpp"
#include "demo_instances.hpp"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ValidateAssignment, CleanAssignmentPasses) {
    CourseRoster roster = makeSharedStudentRoster();
    std::vector<Placement> placements = {{0, 0, 0, 1}, {1, 1, 0, 2}};

    ValidationReport report = validateAssignment(roster, placements, LoadRules{});

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.placedCount, 2);
    // S1, S2 and S3 each have one class on a light day.
    EXPECT_EQ(report.penalty, -5 * 4);
}

TEST(ValidateAssignment, ReportsSharedStudentClash) {
    CourseRoster roster = makeSharedStudentRoster();
    std::vector<Placement> placements = {{0, 2, 3, 0}, {1, 2, 3, 5}};

    ValidationReport report = validateAssignment(roster, placements, LoadRules{});

    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.clashes.size(), 1u);
    const ClashViolation& clash = report.clashes[0];
    EXPECT_EQ(clash.studentId, "S1");
    EXPECT_EQ(clash.day, 2);
    EXPECT_EQ(clash.slot, 3);
    std::vector<std::string> expected = {"MathA", "MathB"};
    EXPECT_EQ(clash.courses, expected);
}

TEST(ValidateAssignment, ReportsDailyCapViolation) {
    CourseRoster roster = makeSingleStudentRoster(3);
    LoadRules rules;
    rules.dailyCap = 2;
    std::vector<Placement> placements = {{0, 1, 0, 0}, {1, 1, 1, 0}, {2, 1, 2, 0}};

    ValidationReport report = validateAssignment(roster, placements, rules);

    EXPECT_TRUE(report.clashes.empty());
    ASSERT_EQ(report.capViolations.size(), 1u);
    EXPECT_EQ(report.capViolations[0].studentId, "S1");
    EXPECT_EQ(report.capViolations[0].day, 1);
    EXPECT_EQ(report.capViolations[0].classes, 3);
}

TEST(ValidateAssignment, MalformedPlacementsCountAsUnplaced) {
    CourseRoster roster = makeSingleStudentRoster(4);
    std::vector<Placement> placements = {
            {0, 0, 0, 0},
            {-1, 0, 0, 0},        // never placed
            {2, DAYS, 0, 0},      // outside the week
            {0, 3, 3, 0}          // duplicate of course 0
    };

    ValidationReport report = validateAssignment(roster, placements, LoadRules{});

    EXPECT_EQ(report.placedCount, 1);
    std::vector<std::string> expected = {"Course 2", "Course 3", "Course 4"};
    EXPECT_EQ(report.unplacedCourses, expected);
    EXPECT_TRUE(report.clashes.empty());
}
