///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "constraints.hpp"
#include "demo_instances.hpp"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(StudentScheduleState, EmptyDaysEarnTheLightDayReward) {
    CourseRoster roster = makeSharedStudentRoster();
    RosterIndex index = buildRosterIndex(roster);
    StudentScheduleState state(index, LoadRules{});

    int penalty = 0;
    ASSERT_TRUE(state.evaluate(0, 0, 0, penalty));
    // Two students, both with an empty Monday.
    EXPECT_EQ(penalty, -10);
}

TEST(StudentScheduleState, SharedStudentBlocksTheSameSlot) {
    CourseRoster roster = makeSharedStudentRoster();
    RosterIndex index = buildRosterIndex(roster);
    StudentScheduleState state(index, LoadRules{});

    state.place(0, 2, 1);

    EXPECT_FALSE(state.canPlace(1, 2, 1));
    EXPECT_TRUE(state.canPlace(1, 2, 2));
    EXPECT_TRUE(state.canPlace(1, 3, 1));

    int penalty = 0;
    ASSERT_TRUE(state.evaluate(1, 2, 2, penalty));
    // S1 has one class that day (still light), S3 has none.
    EXPECT_EQ(penalty, -10);
}

TEST(StudentScheduleState, StackingOntoABusyDayIsPenalized) {
    CourseRoster roster = makeSingleStudentRoster(3);
    RosterIndex index = buildRosterIndex(roster);
    StudentScheduleState state(index, LoadRules{});

    state.place(0, 0, 0);
    state.place(1, 0, 1);

    int penalty = 0;
    ASSERT_TRUE(state.evaluate(2, 0, 2, penalty));
    EXPECT_EQ(penalty, 2);
    ASSERT_TRUE(state.evaluate(2, 1, 0, penalty));
    EXPECT_EQ(penalty, -5);
}

TEST(StudentScheduleState, DailyCapRejectsFurtherClasses) {
    CourseRoster roster = makeSingleStudentRoster(3);
    RosterIndex index = buildRosterIndex(roster);
    LoadRules rules;
    rules.dailyCap = 2;
    StudentScheduleState state(index, rules);

    state.place(0, 4, 0);
    state.place(1, 4, 3);

    EXPECT_FALSE(state.canPlace(2, 4, 1));
    EXPECT_TRUE(state.canPlace(2, 3, 1));
    EXPECT_EQ(state.classesOn(0, 4), 2);
}

TEST(StudentScheduleState, OccupiedSlotsKeepPlacementOrder) {
    CourseRoster roster = makeSingleStudentRoster(3);
    RosterIndex index = buildRosterIndex(roster);
    StudentScheduleState state(index, LoadRules{});

    state.place(0, 1, 3);
    state.place(1, 1, 0);
    state.place(2, 1, 2);

    std::vector<int> expected = {3, 0, 2};
    EXPECT_EQ(state.occupiedSlots(0, 1), expected);
    EXPECT_TRUE(state.occupiedSlots(0, 0).empty());
}

TEST(StudentScheduleState, OutOfGridCandidatesAreRejected) {
    CourseRoster roster = makeSingleStudentRoster(1);
    RosterIndex index = buildRosterIndex(roster);
    StudentScheduleState state(index, LoadRules{});

    EXPECT_FALSE(state.canPlace(0, DAYS, 0));
    EXPECT_FALSE(state.canPlace(0, 0, SLOTS_PER_DAY));
    EXPECT_FALSE(state.canPlace(0, -1, 0));
}

TEST(ComputeLoadPenalty, UsesTheClosedFormPerStudentDay) {
    CourseRoster roster = makeSingleStudentRoster(3);
    RosterIndex index = buildRosterIndex(roster);

    std::vector<Placement> sameDay = {{0, 0, 0, 0}, {1, 0, 1, 0}, {2, 0, 2, 0}};
    EXPECT_EQ(computeLoadPenalty(index, sameDay, LoadRules{}), -5 - 5 + 2);

    std::vector<Placement> spread = {{0, 0, 0, 0}, {1, 1, 0, 0}, {2, 2, 0, 0}};
    EXPECT_EQ(computeLoadPenalty(index, spread, LoadRules{}), -15);
}

TEST(ComputeLoadPenalty, IgnoresUnplacedEntries) {
    CourseRoster roster = makeSingleStudentRoster(2);
    RosterIndex index = buildRosterIndex(roster);

    std::vector<Placement> partial = {{0, 3, 1, 0}, {-1, 0, 0, 0}};
    EXPECT_EQ(computeLoadPenalty(index, partial, LoadRules{}), -5);
}

TEST(RosterIndex, NumbersStudentsInFirstSeenOrder) {
    CourseRoster roster = makeSharedStudentRoster();
    RosterIndex index = buildRosterIndex(roster);

    ASSERT_EQ(index.numStudents(), 3);
    EXPECT_EQ(index.studentIds[0], "S1");
    EXPECT_EQ(index.studentIds[1], "S2");
    EXPECT_EQ(index.studentIds[2], "S3");
    EXPECT_EQ(index.studentCourses[0].size(), 2u);
    EXPECT_EQ(index.studentIndex.at("S3"), 2);
}
