///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "threaded_solver.hpp"
#include "sequential_solver.hpp"
#include "demo_instances.hpp"
#include "validation.hpp"
#include <set>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ThreadedRestartSolver, DemoRosterIsValid) {
    CourseRoster roster = makeDemoRoster(DemoSize::XL);
    ThreadedRestartSolver solver(GeneratorConfig{}, 4);
    GenerationResult result = solver.generate(roster);

    ASSERT_TRUE(result.fullyPlaced);
    EXPECT_GE(result.attemptsUsed, 1);
    EXPECT_LE(result.attemptsUsed, 50);

    ValidationReport report = validateAssignment(roster, result.placements, LoadRules{});
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.penalty, result.penalty);
}

TEST(ThreadedRestartSolver, InfeasibleRosterUsesTheWholeBudget) {
    CourseRoster roster = makeSingleStudentRoster(21);
    ThreadedRestartSolver solver(GeneratorConfig{}, 4);
    GenerationResult result = solver.generate(roster);

    EXPECT_FALSE(result.fullyPlaced);
    EXPECT_EQ(result.attemptsUsed, 50);
    EXPECT_EQ(result.placedCount(), 20);
    EXPECT_EQ(result.unplacedCourses.size(), 1u);
}

TEST(ThreadedRestartSolver, EmptyRosterGivesEmptyAssignment) {
    ThreadedRestartSolver solver(GeneratorConfig{}, 3);
    GenerationResult result = solver.generate(CourseRoster{});

    EXPECT_TRUE(result.fullyPlaced);
    EXPECT_TRUE(result.placements.empty());
    EXPECT_GE(result.attemptsUsed, 1);
}

TEST(ThreadedRestartSolver, OneWorkerFollowsTheSequentialRun) {
    CourseRoster roster = makeDemoRoster(DemoSize::M);
    GeneratorConfig config;
    config.seed = 99;

    GenerationResult threaded = ThreadedRestartSolver(config, 1).generate(roster);
    GenerationResult sequential = SequentialGreedySolver(config).generate(roster);

    ASSERT_TRUE(threaded.fullyPlaced);
    ASSERT_TRUE(sequential.fullyPlaced);
    EXPECT_EQ(threaded.attemptsUsed, sequential.attemptsUsed);
    ASSERT_EQ(threaded.placements.size(), sequential.placements.size());
    for (size_t i = 0; i < threaded.placements.size(); ++i) {
        EXPECT_EQ(threaded.placements[i].day, sequential.placements[i].day);
        EXPECT_EQ(threaded.placements[i].slot, sequential.placements[i].slot);
        EXPECT_EQ(threaded.placements[i].roomIndex, sequential.placements[i].roomIndex);
    }
}

TEST(ThreadedRestartSolver, MoreWorkersThanAttemptsStayWithinBudget) {
    CourseRoster roster = makeSingleStudentRoster(21);
    GeneratorConfig config;
    config.maxAttempts = 2;
    GenerationResult result = ThreadedRestartSolver(config, 8).generate(roster);

    EXPECT_FALSE(result.fullyPlaced);
    EXPECT_EQ(result.attemptsUsed, 2);
}

TEST(ThreadedRestartSolver, SolverCanBeReused) {
    ThreadedRestartSolver solver(GeneratorConfig{}, 2);

    GenerationResult failed = solver.generate(makeSingleStudentRoster(21));
    GenerationResult solved = solver.generate(makeSharedStudentRoster());

    EXPECT_FALSE(failed.fullyPlaced);
    EXPECT_TRUE(solved.fullyPlaced);
    EXPECT_LE(solved.attemptsUsed, 50);
}

TEST(ThreadedRestartSolver, WorkerSeedsAreDistinct) {
    std::set<std::uint32_t> seeds;
    for (int w = 0; w < 16; ++w) {
        seeds.insert(ThreadedRestartSolver::workerSeed(42, w));
    }
    EXPECT_EQ(seeds.size(), 16u);
    EXPECT_EQ(ThreadedRestartSolver::workerSeed(42, 0), 42u);
}
