#include <gtest/gtest.h>
#include "maze/maze_problem.hpp"
#include "search/pathfinder.hpp"
#include "verification/verification.hpp"

using namespace mazepath;

namespace {

// Solve and require the result to replay to the same cost.
SearchResult solveAndCheck(const MazeProblem& problem) {
    Pathfinder pathfinder;
    SearchResult result = pathfinder.search(problem);
    if (result.solution) {
        ValidationResult v = problem.validate(*result.solution);
        EXPECT_TRUE(v.is_solution) << formatActions(*result.solution);
        EXPECT_EQ(v.cost, result.cost);
    }
    return result;
}

} // namespace

// ─── Without a key ─────────────────────────────────────────────

TEST(PathfinderTest, SmallMazeWithoutKey) {
    MazeProblem problem({
        "XXXXX",
        "XI..X",
        "X.X.X",
        "X.G.X",
        "XXXXX"
    });
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(formatActions(*result.solution), "DDR");
    EXPECT_EQ(result.cost, 3);

    // Only the goal phase runs
    ASSERT_EQ(result.phases.size(), 1);
    EXPECT_EQ(result.phases[0].kind, PhaseKind::TO_GOAL);
    EXPECT_TRUE(result.phases[0].succeeded);

    ValidationResult v = problem.validate(*result.solution);
    EXPECT_TRUE(v.is_solution);
    EXPECT_EQ(v.cost, 3);
}

TEST(PathfinderTest, WindingMaze) {
    MazeProblem problem({
        "XXXXXXX",
        "X.....X",
        "XIX.X.X",
        "XX.X..X",
        "XG....X",
        "XXXXXXX"
    });
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(result.cost, 12);
    EXPECT_EQ(result.solution->size(), 12);
}

TEST(PathfinderTest, HeadsForNearestGoal) {
    MazeProblem problem({"XG.I...GX"});
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(formatActions(*result.solution), "LL");
    EXPECT_EQ(result.cost, 2);
}

TEST(PathfinderTest, PrefersCheaperRouteOverMud) {
    MazeProblem problem({
        "XXXXX",
        "XIM.X",
        "X..GX",
        "XXXXX"
    });
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(formatActions(*result.solution), "DRR");
    EXPECT_EQ(result.cost, 3);

    // Same length through the mud costs more
    std::vector<std::string> through_mud = {"R", "R", "D"};
    ValidationResult v = problem.validate(through_mud);
    EXPECT_TRUE(v.is_solution);
    EXPECT_EQ(v.cost, 5);
}

TEST(PathfinderTest, UnreachableGoal) {
    MazeProblem problem({
        "XXXXXX",
        "XI.XGX",
        "XXXXXX"
    });
    Pathfinder pathfinder;
    EXPECT_FALSE(pathfinder.solve(problem).has_value());
}

TEST(PathfinderTest, NoGoalsMeansNoSolution) {
    MazeProblem problem({"XI..X"});
    Pathfinder pathfinder;
    SearchResult result = pathfinder.search(problem);
    EXPECT_FALSE(result.solved());
    EXPECT_EQ(result.cost, -1);
    EXPECT_TRUE(result.phases.empty());
}

// ─── With a key ────────────────────────────────────────────────

TEST(PathfinderTest, FetchesKeyBeforeGoal) {
    MazeProblem problem({
        "XXXXXXX",
        "XK.I.GX",
        "XXXXXXX"
    });
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(formatActions(*result.solution), "LLRRRR");
    EXPECT_EQ(result.cost, 6);

    ASSERT_EQ(result.phases.size(), 2);
    EXPECT_EQ(result.phases[0].kind, PhaseKind::TO_KEY);
    EXPECT_EQ(result.phases[0].path_length, 2);
    EXPECT_EQ(result.phases[1].kind, PhaseKind::TO_GOAL);
    EXPECT_EQ(result.phases[1].path_length, 4);

    // Heading straight for the goal is not a solution
    std::vector<std::string> skip_key = {"R", "R"};
    EXPECT_FALSE(problem.validate(skip_key).is_solution);
}

TEST(PathfinderTest, OnlyRoutePassesThroughKey) {
    MazeProblem problem({
        "XXXXX",
        "XIK.X",
        "XXX.X",
        "XG..X",
        "XXXXX"
    });
    SearchResult result = solveAndCheck(problem);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(formatActions(*result.solution), "RRDDLL");
    EXPECT_EQ(result.cost, 6);

    // Dropping the key-phase prefix breaks the sequence
    std::vector<Action> without_prefix(result.solution->begin() + 1,
                                       result.solution->end());
    ValidationResult v = problem.validate(without_prefix);
    EXPECT_FALSE(v.is_solution);
    EXPECT_EQ(v.cost, -1);
}

TEST(PathfinderTest, EnclosedKeyFailsEvenWithReachableGoal) {
    MazeProblem problem({
        "XXXXXXX",
        "XI.GXKX",
        "XXXXXXX"
    });
    Pathfinder pathfinder;
    SearchResult result = pathfinder.search(problem);
    EXPECT_FALSE(result.solved());
    EXPECT_FALSE(result.budget_exhausted);
    ASSERT_EQ(result.phases.size(), 1);
    EXPECT_EQ(result.phases[0].kind, PhaseKind::TO_KEY);
    EXPECT_FALSE(result.phases[0].succeeded);
}

TEST(PathfinderTest, GoalUnreachableFromKey) {
    MazeProblem problem({
        "XXXXXXX",
        "XKI.XGX",
        "XXXXXXX"
    });
    Pathfinder pathfinder;
    SearchResult result = pathfinder.search(problem);
    EXPECT_FALSE(result.solved());
    ASSERT_EQ(result.phases.size(), 2);
    EXPECT_TRUE(result.phases[0].succeeded);
    EXPECT_FALSE(result.phases[1].succeeded);
}

// ─── Properties ────────────────────────────────────────────────

TEST(PathfinderTest, CellMarkedVisitedOnlyWhenItsChildIsGenerated) {
    // The goal is walled off, so the goal phase drains the 2x2 room.
    // (2,2) is queued twice, from (2,1) and from (1,2), before either copy
    // is expanded. Neither copy generates a child, so (2,2) is never marked.
    MazeProblem problem({
        "XXXXXX",
        "XI.XGX",
        "X..XXX",
        "XXXXXX"
    });
    Pathfinder pathfinder;
    SearchResult result = pathfinder.search(problem);
    EXPECT_FALSE(result.solved());
    ASSERT_EQ(result.phases.size(), 1);

    const PhaseStats& stats = result.phases[0];
    EXPECT_FALSE(stats.succeeded);
    EXPECT_EQ(stats.expansions, 5);
    EXPECT_EQ(stats.nodes_generated, 5);
    EXPECT_EQ(stats.visited, 3);
    EXPECT_EQ(result.total_expansions, 5);
}

TEST(PathfinderTest, RepeatedSearchesAreDeterministic) {
    MazeProblem problem({
        "XXXXXXXXX",
        "XI..M...X",
        "X.X.X.X.X",
        "X...K...X",
        "X.X.X.XGX",
        "X..M....X",
        "XXXXXXXXX"
    });
    Pathfinder pathfinder;
    SearchResult first = pathfinder.search(problem);
    ASSERT_TRUE(first.solved());
    for (int i = 0; i < 5; i++) {
        SearchResult again = pathfinder.search(problem);
        ASSERT_TRUE(again.solved());
        EXPECT_EQ(*again.solution, *first.solution);
        EXPECT_EQ(again.cost, first.cost);
    }

    SolutionChecker checker;
    EXPECT_TRUE(checker.checkResult(problem, first).passed);
}

TEST(PathfinderTest, ExpansionBudgetStopsSearch) {
    MazeProblem problem({
        "XXXXXXX",
        "X.....X",
        "XIX.X.X",
        "XX.X..X",
        "XG....X",
        "XXXXXXX"
    });
    PathfinderConfig config;
    config.max_expansions = 1;
    Pathfinder pathfinder(config);

    SearchResult result = pathfinder.search(problem);
    EXPECT_FALSE(result.solved());
    EXPECT_TRUE(result.budget_exhausted);
    EXPECT_EQ(result.total_expansions, 1);
}
