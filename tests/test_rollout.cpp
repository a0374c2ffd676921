#include <gtest/gtest.h>
#include "policies/rollout.hpp"
#include "test_domains.hpp"

using namespace mcts;
using namespace mcts::fixtures;

TEST(RolloutTest, TerminalStateReturnsItsReward) {
    ArmState leaf({0.25, 0.75}, 1);
    std::mt19937 rng(1);

    EXPECT_DOUBLE_EQ(randomRollout(leaf, rng), 0.75);
}

TEST(RolloutTest, PlaysUntilTerminal) {
    PathState start(6, 3);
    std::mt19937 rng(9);

    for (int i = 0; i < 50; i++) {
        double reward = randomRollout(start, rng);
        EXPECT_GE(reward, 0.0);
        EXPECT_LE(reward, 1.0);
    }
    EXPECT_TRUE(start.moves().empty());  // start state untouched
}

TEST(RolloutTest, ActionsAreChosenUniformly) {
    PathState coin(1);
    std::mt19937 rng(123);

    int wins = 0;
    const int trials = 1000;
    for (int i = 0; i < trials; i++) {
        if (randomRollout(coin, rng) == 1.0) wins++;
    }
    EXPECT_GT(wins, 400);
    EXPECT_LT(wins, 600);
}

TEST(RolloutTest, FilteredRolloutRestrictsChoices) {
    RolloutPolicy only_ones = makeFilteredRollout(
        [](const State&, const Action& a) { return actionValue(a) == 1; });
    PathState start(5);
    std::mt19937 rng(4);

    for (int i = 0; i < 20; i++) {
        EXPECT_DOUBLE_EQ(only_ones(start, rng), 1.0);
    }
}

TEST(RolloutTest, FilteredRolloutFallsBackWhenNothingPasses) {
    RolloutPolicy nothing = makeFilteredRollout(
        [](const State&, const Action&) { return false; });
    PathState start(4);
    std::mt19937 rng(4);

    double reward = nothing(start, rng);
    EXPECT_GE(reward, 0.0);
    EXPECT_LE(reward, 1.0);
}

TEST(RolloutTest, FilteredRolloutRequiresFilter) {
    EXPECT_THROW(makeFilteredRollout(nullptr), std::invalid_argument);
}

TEST(RolloutTest, DomainErrorsPropagate) {
    ThrowingState broken;
    std::mt19937 rng(1);

    EXPECT_THROW(randomRollout(broken, rng), std::runtime_error);
}
