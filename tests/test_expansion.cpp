#include <gtest/gtest.h>
#include "policies/expansion.hpp"
#include "test_domains.hpp"

#include <cstdlib>
#include <map>

using namespace mcts;
using namespace mcts::fixtures;

TEST(ExpansionTest, CreatesChildForUntriedAction) {
    Node root(std::make_unique<PathState>(3, 4));
    std::mt19937 rng(3);

    Node* child = expandRandom(root, rng);

    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->parent(), &root);
    EXPECT_EQ(root.childCount(), 1);
    EXPECT_EQ(root.untriedActions().size(), 3);
    EXPECT_EQ(root.findChild(*root.children().front().action), child);
}

TEST(ExpansionTest, UntriedActionsAreSampledUniformly) {
    const int num_actions = 8;
    const int per_action = 500;
    const double deviation = 0.20;
    std::mt19937 rng(11);
    std::map<int, int> frequency;

    for (int i = 0; i < num_actions * per_action; i++) {
        Node root(std::make_unique<ArmState>(std::vector<double>(num_actions, 0.0)));
        Node* child = expandRandom(root, rng);
        auto& state = dynamic_cast<const ArmState&>(child->state());
        frequency[state.chosen()]++;
    }

    ASSERT_EQ(frequency.size(), num_actions);
    for (const auto& [action, count] : frequency) {
        EXPECT_LE(std::abs(count - per_action), per_action * deviation)
            << "action " << action;
    }
}

TEST(ExpansionTest, EveryActionExpandedExactlyOnce) {
    Node root(std::make_unique<PathState>(2, 5));
    std::mt19937 rng(5);

    for (int i = 0; i < 5; i++) {
        expandRandom(root, rng);
    }
    EXPECT_TRUE(root.isExpanded());
    for (int i = 0; i < 5; i++) {
        EXPECT_NE(root.findChild(*makeAction(i)), nullptr);
    }
}

TEST(ExpansionTest, FullyExpandedNodeThrows) {
    Node root(std::make_unique<PathState>(2));
    root.addChild(makeAction(0));
    root.addChild(makeAction(1));
    std::mt19937 rng(1);

    EXPECT_THROW(expandRandom(root, rng), std::logic_error);
    EXPECT_THROW(expandInOrder(root, rng), std::logic_error);
}

TEST(ExpansionTest, TerminalNodeThrows) {
    Node leaf(std::make_unique<ArmState>(std::vector<double>{1.0}, 0));
    std::mt19937 rng(1);

    EXPECT_THROW(expandRandom(leaf, rng), std::logic_error);
}

TEST(ExpansionTest, InOrderTakesFirstUntriedAction) {
    Node root(std::make_unique<PathState>(2, 3));
    std::mt19937 rng(1);

    for (int i = 0; i < 3; i++) {
        Node* child = expandInOrder(root, rng);
        EXPECT_EQ(actionValue(root.children().back().action), i);
        EXPECT_EQ(root.children().back().child.get(), child);
    }
}

TEST(ExpansionTest, DomainErrorsPropagate) {
    Node root(std::make_unique<ThrowingState>());
    std::mt19937 rng(1);

    EXPECT_THROW(expandRandom(root, rng), std::runtime_error);
    EXPECT_FALSE(root.hasChildren());
}
