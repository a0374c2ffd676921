#pragma once

#include "tree/node.hpp"

#include <functional>
#include <random>

namespace mcts {

/// An (action, child) pair returned by selection.
struct ChildRef {
    ActionPtr action;
    Node* node = nullptr;
};

/// UCB1 score of `child` under a parent visited `parent_visits` times:
///   mean(c) + C * sqrt(2 ln N / n_c)
/// The exploration term is dropped entirely when C == 0.
double ucb1Score(const Node& child, int parent_visits, double exploration_const);

/// Pick the child with maximal UCB1 score. Exact ties are broken
/// uniformly at random with `rng`.
///
/// Requires a visited node whose children have all been visited at
/// least once; violations throw std::logic_error.
ChildRef selectUcb(Node& node, double exploration_const, std::mt19937& rng);

using SelectPolicy = std::function<ChildRef(Node&, double, std::mt19937&)>;

} // namespace mcts
