#include "policies/selection.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mcts {

double ucb1Score(const Node& child, int parent_visits, double exploration_const) {
    if (child.visitCount() == 0) {
        throw std::logic_error("UCB1 score requested for an unvisited child");
    }
    double exploitation = child.meanReward();
    if (exploration_const == 0.0) {
        return exploitation;
    }
    double exploration = exploration_const *
        std::sqrt(2.0 * std::log(static_cast<double>(parent_visits)) / child.visitCount());
    return exploitation + exploration;
}

ChildRef selectUcb(Node& node, double exploration_const, std::mt19937& rng) {
    if (node.isTerminal()) {
        throw std::logic_error("Cannot select through a terminal node");
    }
    if (!node.hasChildren()) {
        throw std::logic_error("Cannot select from a node without children");
    }
    if (node.visitCount() == 0) {
        throw std::logic_error("Cannot select from an unvisited node");
    }

    double best = -std::numeric_limits<double>::infinity();
    std::vector<const Node::Edge*> tied;

    for (const auto& edge : node.children()) {
        double score = ucb1Score(*edge.child, node.visitCount(), exploration_const);
        if (score > best) {
            best = score;
            tied.clear();
            tied.push_back(&edge);
        } else if (score == best) {
            tied.push_back(&edge);
        }
    }

    if (tied.empty()) {
        throw std::logic_error("No child has a comparable UCB1 score");
    }

    const Node::Edge* chosen = tied.front();
    if (tied.size() > 1) {
        std::uniform_int_distribution<size_t> dist(0, tied.size() - 1);
        chosen = tied[dist(rng)];
    }
    return {chosen->action, chosen->child.get()};
}

} // namespace mcts
