#include "policies/expansion.hpp"

#include <stdexcept>

namespace mcts {

namespace {

void requireExpandable(const Node& node) {
    if (node.isTerminal()) {
        throw std::logic_error("Should not expand a terminal node");
    }
    if (node.isExpanded()) {
        throw std::logic_error("Should not expand a node that has already been expanded");
    }
}

} // namespace

Node* expandRandom(Node& node, std::mt19937& rng) {
    requireExpandable(node);

    const auto& untried = node.untriedActions();
    std::uniform_int_distribution<size_t> dist(0, untried.size() - 1);
    // Copy: addChild erases the action from the untried list.
    ActionPtr action = untried[dist(rng)];
    return node.addChild(action);
}

Node* expandInOrder(Node& node, std::mt19937& /*rng*/) {
    requireExpandable(node);

    ActionPtr action = node.untriedActions().front();
    return node.addChild(action);
}

} // namespace mcts
