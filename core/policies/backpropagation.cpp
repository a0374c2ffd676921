#include "policies/backpropagation.hpp"

namespace mcts {

void backpropagate(Node* node, double reward) {
    while (node != nullptr) {
        node->recordVisit(reward);
        node = node->parent();
    }
}

} // namespace mcts
