#include "tree/node.hpp"

#include <algorithm>
#include <stdexcept>

namespace mcts {

Node::Node(StatePtr state) : state_(std::move(state)) {
    if (!state_) {
        throw std::invalid_argument("Node requires a state");
    }
    terminal_ = state_->isTerminal();
    if (!terminal_) {
        untried_actions_ = state_->possibleActions();
        if (untried_actions_.empty()) {
            throw std::logic_error("Non-terminal state offers no actions: " +
                                   state_->toString());
        }
    }
}

double Node::meanReward() const {
    if (visit_count_ == 0) {
        throw std::logic_error("Mean reward of an unvisited node is undefined");
    }
    return total_reward_ / visit_count_;
}

void Node::recordVisit(double reward) {
    visit_count_++;
    total_reward_ += reward;
}

Node* Node::addChild(const ActionPtr& action) {
    if (!action) {
        throw std::invalid_argument("addChild requires an action");
    }
    if (findChild(*action) != nullptr) {
        throw std::logic_error("Action already has a child: " + action->toString());
    }

    auto child = std::make_unique<Node>(state_->executeAction(*action));
    child->parent_ = this;

    auto it = std::find_if(untried_actions_.begin(), untried_actions_.end(),
        [&](const ActionPtr& a) { return a->equals(*action); });
    if (it != untried_actions_.end()) {
        untried_actions_.erase(it);
    }

    Node* raw = child.get();
    children_.push_back({action, std::move(child)});
    return raw;
}

std::unique_ptr<Node> Node::removeChild(const Node* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [child](const Edge& e) { return e.child.get() == child; });
    if (it == children_.end()) {
        throw std::logic_error("Child not found");
    }

    std::unique_ptr<Node> detached = std::move(it->child);
    detached->parent_ = nullptr;
    children_.erase(it);
    return detached;
}

void Node::retractChild(const Node* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [child](const Edge& e) { return e.child.get() == child; });
    if (it == children_.end()) {
        throw std::logic_error("Child not found");
    }

    untried_actions_.push_back(it->action);
    children_.erase(it);
}

Node* Node::findChild(const Action& action) const {
    size_t h = action.hash();
    for (const auto& edge : children_) {
        if (edge.action->hash() == h && edge.action->equals(action)) {
            return edge.child.get();
        }
    }
    return nullptr;
}

NodePhase Node::phase() const {
    if (terminal_) return NodePhase::TERMINAL;
    if (untried_actions_.empty()) return NodePhase::FULLY_EXPANDED;
    if (children_.empty()) return NodePhase::UNEXPANDED;
    return NodePhase::PARTIALLY_EXPANDED;
}

int Node::depth() const {
    int d = 0;
    for (const Node* n = this; n != nullptr; n = n->parent_) {
        d++;
    }
    return d;
}

size_t Node::subtreeSize() const {
    size_t count = 1;
    for (const auto& edge : children_) {
        count += edge.child->subtreeSize();
    }
    return count;
}

} // namespace mcts
