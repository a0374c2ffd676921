#pragma once

#include "domain/state.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace mcts {

// ─── Node Phase ────────────────────────────────────────────────
// UNEXPANDED → PARTIALLY_EXPANDED → FULLY_EXPANDED.
// TERMINAL nodes are absorbing: never expanded, never selected through.

enum class NodePhase {
    UNEXPANDED,
    PARTIALLY_EXPANDED,
    FULLY_EXPANDED,
    TERMINAL
};

// ─── Node ──────────────────────────────────────────────────────
// A vertex of the search tree. Owns its state and its children;
// holds a non-owning pointer to its parent (null for the root).
// Children are kept in insertion order.

class Node {
public:
    struct Edge {
        ActionPtr action;
        std::unique_ptr<Node> child;
    };

    explicit Node(StatePtr state);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const State& state() const { return *state_; }
    Node* parent() const { return parent_; }

    // ── Statistics ──
    int visitCount() const { return visit_count_; }
    double totalReward() const { return total_reward_; }

    /// Average reward. Throws std::logic_error before the first visit.
    double meanReward() const;

    /// Count one sample passing through this node.
    void recordVisit(double reward);

    // ── Structure ──

    /// Materialize the child reached by `action`. The action is removed
    /// from the untried set when present. Throws std::logic_error if the
    /// action is already a child.
    Node* addChild(const ActionPtr& action);

    /// Detach `child` and hand its ownership to the caller.
    /// Throws std::logic_error if it is not a child of this node.
    std::unique_ptr<Node> removeChild(const Node* child);

    /// Drop `child` and return its action to the untried set, undoing
    /// the expansion that created it.
    void retractChild(const Node* child);

    /// Child reached by `action`, or nullptr.
    Node* findChild(const Action& action) const;

    const std::vector<Edge>& children() const { return children_; }
    size_t childCount() const { return children_.size(); }
    bool hasChildren() const { return !children_.empty(); }

    const std::vector<ActionPtr>& untriedActions() const { return untried_actions_; }

    bool isExpanded() const { return untried_actions_.empty(); }
    bool isTerminal() const { return terminal_; }
    NodePhase phase() const;

    /// Distance to the root plus one (the root has depth 1).
    int depth() const;

    /// Number of nodes in the subtree rooted here, this node included.
    size_t subtreeSize() const;

private:
    StatePtr state_;
    Node* parent_ = nullptr;
    std::vector<Edge> children_;
    std::vector<ActionPtr> untried_actions_;
    int visit_count_ = 0;
    double total_reward_ = 0.0;
    bool terminal_ = false;
};

} // namespace mcts
