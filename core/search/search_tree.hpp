#pragma once

#include "domain/state.hpp"
#include "tree/node.hpp"
#include "policies/selection.hpp"
#include "policies/expansion.hpp"
#include "policies/rollout.hpp"
#include "policies/backpropagation.hpp"
#include "search/search_config.hpp"
#include "search/budget_manager.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace mcts {

// ─── Search Policies ───────────────────────────────────────────
// The four phases of a round as replaceable function handles.

struct SearchPolicies {
    SelectPolicy selection = selectUcb;
    ExpandPolicy expansion = expandRandom;
    RolloutPolicy rollout = randomRollout;
    BackpropagatePolicy backpropagation = backpropagate;
};

// ─── Search Tree ───────────────────────────────────────────────
// Monte Carlo Tree Search over an abstract State with:
// - UCB1 selection with random tie-breaking
// - one random expansion per round
// - random playout to a terminal state
// - reward backpropagation without sign flips
// - tree reuse across real moves via updateRoot()

class SearchTree {
public:
    class Builder;

    /// Throws std::invalid_argument for a null state, samples <= 0,
    /// max_tree_depth <= 1, a negative exploration constant or deadline,
    /// or an empty policy.
    SearchTree(StatePtr initial_state,
               const TreeConfig& config = TreeConfig(),
               SearchPolicies policies = SearchPolicies());

    SearchTree(SearchTree&&) = default;
    SearchTree& operator=(SearchTree&&) = default;

    /// Run config().samples rounds, then extract up to `search_depth`
    /// actions with the configured extraction strategy. A `seed` reseeds
    /// the generator first, so a sequence of calls can be replayed.
    std::vector<ActionPtr> searchForActions(int search_depth = 1,
                                            std::optional<uint32_t> seed = std::nullopt);

    /// One select / expand / simulate / backpropagate round.
    /// If the rollout or backpropagation throws, a leaf expanded in this
    /// round is retracted before the exception propagates.
    void executeRound();

    /// Read actions off the current tree without sampling.
    std::vector<ActionPtr> extractActions(int search_depth) const;

    /// Commit a real action: the matching child (explored or freshly
    /// created) becomes the root and every sibling subtree is released.
    void updateRoot(const ActionPtr& action);

    /// Optional predicate polled between rounds; returning true stops the search.
    void setCancelCheck(BudgetManager::CancelFn cancel) { cancel_ = std::move(cancel); }

    const Node& root() const { return *root_; }
    Node& root() { return *root_; }

    const TreeConfig& config() const { return config_; }
    const SearchStats& lastStats() const { return last_stats_; }
    int64_t totalRounds() const { return total_rounds_; }

    /// (action, visits, reward) of each child of the root, in expansion order.
    std::vector<ActionStats> rootActionStats() const;

private:
    TreeConfig config_;
    SearchPolicies policies_;
    std::unique_ptr<Node> root_;
    mutable std::mt19937 rng_;
    BudgetManager::CancelFn cancel_;
    SearchStats last_stats_;
    int64_t total_rounds_ = 0;
    int round_max_depth_ = 0;

    std::vector<ActionPtr> extractGreedy(int search_depth) const;
    std::vector<ActionPtr> extractLookahead(int search_depth) const;

    /// Best mean reward reachable within `plies`; fills the action path.
    static double lookahead(const Node& node, int plies, std::vector<ActionPtr>& path);
};

// ─── Builder ───────────────────────────────────────────────────

class SearchTree::Builder {
public:
    explicit Builder(StatePtr initial_state) : state_(std::move(initial_state)) {}

    Builder& samples(int n) { config_.samples = n; return *this; }
    Builder& explorationConst(double c) { config_.exploration_const = c; return *this; }
    Builder& maxTreeDepth(int d) { config_.max_tree_depth = d; return *this; }
    Builder& extraction(ExtractionStrategy s) { config_.extraction = s; return *this; }
    Builder& budgetSeconds(double s) { config_.budget_seconds = s; return *this; }
    Builder& seed(uint32_t s) { config_.seed = s; return *this; }
    Builder& config(const TreeConfig& c) { config_ = c; return *this; }

    Builder& selectPolicy(SelectPolicy fn) { policies_.selection = std::move(fn); return *this; }
    Builder& expandPolicy(ExpandPolicy fn) { policies_.expansion = std::move(fn); return *this; }
    Builder& rolloutPolicy(RolloutPolicy fn) { policies_.rollout = std::move(fn); return *this; }
    Builder& backpropagatePolicy(BackpropagatePolicy fn) {
        policies_.backpropagation = std::move(fn);
        return *this;
    }
    Builder& cancelCheck(BudgetManager::CancelFn fn) { cancel_ = std::move(fn); return *this; }

    /// Consumes the initial state; a second call throws std::logic_error.
    SearchTree build();

private:
    StatePtr state_;
    TreeConfig config_;
    SearchPolicies policies_;
    BudgetManager::CancelFn cancel_;
    bool built_ = false;
};

} // namespace mcts
