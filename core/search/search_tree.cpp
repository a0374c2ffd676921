#include "search/search_tree.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace mcts {

namespace {

void validateConfig(const TreeConfig& config) {
    if (config.samples <= 0) {
        throw std::invalid_argument("The number of samples must be positive");
    }
    if (config.max_tree_depth <= 1) {
        throw std::invalid_argument("The maximal tree depth must be greater than 1");
    }
    if (config.exploration_const < 0.0) {
        throw std::invalid_argument("The exploration constant must be non-negative");
    }
    if (config.budget_seconds < 0.0) {
        throw std::invalid_argument("The time budget must be non-negative");
    }
}

void validatePolicies(const SearchPolicies& policies) {
    if (!policies.selection || !policies.expansion ||
        !policies.rollout || !policies.backpropagation) {
        throw std::invalid_argument("Every search policy must be set");
    }
}

} // namespace

SearchTree::SearchTree(StatePtr initial_state,
                       const TreeConfig& config,
                       SearchPolicies policies)
    : config_(config), policies_(std::move(policies)), rng_(config.seed) {
    if (!initial_state) {
        throw std::invalid_argument("SearchTree requires an initial state");
    }
    validateConfig(config_);
    validatePolicies(policies_);
    root_ = std::make_unique<Node>(std::move(initial_state));
}

// ─── Rounds ────────────────────────────────────────────────────

void SearchTree::executeRound() {
    Node* current = root_.get();
    int depth = 1;

    // 1. Selection
    while (current->isExpanded() && !current->isTerminal() &&
           depth < config_.max_tree_depth) {
        current = policies_.selection(*current, config_.exploration_const, rng_).node;
        depth++;
    }

    // 2. Expansion, unless the depth cap was reached
    Node* simulation_node = current;
    Node* expanded = nullptr;
    if (!current->isExpanded() && depth < config_.max_tree_depth) {
        simulation_node = policies_.expansion(*current, rng_);
        expanded = simulation_node;
        depth++;
    }

    try {
        // 3. Rollout
        double reward = policies_.rollout(simulation_node->state(), rng_);

        // 4. Backpropagate
        policies_.backpropagation(simulation_node, reward);
    } catch (const std::exception&) {
        // An unvisited leaf would poison every later selection.
        if (expanded != nullptr && expanded->visitCount() == 0 &&
            expanded->parent() == current) {
            current->retractChild(expanded);
        }
        throw;
    }

    total_rounds_++;
    round_max_depth_ = std::max(round_max_depth_, depth);
}

std::vector<ActionPtr> SearchTree::searchForActions(int search_depth,
                                                    std::optional<uint32_t> seed) {
    if (search_depth < 0) {
        throw std::invalid_argument("search_depth must be non-negative");
    }
    if (seed) {
        rng_.seed(*seed);
    }

    BudgetManager budget(config_.samples, config_.budget_seconds, cancel_);
    budget.start();
    round_max_depth_ = 0;

    while (budget.canContinue()) {
        executeRound();
        budget.recordRound();
    }

    last_stats_.rounds = budget.rounds();
    last_stats_.elapsed_seconds = budget.elapsedSeconds();
    last_stats_.budget_exhausted = budget.wasInterrupted();
    last_stats_.max_depth_reached = round_max_depth_;
    last_stats_.tree_size = root_->subtreeSize();

    auto log = logger();
    if (last_stats_.budget_exhausted) {
        log->warn("search stopped after {} of {} rounds ({:.3f}s)",
                  last_stats_.rounds, config_.samples, last_stats_.elapsed_seconds);
    }
    log->debug("search: {} rounds in {:.3f}s, tree size {}, root visits {}, depth {}",
               last_stats_.rounds, last_stats_.elapsed_seconds, last_stats_.tree_size,
               root_->visitCount(), last_stats_.max_depth_reached);

    return extractActions(search_depth);
}

// ─── Action extraction ─────────────────────────────────────────

std::vector<ActionPtr> SearchTree::extractActions(int search_depth) const {
    switch (config_.extraction) {
        case ExtractionStrategy::GREEDY:
            return extractGreedy(search_depth);
        case ExtractionStrategy::LOOKAHEAD:
            return extractLookahead(search_depth);
    }
    return {};
}

std::vector<ActionPtr> SearchTree::extractGreedy(int search_depth) const {
    std::vector<ActionPtr> actions;
    Node* current = root_.get();
    for (int i = 0; i < search_depth; i++) {
        if (current->isTerminal() || !current->hasChildren()) break;
        ChildRef best = policies_.selection(*current, 0.0, rng_);
        actions.push_back(best.action);
        current = best.node;
    }
    return actions;
}

std::vector<ActionPtr> SearchTree::extractLookahead(int search_depth) const {
    std::vector<ActionPtr> path;
    if (search_depth == 0 || root_->isTerminal() || !root_->hasChildren()) {
        return path;
    }
    lookahead(*root_, search_depth, path);
    return path;
}

double SearchTree::lookahead(const Node& node, int plies, std::vector<ActionPtr>& path) {
    path.clear();
    if (plies == 0 || node.isTerminal() || !node.hasChildren()) {
        return node.meanReward();
    }

    double best = -std::numeric_limits<double>::infinity();
    std::vector<ActionPtr> sub_path;
    for (const auto& edge : node.children()) {
        double value = lookahead(*edge.child, plies - 1, sub_path);
        if (value > best) {  // strict: first-found wins ties
            best = value;
            path.clear();
            path.push_back(edge.action);
            path.insert(path.end(), sub_path.begin(), sub_path.end());
        }
    }
    return best;
}

// ─── Tree reuse ────────────────────────────────────────────────

void SearchTree::updateRoot(const ActionPtr& action) {
    if (!action) {
        throw std::invalid_argument("updateRoot requires an action");
    }
    if (root_->isTerminal()) {
        throw std::logic_error("Cannot advance past a terminal root");
    }

    Node* next = root_->findChild(*action);
    bool reused = next != nullptr;
    if (!reused) {
        next = root_->addChild(action);
    }

    std::unique_ptr<Node> new_root = root_->removeChild(next);
    root_ = std::move(new_root);

    logger()->debug("root advanced by {} ({}, {} visits kept)",
                    action->toString(), reused ? "reused" : "new",
                    root_->visitCount());
}

std::vector<ActionStats> SearchTree::rootActionStats() const {
    std::vector<ActionStats> stats;
    stats.reserve(root_->childCount());
    for (const auto& edge : root_->children()) {
        stats.push_back({edge.action, edge.child->visitCount(), edge.child->totalReward()});
    }
    return stats;
}

// ─── Builder ───────────────────────────────────────────────────

SearchTree SearchTree::Builder::build() {
    if (built_) {
        throw std::logic_error("Builder has already produced a SearchTree");
    }
    built_ = true;
    SearchTree tree(std::move(state_), config_, policies_);
    tree.setCancelCheck(cancel_);
    return tree;
}

} // namespace mcts
