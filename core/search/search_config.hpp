#pragma once

#include "domain/state.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mcts {

/// How actions are read off the tree once the sampling budget is spent.
enum class ExtractionStrategy {
    GREEDY,     // repeated pure-exploitation selection, random tie-break
    LOOKAHEAD   // exhaustive lookahead, best mean at the deepest node, first-found tie-break
};

/// Search configuration parameters.
struct TreeConfig {
    int samples = 1000;               // Rounds per searchForActions() call
    double exploration_const = 1.0;   // C in the UCB1 formula during rounds
    int max_tree_depth = 10;          // Depth cap, root has depth 1
    ExtractionStrategy extraction = ExtractionStrategy::GREEDY;
    double budget_seconds = 0.0;      // Wall-clock deadline per search, 0 = none
    uint32_t seed = 42;               // Seed of the tree's generator
};

/// Summary of the most recent searchForActions() call.
struct SearchStats {
    int rounds = 0;
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;    // true if the deadline or cancel hook stopped it early
    int max_depth_reached = 0;        // deepest simulation-start node of any round
    size_t tree_size = 0;
};

/// Per-child statistics of the current root.
struct ActionStats {
    ActionPtr action;
    int visit_count = 0;
    double total_reward = 0.0;
};

} // namespace mcts
