#pragma once

#include "tree/node.hpp"

#include <functional>
#include <random>

namespace mcts {

/// Materialize one untried action, chosen uniformly at random.
/// Throws std::logic_error on a fully expanded or terminal node.
Node* expandRandom(Node& node, std::mt19937& rng);

/// Deterministic variant: always takes the first untried action.
Node* expandInOrder(Node& node, std::mt19937& rng);

using ExpandPolicy = std::function<Node*(Node&, std::mt19937&)>;

} // namespace mcts
