// PyBind11 bindings for the MCTS engine.
// Lets Python domains (any object with possible_actions, execute_action,
// is_terminal and reward) drive the C++ search tree.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "bindings/python_domain.hpp"
#include "search/search_config.hpp"
#include "search/search_tree.hpp"
#include "util/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(mcts_bindings, m) {
    m.doc() = "Monte Carlo Tree Search C++ Core Bindings.\n\n"
              "Only the rollout phase can be replaced from Python (rollout_policy). "
              "Selection (UCB1), expansion (uniform random) and backpropagation "
              "always run the built-in C++ policies.";

    // ── ExtractionStrategy ──
    py::enum_<mcts::ExtractionStrategy>(m, "ExtractionStrategy")
        .value("GREEDY", mcts::ExtractionStrategy::GREEDY)
        .value("LOOKAHEAD", mcts::ExtractionStrategy::LOOKAHEAD);

    // ── TreeConfig ──
    py::class_<mcts::TreeConfig>(m, "TreeConfig")
        .def(py::init<>())
        .def_readwrite("samples", &mcts::TreeConfig::samples)
        .def_readwrite("exploration_const", &mcts::TreeConfig::exploration_const)
        .def_readwrite("max_tree_depth", &mcts::TreeConfig::max_tree_depth)
        .def_readwrite("extraction", &mcts::TreeConfig::extraction)
        .def_readwrite("budget_seconds", &mcts::TreeConfig::budget_seconds)
        .def_readwrite("seed", &mcts::TreeConfig::seed);

    // ── SearchStats ──
    py::class_<mcts::SearchStats>(m, "SearchStats")
        .def_readonly("rounds", &mcts::SearchStats::rounds)
        .def_readonly("elapsed_seconds", &mcts::SearchStats::elapsed_seconds)
        .def_readonly("budget_exhausted", &mcts::SearchStats::budget_exhausted)
        .def_readonly("max_depth_reached", &mcts::SearchStats::max_depth_reached)
        .def_readonly("tree_size", &mcts::SearchStats::tree_size);

    // ── MonteCarloSearchTree ──
    py::class_<mcts::SearchTree>(m, "MonteCarloSearchTree",
                                 "MCTS over a Python state; rollout_policy(state) -> float "
                                 "is the only pluggable phase.")
        .def(py::init([](py::object initial_state, const mcts::TreeConfig& config,
                         py::object rollout_policy) {
                 mcts::SearchPolicies policies;
                 if (!rollout_policy.is_none()) {
                     policies.rollout = mcts::makePythonRollout(
                         rollout_policy.cast<py::function>());
                 }
                 return std::make_unique<mcts::SearchTree>(
                     std::make_unique<mcts::PythonState>(std::move(initial_state)),
                     config, std::move(policies));
             }),
             py::arg("initial_state"), py::arg("config") = mcts::TreeConfig(),
             py::arg("rollout_policy") = py::none())
        .def("search_for_actions", [](mcts::SearchTree& tree, int search_depth,
                                      std::optional<uint32_t> random_seed) {
                 py::list actions;
                 for (const auto& action : tree.searchForActions(search_depth, random_seed)) {
                     actions.append(mcts::toPython(action));
                 }
                 return actions;
             },
             py::arg("search_depth") = 1, py::arg("random_seed") = py::none())
        .def("update_root", [](mcts::SearchTree& tree, py::object action) {
                 tree.updateRoot(std::make_shared<const mcts::PythonAction>(std::move(action)));
             })
        .def("root_visit_count", [](const mcts::SearchTree& tree) {
                 return tree.root().visitCount();
             })
        .def("root_total_reward", [](const mcts::SearchTree& tree) {
                 return tree.root().totalReward();
             })
        .def("root_action_stats", [](const mcts::SearchTree& tree) {
                 py::list stats;
                 for (const auto& s : tree.rootActionStats()) {
                     stats.append(py::make_tuple(mcts::toPython(s.action),
                                                 s.visit_count, s.total_reward));
                 }
                 return stats;
             })
        .def("tree_size", [](const mcts::SearchTree& tree) {
                 return tree.root().subtreeSize();
             })
        .def("total_rounds", &mcts::SearchTree::totalRounds)
        .def("last_stats", &mcts::SearchTree::lastStats);

    // ── Logging ──
    m.def("set_log_level", [](const std::string& level) {
        mcts::setLogLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
