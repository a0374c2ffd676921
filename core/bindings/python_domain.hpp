#pragma once

#include "domain/state.hpp"
#include "policies/rollout.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace mcts {

/**
 * Action backed by an arbitrary Python object.
 *
 * Equality and hashing are delegated to the object's __eq__ and __hash__,
 * so Python actions can key the child mapping directly.
 */
class PythonAction : public Action {
public:
    explicit PythonAction(py::object action);

    bool equals(const Action& other) const override;
    size_t hash() const override;
    std::string toString() const override;

    const py::object& object() const { return action_; }

private:
    py::object action_;
    size_t hash_;
};

/**
 * State backed by a Python object exposing the domain interface:
 * possible_actions, execute_action(action), is_terminal and reward.
 *
 * possible_actions, is_terminal and reward may be plain attributes,
 * properties or zero-argument methods.
 */
class PythonState : public State {
public:
    explicit PythonState(py::object state);

    std::vector<ActionPtr> possibleActions() const override;
    std::unique_ptr<State> executeAction(const Action& action) const override;
    bool isTerminal() const override;
    double reward() const override;
    std::string toString() const override;

    const py::object& object() const { return state_; }

private:
    py::object state_;

    /// Read an attribute, calling it when it is a method.
    py::object read(const char* name) const;
};

/// Unwrap the Python object behind an action produced by PythonState.
const py::object& toPython(const ActionPtr& action);

/// Rollout policy delegating to a Python callable `f(state) -> float`.
RolloutPolicy makePythonRollout(py::function rollout);

} // namespace mcts
