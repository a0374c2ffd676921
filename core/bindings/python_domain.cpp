#include "bindings/python_domain.hpp"

#include <stdexcept>

namespace mcts {

// ─── PythonAction ──────────────────────────────────────────────

PythonAction::PythonAction(py::object action)
    : action_(std::move(action)), hash_(static_cast<size_t>(py::hash(action_))) {}

bool PythonAction::equals(const Action& other) const {
    auto* o = dynamic_cast<const PythonAction*>(&other);
    return o != nullptr && action_.equal(o->action_);
}

size_t PythonAction::hash() const {
    return hash_;
}

std::string PythonAction::toString() const {
    return py::str(action_).cast<std::string>();
}

const py::object& toPython(const ActionPtr& action) {
    auto* py_action = dynamic_cast<const PythonAction*>(action.get());
    if (py_action == nullptr) {
        throw std::invalid_argument("Action was not created from a Python object");
    }
    return py_action->object();
}

// ─── PythonState ───────────────────────────────────────────────

PythonState::PythonState(py::object state) : state_(std::move(state)) {
    for (const char* name : {"possible_actions", "execute_action", "is_terminal", "reward"}) {
        if (!py::hasattr(state_, name)) {
            throw std::invalid_argument(std::string("Python state must define '") + name + "'");
        }
    }
}

py::object PythonState::read(const char* name) const {
    py::object value = state_.attr(name);
    if (PyCallable_Check(value.ptr())) {
        return value();
    }
    return value;
}

std::vector<ActionPtr> PythonState::possibleActions() const {
    std::vector<ActionPtr> actions;
    for (py::handle item : read("possible_actions")) {
        actions.push_back(std::make_shared<const PythonAction>(
            py::reinterpret_borrow<py::object>(item)));
    }
    return actions;
}

std::unique_ptr<State> PythonState::executeAction(const Action& action) const {
    auto* py_action = dynamic_cast<const PythonAction*>(&action);
    if (py_action == nullptr) {
        throw std::invalid_argument("Python states only accept Python actions");
    }
    py::object next = state_.attr("execute_action")(py_action->object());
    return std::make_unique<PythonState>(std::move(next));
}

bool PythonState::isTerminal() const {
    return read("is_terminal").cast<bool>();
}

double PythonState::reward() const {
    return read("reward").cast<double>();
}

std::string PythonState::toString() const {
    return py::str(state_).cast<std::string>();
}

// ─── Rollout ───────────────────────────────────────────────────

RolloutPolicy makePythonRollout(py::function rollout) {
    return [rollout](const State& state, std::mt19937& /*rng*/) {
        auto& py_state = dynamic_cast<const PythonState&>(state);
        return rollout(py_state.object()).cast<double>();
    };
}

} // namespace mcts
