#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace mcts {

/// The engine's named logger ("mcts"). Created on first use with a
/// colour stdout sink at level warn.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace mcts
