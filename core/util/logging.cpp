#include "util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcts {

namespace {
constexpr const char* kLoggerName = "mcts";
}

std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(kLoggerName);
    if (log == nullptr) {
        log = spdlog::stdout_color_mt(kLoggerName);
        log->set_level(spdlog::level::warn);
    }
    return log;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mcts
