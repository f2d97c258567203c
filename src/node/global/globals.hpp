#pragma once
#include "config/config.hpp"
#include <memory>
#include <optional>

namespace spdlog {
class logger;
}

struct Global {
    std::shared_ptr<spdlog::logger> eventLogger;
    std::optional<Config> conf;
};

const Global& global();
// nullptr unless an events file is configured
inline spdlog::logger* event_log() { return global().eventLogger.get(); }
const Config& config();
int init_config(int argc, char** argv);
void init_logging();
