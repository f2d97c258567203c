#include "globals.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace {
constexpr size_t logfileMaxSize { 1048576 * 5 }; // 5 MB
constexpr size_t logfileMaxFiles { 3 };

auto create_default_logger(const Config::Log& conf)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!conf.file.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(conf.file, logfileMaxSize, logfileMaxFiles));
    return std::make_shared<spdlog::logger>("nftreg", sinks.begin(), sinks.end());
}

auto create_event_logger(const std::string& filename)
{
    auto l { spdlog::rotating_logger_mt("events", filename, logfileMaxSize, logfileMaxFiles) };
    l->set_pattern("%v");
    l->flush_on(spdlog::level::info);
    return l;
}

Global globalinstance;
}

const Global& global()
{
    return globalinstance;
}

int init_config(int argc, char** argv)
{
    auto c { Config::from_args(argc, argv) };
    if (!c)
        return c.error();
    globalinstance.conf = std::move(*c);
    return 1;
}

const Config& config()
{
    return globalinstance.conf.value();
}

void init_logging()
{
    auto& conf { config() };
    auto logger { create_default_logger(conf.log) };
    logger->set_level(conf.log_level());
    spdlog::set_default_logger(logger);
    if (!conf.log.eventsFile.empty())
        globalinstance.eventLogger = create_event_logger(conf.log.eventsFile);
}
