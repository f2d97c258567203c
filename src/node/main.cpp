#include "api/json.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"
#include "global/globals.hpp"
#include "registryserver/server.hpp"
#include "script/executor.hpp"
#include "spdlog/spdlog.h"
#include <fstream>
#include <iostream>

namespace {
void hook_event_logger(RegistryServer& server)
{
    if (auto l { event_log() }) {
        server.event_log().subscribe([l](const events::Entry& e) {
            l->info(jsonmsg::to_json(e).dump());
        });
    }
}

script::RunSummary run_script(RegistryServer& server, const std::string& path)
{
    if (path.empty()) {
        spdlog::debug("Reading commands from standard input");
        return script::run(server, std::cin, std::cout);
    }
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open script file '" + path + "'.");
    spdlog::debug("Reading commands from '{}'", path);
    return script::run(server, file, std::cout);
}
}

int run_app(int argc, char** argv)
{
    int i = init_config(argc, argv);
    if (i <= 0)
        return i; // >0 means continue with execution
    init_logging();

    RegistryServer server(
        { config().collection.name, config().collection.symbol },
        { .rejectSelfApproval = config().registry.rejectSelfApproval });
    hook_event_logger(server);

    auto summary { run_script(server, config().run.script) };
    spdlog::info("Executed {} commands, {} rejected, {} events, total supply {}",
        summary.executed, summary.rejected, server.event_log().size(), server.total_supply());

    if (config().run.printEvents)
        std::cout << jsonmsg::to_json(server.event_log().entries()).dump(1) << std::endl;
    if (config().run.printSnapshot)
        std::cout << serialize_hex(server.snapshot()) << std::endl;

    if (summary.inputError) {
        spdlog::error("Script aborted: {}", summary.inputError->format());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv)
{
    try {
        return run_app(argc, argv);
    } catch (Error e) {
        spdlog::error("{}", e.format());
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
    }
    return -1;
}
