#pragma once
#include "command.hpp"
#include "general/errors.hpp"
#include "nlohmann/json.hpp"
#include <istream>
#include <optional>
#include <ostream>

class RegistryServer;
namespace script {
// {"code", "error", "result"} of one command
nlohmann::json execute(RegistryServer&, const Command&);

struct RunSummary {
    size_t executed { 0 };
    size_t rejected { 0 };
    // set when a malformed line stopped the run
    std::optional<Error> inputError;
};

// Executes one command per line and writes one JSON line per command.
// Registry rejections are reported and execution continues, a malformed
// line is reported and ends the run.
RunSummary run(RegistryServer&, std::istream& in, std::ostream& out);
}
