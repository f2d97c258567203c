#include "executor.hpp"
#include "api/json.hpp"
#include "registryserver/server.hpp"
#include "spdlog/spdlog.h"

namespace script {
using namespace jsonmsg;
namespace {
    json handle(RegistryServer& s, const command::Mint& c)
    {
        return result_json(s.mint(c.to, c.tokenId, c.uri));
    }
    json handle(RegistryServer& s, const command::Transfer& c)
    {
        return result_json(s.transfer(c.caller, c.from, c.to, c.tokenId));
    }
    json handle(RegistryServer& s, const command::Approve& c)
    {
        return result_json(s.approve(c.caller, c.delegate, c.tokenId));
    }
    json handle(RegistryServer& s, const command::ApproveAll& c)
    {
        return result_json(s.set_approval_for_all(c.caller, c.operatorAccount, c.approved));
    }
    json handle(RegistryServer& s, const command::Burn& c)
    {
        return result_json(s.burn(c.caller, c.tokenId));
    }
    json handle(RegistryServer& s, const command::OwnerOf& c)
    {
        return result_json(s.owner_of(c.tokenId));
    }
    json handle(RegistryServer& s, const command::BalanceOf& c)
    {
        return result_json(s.balance_of(c.account));
    }
    json handle(RegistryServer& s, const command::GetApproved& c)
    {
        return result_json(s.get_approved(c.tokenId));
    }
    json handle(RegistryServer& s, const command::IsApprovedForAll& c)
    {
        return result_json(Result<bool>(s.is_approved_for_all(c.owner, c.operatorAccount)));
    }
    json handle(RegistryServer& s, const command::TokenUri& c)
    {
        return result_json(s.token_uri(c.tokenId));
    }
    json handle(RegistryServer& s, const command::TotalSupply&)
    {
        return result_json(Result<uint64_t>(s.total_supply()));
    }
    json handle(RegistryServer& s, const command::Exists& c)
    {
        return result_json(Result<bool>(s.exists(c.tokenId)));
    }
    json handle(RegistryServer&, const command::SupportsInterface& c)
    {
        return result_json(Result<bool>(RegistryServer::supports_interface(c.interfaceId)));
    }
    json handle(RegistryServer& s, const command::Name&)
    {
        return result_json(Result<std::string>(s.name()));
    }
    json handle(RegistryServer& s, const command::Symbol&)
    {
        return result_json(Result<std::string>(s.symbol()));
    }
}

json execute(RegistryServer& s, const Command& c)
{
    return std::visit([&](auto& cmd) { return handle(s, cmd); }, c);
}

RunSummary run(RegistryServer& s, std::istream& in, std::ostream& out)
{
    RunSummary summary;
    std::string line;
    for (size_t lineno = 1; std::getline(in, line); ++lineno) {
        try {
            auto c { parse_line(line) };
            if (!c)
                continue;
            json j = execute(s, *c);
            summary.executed += 1;
            if (j["code"] != 0)
                summary.rejected += 1;
            j["line"] = lineno;
            j["command"] = std::string(command_name(*c));
            out << j.dump() << "\n";
        } catch (Error e) {
            spdlog::error("Line {}: {}", lineno, e.format());
            json j = status_json(e);
            j["line"] = lineno;
            j["command"] = nullptr;
            j["result"] = nullptr;
            out << j.dump() << "\n";
            summary.inputError = e;
            break;
        }
    }
    out.flush();
    return summary;
}
}
