#include "json.hpp"

namespace jsonmsg {
json to_json(const Address& a)
{
    return a.to_string();
}

json to_json(const TokenId& id)
{
    return id.value();
}

namespace {
    json event_fields(const nft::event::Transfer& e)
    {
        return {
            { "from", to_json(e.from) },
            { "to", to_json(e.to) },
            { "tokenId", to_json(e.tokenId) }
        };
    }
    json event_fields(const nft::event::Approval& e)
    {
        return {
            { "owner", to_json(e.owner) },
            { "approved", to_json(e.approved) },
            { "tokenId", to_json(e.tokenId) }
        };
    }
    json event_fields(const nft::event::ApprovalForAll& e)
    {
        return {
            { "owner", to_json(e.owner) },
            { "operator", to_json(e.operatorAccount) },
            { "approved", e.approved }
        };
    }
}

json to_json(const nft::Event& e)
{
    return std::visit([](auto& ev) -> json {
        json j = event_fields(ev);
        j["event"] = std::string(ev.name);
        return j;
    },
        e);
}

json to_json(const events::Entry& e)
{
    json j = to_json(e.event);
    j["seq"] = e.seq;
    return j;
}

json to_json(const std::vector<events::Entry>& entries)
{
    json j = json::array();
    for (auto& e : entries)
        j.push_back(to_json(e));
    return j;
}
}
