#pragma once
#include "events/event_log.hpp"
#include "general/errors.hpp"
#include "general/result.hpp"
#include "nlohmann/json.hpp"

namespace jsonmsg {
using namespace nlohmann;

json to_json(const Address&);
json to_json(const TokenId&);
json to_json(const nft::Event&);
json to_json(const events::Entry&);
json to_json(const std::vector<events::Entry>&);
inline json to_json(const std::string& s) { return s; }
inline json to_json(uint64_t v) { return v; }
inline json to_json(bool b) { return b; }
inline json to_json(const json& j) { return j; }

// {"code": ..., "error": ...}
inline json status_json(Error e)
{
    json j;
    j["code"] = e.code;
    if (e.is_error()) {
        j["error"] = e.strerror();
    } else {
        j["error"] = nullptr;
    }
    return j;
}

// status plus "result", which is null for void and for errors
template <typename T>
inline json result_json(const tl::expected<T, Error>& e)
{
    if (!e.has_value()) {
        json j = status_json(e.error());
        j["result"] = nullptr;
        return j;
    }
    json j = status_json(Error::none);
    if constexpr (std::is_void_v<T>)
        j["result"] = nullptr;
    else
        j["result"] = to_json(*e);
    return j;
}
}
