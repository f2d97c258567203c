#include "token_id.hpp"
#include "general/errors.hpp"
#include <charconv>

std::optional<TokenId> TokenId::parse(std::string_view s)
{
    uint64_t v;
    auto end { s.data() + s.size() };
    auto [ptr, ec] { std::from_chars(s.data(), end, v) };
    if (s.empty() || ec != std::errc() || ptr != end)
        return {};
    return TokenId(v);
}

TokenId TokenId::parse_throw(std::string_view s)
{
    if (auto p { parse(s) })
        return *p;
    throw Error(EBADTOKENID);
}
