#pragma once
#include "general/with_uint64.hpp"
#include <optional>
#include <string>
#include <string_view>

struct TokenId : public IsUint64 {
    using IsUint64::IsUint64;
    // decimal representation, throws Error(EBADTOKENID)
    static TokenId parse_throw(std::string_view);
    static std::optional<TokenId> parse(std::string_view);
    std::string to_string() const { return std::to_string(val); }
};
