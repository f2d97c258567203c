#pragma once
#include "general/address.hpp"
#include "nft/token_id.hpp"
#include <string_view>
#include <variant>

namespace nft {
namespace event {
    struct Transfer {
        static constexpr std::string_view name { "Transfer" };
        Address from;
        Address to;
        TokenId tokenId;
        bool operator==(const Transfer&) const = default;
    };
    struct Approval {
        static constexpr std::string_view name { "Approval" };
        Address owner;
        Address approved;
        TokenId tokenId;
        bool operator==(const Approval&) const = default;
    };
    struct ApprovalForAll {
        static constexpr std::string_view name { "ApprovalForAll" };
        Address owner;
        Address operatorAccount;
        bool approved;
        bool operator==(const ApprovalForAll&) const = default;
    };
}

using Event = std::variant<event::Transfer, event::Approval, event::ApprovalForAll>;

inline std::string_view event_name(const Event& e)
{
    return std::visit([](auto& ev) { return ev.name; }, e);
}
}
