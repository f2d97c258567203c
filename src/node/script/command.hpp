#pragma once
#include "general/address.hpp"
#include "nft/interface_id.hpp"
#include "nft/token_id.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace script {
namespace command {
    struct Mint {
        static constexpr std::string_view name { "mint" };
        Address to;
        TokenId tokenId;
        std::string uri;
    };
    struct Transfer {
        static constexpr std::string_view name { "transfer" };
        Address caller;
        Address from;
        Address to;
        TokenId tokenId;
    };
    struct Approve {
        static constexpr std::string_view name { "approve" };
        Address caller;
        Address delegate;
        TokenId tokenId;
    };
    struct ApproveAll {
        static constexpr std::string_view name { "approve-all" };
        Address caller;
        Address operatorAccount;
        bool approved;
    };
    struct Burn {
        static constexpr std::string_view name { "burn" };
        Address caller;
        TokenId tokenId;
    };
    struct OwnerOf {
        static constexpr std::string_view name { "owner-of" };
        TokenId tokenId;
    };
    struct BalanceOf {
        static constexpr std::string_view name { "balance-of" };
        Address account;
    };
    struct GetApproved {
        static constexpr std::string_view name { "get-approved" };
        TokenId tokenId;
    };
    struct IsApprovedForAll {
        static constexpr std::string_view name { "is-approved-for-all" };
        Address owner;
        Address operatorAccount;
    };
    struct TokenUri {
        static constexpr std::string_view name { "token-uri" };
        TokenId tokenId;
    };
    struct TotalSupply {
        static constexpr std::string_view name { "total-supply" };
    };
    struct Exists {
        static constexpr std::string_view name { "exists" };
        TokenId tokenId;
    };
    struct SupportsInterface {
        static constexpr std::string_view name { "supports-interface" };
        InterfaceId interfaceId;
    };
    struct Name {
        static constexpr std::string_view name { "name" };
    };
    struct Symbol {
        static constexpr std::string_view name { "symbol" };
    };
}

using Command = std::variant<
    command::Mint,
    command::Transfer,
    command::Approve,
    command::ApproveAll,
    command::Burn,
    command::OwnerOf,
    command::BalanceOf,
    command::GetApproved,
    command::IsApprovedForAll,
    command::TokenUri,
    command::TotalSupply,
    command::Exists,
    command::SupportsInterface,
    command::Name,
    command::Symbol>;

inline std::string_view command_name(const Command& c)
{
    return std::visit([](auto& cmd) { return cmd.name; }, c);
}

// Returns nothing for blank and comment lines.
// Throws Error(EINV_COMMAND), Error(EINV_ARGS) or a parse error of
// an argument (EBADADDRESS, EBADTOKENID, EBADINTERFACEID, EBADBOOL).
std::optional<Command> parse_line(std::string_view line);
}
