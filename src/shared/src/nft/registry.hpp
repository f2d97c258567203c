#pragma once
#include "general/result.hpp"
#include "nft/events.hpp"
#include "nft/interface_id.hpp"
#include "nft/token.hpp"
#include <functional>
#include <map>
#include <set>
#include <vector>

namespace nft {

// Ownership registry of non-fungible tokens.
//
// Every mutating member either applies completely or returns an error and
// leaves the state untouched. All guards are evaluated before the first
// write. Emitted events are handed to the event callback after the state
// has been updated.
//
// Not thread-safe, see RegistryServer for concurrent use.
class Registry {
public:
    using event_callback_t = std::function<void(const Event&)>;
    struct Options {
        bool rejectSelfApproval { true };
    };

    Registry(CollectionInfo info, Options options, event_callback_t onEvent = {});
    Registry(CollectionInfo info, event_callback_t onEvent = {})
        : Registry(std::move(info), Options {}, std::move(onEvent))
    {
    }

    // mutating operations
    [[nodiscard]] Result<void> mint(const Address& to, TokenId tokenId, std::string uri);
    [[nodiscard]] Result<void> approve(const Address& caller, const Address& delegate, TokenId tokenId);
    [[nodiscard]] Result<void> set_approval_for_all(const Address& caller, const Address& operatorAccount, bool approved);
    [[nodiscard]] Result<void> transfer(const Address& caller, const Address& from, const Address& to, TokenId tokenId);
    [[nodiscard]] Result<void> burn(const Address& caller, TokenId tokenId);

    // queries
    [[nodiscard]] Result<Address> owner_of(TokenId tokenId) const;
    [[nodiscard]] Result<uint64_t> balance_of(const Address& account) const;
    [[nodiscard]] Result<Address> get_approved(TokenId tokenId) const;
    [[nodiscard]] bool is_approved_for_all(const Address& owner, const Address& operatorAccount) const;
    [[nodiscard]] Result<std::string> token_uri(TokenId tokenId) const;
    [[nodiscard]] bool exists(TokenId tokenId) const { return tokens.contains(tokenId); }
    [[nodiscard]] uint64_t total_supply() const { return tokens.size(); }

    // metadata and interface discovery
    const std::string& name() const { return info.name; }
    const std::string& symbol() const { return info.symbol; }
    static bool supports_interface(InterfaceId id);

    // canonical serialization of the token, balance and operator state
    std::vector<uint8_t> snapshot() const;
    void serialize(Serializer auto& s) const;

private:
    [[nodiscard]] const TokenRecord* find(TokenId tokenId) const;
    [[nodiscard]] TokenRecord* find(TokenId tokenId);
    [[nodiscard]] bool is_operator(const Address& owner, const Address& caller) const;
    [[nodiscard]] bool may_operate(const Address& caller, const TokenRecord&) const;
    void credit(const Address& account);
    void debit(const Address& account);
    void emit(Event e) const;

    CollectionInfo info;
    Options options;
    event_callback_t onEvent;

    std::map<TokenId, TokenRecord> tokens;
    std::map<Address, uint64_t> balances;
    std::set<std::pair<Address, Address>> operators; // (owner, operator)
};

void Registry::serialize(Serializer auto& s) const
{
    s << uint64_t(tokens.size());
    for (auto& [id, token] : tokens)
        s << id << token;
    s << uint64_t(balances.size());
    for (auto& [account, count] : balances)
        s << account << count;
    s << uint64_t(operators.size());
    for (auto& [owner, operatorAccount] : operators)
        s << owner << operatorAccount;
}
}
