#include "server.hpp"
#include "spdlog/spdlog.h"

using namespace std::string_literals;

RegistryServer::RegistryServer(nft::CollectionInfo info, nft::Registry::Options options)
    : registry(std::move(info), options,
          [this](const nft::Event& e) { eventLog.append(e); })
{
    spdlog::debug("Registry \"{}\" ({}) ready, self approval {}",
        registry.name(), registry.symbol(),
        options.rejectSelfApproval ? "rejected" : "accepted");
}

template <typename F>
Result<void> RegistryServer::apply(F&& f, std::string_view action, const std::string& details)
{
    Result<void> r;
    {
        std::unique_lock l(mutex);
        r = f(registry);
    }
    if (r.has_value())
        spdlog::debug("Applied {} {}", action, details);
    else
        spdlog::info("Rejected {} {}: {}", action, details, r.error().format());
    eventLog.dispatch();
    return r;
}

Result<void> RegistryServer::mint(const Address& to, TokenId tokenId, std::string uri)
{
    return apply([&](nft::Registry& reg) { return reg.mint(to, tokenId, std::move(uri)); },
        "mint", "of token "s + tokenId.to_string() + " to " + to.to_string());
}

Result<void> RegistryServer::approve(const Address& caller, const Address& delegate, TokenId tokenId)
{
    return apply([&](nft::Registry& reg) { return reg.approve(caller, delegate, tokenId); },
        "approval", "of " + delegate.to_string() + " for token " + tokenId.to_string() + " by " + caller.to_string());
}

Result<void> RegistryServer::set_approval_for_all(const Address& caller, const Address& operatorAccount, bool approved)
{
    return apply([&](nft::Registry& reg) { return reg.set_approval_for_all(caller, operatorAccount, approved); },
        approved ? "operator grant"s : "operator revocation"s,
        "of " + operatorAccount.to_string() + " by " + caller.to_string());
}

Result<void> RegistryServer::transfer(const Address& caller, const Address& from, const Address& to, TokenId tokenId)
{
    return apply([&](nft::Registry& reg) { return reg.transfer(caller, from, to, tokenId); },
        "transfer", "of token "s + tokenId.to_string() + " from " + from.to_string() + " to " + to.to_string() + " by " + caller.to_string());
}

Result<void> RegistryServer::burn(const Address& caller, TokenId tokenId)
{
    return apply([&](nft::Registry& reg) { return reg.burn(caller, tokenId); },
        "burn", "of token "s + tokenId.to_string() + " by " + caller.to_string());
}

Result<Address> RegistryServer::owner_of(TokenId tokenId) const
{
    return read([&](const nft::Registry& r) { return r.owner_of(tokenId); });
}

Result<uint64_t> RegistryServer::balance_of(const Address& account) const
{
    return read([&](const nft::Registry& r) { return r.balance_of(account); });
}

Result<Address> RegistryServer::get_approved(TokenId tokenId) const
{
    return read([&](const nft::Registry& r) { return r.get_approved(tokenId); });
}

bool RegistryServer::is_approved_for_all(const Address& owner, const Address& operatorAccount) const
{
    return read([&](const nft::Registry& r) { return r.is_approved_for_all(owner, operatorAccount); });
}

Result<std::string> RegistryServer::token_uri(TokenId tokenId) const
{
    return read([&](const nft::Registry& r) { return r.token_uri(tokenId); });
}

bool RegistryServer::exists(TokenId tokenId) const
{
    return read([&](const nft::Registry& r) { return r.exists(tokenId); });
}

uint64_t RegistryServer::total_supply() const
{
    return read([&](const nft::Registry& r) { return r.total_supply(); });
}

std::vector<uint8_t> RegistryServer::snapshot() const
{
    return read([&](const nft::Registry& r) { return r.snapshot(); });
}
