#include "registry.hpp"
#include "general/writer.hpp"
#include <cassert>

namespace nft {

Registry::Registry(CollectionInfo info, Options options, event_callback_t onEvent)
    : info(std::move(info))
    , options(options)
    , onEvent(std::move(onEvent))
{
}

const TokenRecord* Registry::find(TokenId tokenId) const
{
    auto iter { tokens.find(tokenId) };
    if (iter == tokens.end())
        return nullptr;
    return &iter->second;
}

TokenRecord* Registry::find(TokenId tokenId)
{
    auto iter { tokens.find(tokenId) };
    if (iter == tokens.end())
        return nullptr;
    return &iter->second;
}

bool Registry::is_operator(const Address& owner, const Address& caller) const
{
    // a null caller never acts for anyone, even if recorded as operator
    return !caller.is_null() && is_approved_for_all(owner, caller);
}

bool Registry::may_operate(const Address& caller, const TokenRecord& t) const
{
    return caller == t.owner
        || t.is_delegate(caller)
        || is_operator(t.owner, caller);
}

void Registry::credit(const Address& account)
{
    balances[account] += 1;
}

void Registry::debit(const Address& account)
{
    auto iter { balances.find(account) };
    assert(iter != balances.end() && iter->second > 0);
    if (--iter->second == 0)
        balances.erase(iter);
}

void Registry::emit(Event e) const
{
    if (onEvent)
        onEvent(e);
}

Result<void> Registry::mint(const Address& to, TokenId tokenId, std::string uri)
{
    if (to.is_null())
        return Error(EINVRECIPIENT);
    if (exists(tokenId))
        return Error(EALREADYMINTED);

    tokens.emplace(tokenId, TokenRecord { .owner { to }, .metadataURI { std::move(uri) } });
    credit(to);
    emit(event::Transfer { Address::null(), to, tokenId });
    return {};
}

Result<void> Registry::approve(const Address& caller, const Address& delegate, TokenId tokenId)
{
    auto t { find(tokenId) };
    if (!t)
        return Error(EUNKNOWNTOKEN);
    if (caller != t->owner && !is_operator(t->owner, caller))
        return Error(ENOTAUTHORIZED);

    t->approvedDelegate = delegate;
    emit(event::Approval { t->owner, delegate, tokenId });
    return {};
}

Result<void> Registry::set_approval_for_all(const Address& caller, const Address& operatorAccount, bool approved)
{
    if (caller == operatorAccount && options.rejectSelfApproval)
        return Error(ESELFAPPROVAL);

    if (approved)
        operators.emplace(caller, operatorAccount);
    else
        operators.erase({ caller, operatorAccount });
    emit(event::ApprovalForAll { caller, operatorAccount, approved });
    return {};
}

Result<void> Registry::transfer(const Address& caller, const Address& from, const Address& to, TokenId tokenId)
{
    auto t { find(tokenId) };
    if (!t)
        return Error(EUNKNOWNTOKEN);
    if (from != t->owner)
        return Error(EOWNERMISMATCH);
    if (from == to)
        return Error(ESELFTRANSFER);
    if (to.is_null())
        return Error(EINVRECIPIENT);
    if (!may_operate(caller, *t))
        return Error(ENOTAUTHORIZED);

    debit(from);
    credit(to);
    t->owner = to;
    t->approvedDelegate = Address::null();
    emit(event::Transfer { from, to, tokenId });
    return {};
}

Result<void> Registry::burn(const Address& caller, TokenId tokenId)
{
    auto iter { tokens.find(tokenId) };
    if (iter == tokens.end())
        return Error(EUNKNOWNTOKEN);
    if (!may_operate(caller, iter->second))
        return Error(ENOTAUTHORIZED);

    const Address owner { iter->second.owner };
    debit(owner);
    tokens.erase(iter);
    emit(event::Transfer { owner, Address::null(), tokenId });
    return {};
}

Result<Address> Registry::owner_of(TokenId tokenId) const
{
    if (auto t { find(tokenId) })
        return t->owner;
    return Error(EUNKNOWNTOKEN);
}

Result<uint64_t> Registry::balance_of(const Address& account) const
{
    if (account.is_null())
        return Error(EINVACCOUNT);
    auto iter { balances.find(account) };
    if (iter == balances.end())
        return uint64_t(0);
    return iter->second;
}

Result<Address> Registry::get_approved(TokenId tokenId) const
{
    if (auto t { find(tokenId) })
        return t->approvedDelegate;
    return Error(EUNKNOWNTOKEN);
}

bool Registry::is_approved_for_all(const Address& owner, const Address& operatorAccount) const
{
    return operators.contains({ owner, operatorAccount });
}

Result<std::string> Registry::token_uri(TokenId tokenId) const
{
    if (auto t { find(tokenId) })
        return t->metadataURI;
    return Error(EUNKNOWNTOKEN);
}

bool Registry::supports_interface(InterfaceId id)
{
    return id == InterfaceId::DISCOVERY
        || id == InterfaceId::OWNERSHIP_REGISTRY
        || id == InterfaceId::METADATA;
}

std::vector<uint8_t> Registry::snapshot() const
{
    return serialize_to_vector(*this);
}
}
