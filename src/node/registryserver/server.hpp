#pragma once
#include "events/event_log.hpp"
#include "nft/registry.hpp"
#include <shared_mutex>

// Owns the registry and its event log. Mutations are serialized,
// queries may run concurrently with each other. Event subscribers are
// called after the registry lock is released.
class RegistryServer {
public:
    RegistryServer(nft::CollectionInfo info, nft::Registry::Options options = {});
    RegistryServer(const RegistryServer&) = delete;
    RegistryServer& operator=(const RegistryServer&) = delete;

    // exclusive access
    [[nodiscard]] Result<void> mint(const Address& to, TokenId tokenId, std::string uri);
    [[nodiscard]] Result<void> approve(const Address& caller, const Address& delegate, TokenId tokenId);
    [[nodiscard]] Result<void> set_approval_for_all(const Address& caller, const Address& operatorAccount, bool approved);
    [[nodiscard]] Result<void> transfer(const Address& caller, const Address& from, const Address& to, TokenId tokenId);
    [[nodiscard]] Result<void> burn(const Address& caller, TokenId tokenId);

    // can be called concurrently
    [[nodiscard]] Result<Address> owner_of(TokenId tokenId) const;
    [[nodiscard]] Result<uint64_t> balance_of(const Address& account) const;
    [[nodiscard]] Result<Address> get_approved(TokenId tokenId) const;
    [[nodiscard]] bool is_approved_for_all(const Address& owner, const Address& operatorAccount) const;
    [[nodiscard]] Result<std::string> token_uri(TokenId tokenId) const;
    [[nodiscard]] bool exists(TokenId tokenId) const;
    [[nodiscard]] uint64_t total_supply() const;
    [[nodiscard]] std::vector<uint8_t> snapshot() const;

    const std::string& name() const { return registry.name(); }
    const std::string& symbol() const { return registry.symbol(); }
    static bool supports_interface(InterfaceId id) { return nft::Registry::supports_interface(id); }

    events::EventLog& event_log() { return eventLog; }
    const events::EventLog& event_log() const { return eventLog; }

private:
    template <typename F>
    auto read(F&& f) const
    {
        std::shared_lock l(mutex);
        return f(registry);
    }
    template <typename F>
    Result<void> apply(F&& f, std::string_view action, const std::string& details);

    mutable std::shared_mutex mutex;
    events::EventLog eventLog;
    nft::Registry registry;
};
