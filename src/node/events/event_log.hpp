#pragma once

#include "nft/events.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace events {
struct Entry {
    uint64_t seq;
    nft::Event event;
};

// Append-only record of registry events in emission order.
//
// append() only records. Subscribers are called from dispatch(), which
// delivers every recorded but undelivered entry in sequence order, also
// entries appended by the callbacks themselves. Callers
// that hold other locks while appending call dispatch() after releasing
// them, so callbacks may query or mutate the registry again. Exceptions
// thrown by a callback are logged and do not stop delivery.
struct EventLog {
    using callback_t = std::function<void(const Entry&)>;
    using SubscriptionId = uint64_t;

    void append(const nft::Event& e);
    void dispatch();

    // replay: deliver the entries dispatched so far before returning
    SubscriptionId subscribe(callback_t cb, bool replay = false);
    bool unsubscribe(SubscriptionId id);

    std::vector<Entry> entries() const;
    std::vector<Entry> entries_since(uint64_t seq) const;
    size_t size() const;

private:
    std::optional<Entry> next_undelivered(std::vector<callback_t>& callbacks);

    mutable std::mutex m;
    std::vector<Entry> log;
    std::map<SubscriptionId, callback_t> subscriptions;
    SubscriptionId nextSubscriptionId { 0 };
    size_t delivered { 0 };

    // serializes delivery, recursive for callbacks that trigger dispatch()
    std::recursive_mutex dispatchMutex;
    bool dispatching { false };
};
}
