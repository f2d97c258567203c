#include "event_log.hpp"
#include "spdlog/spdlog.h"

namespace events {
void EventLog::append(const nft::Event& e)
{
    std::lock_guard l(m);
    log.push_back({ log.size(), e });
}

std::optional<Entry> EventLog::next_undelivered(std::vector<callback_t>& callbacks)
{
    std::lock_guard l(m);
    if (delivered == log.size())
        return {};
    callbacks.clear();
    for (auto& [id, cb] : subscriptions)
        callbacks.push_back(cb);
    return log[delivered++];
}

void EventLog::dispatch()
{
    std::lock_guard l(dispatchMutex);
    if (dispatching)
        return; // called from a callback, the running loop picks it up
    struct Reset {
        bool& b;
        ~Reset() { b = false; }
    } reset { dispatching = true };
    std::vector<callback_t> callbacks;
    while (auto entry { next_undelivered(callbacks) }) {
        for (auto& cb : callbacks) {
            try {
                cb(*entry);
            } catch (const std::exception& e) {
                spdlog::error("Event subscriber failed on event {}: {}", entry->seq, e.what());
            }
        }
    }
}

auto EventLog::subscribe(callback_t cb, bool replay) -> SubscriptionId
{
    std::lock_guard dl(dispatchMutex);
    if (replay) {
        for (auto& e : entries_since(0)) {
            if (e.seq >= delivered)
                break;
            cb(e);
        }
    }
    std::lock_guard l(m);
    auto id { nextSubscriptionId++ };
    subscriptions.emplace(id, std::move(cb));
    return id;
}

bool EventLog::unsubscribe(SubscriptionId id)
{
    std::lock_guard l(m);
    return subscriptions.erase(id) > 0;
}

std::vector<Entry> EventLog::entries() const
{
    std::lock_guard l(m);
    return log;
}

std::vector<Entry> EventLog::entries_since(uint64_t seq) const
{
    std::lock_guard l(m);
    if (seq >= log.size())
        return {};
    return { log.begin() + seq, log.end() };
}

size_t EventLog::size() const
{
    std::lock_guard l(m);
    return log.size();
}
}
