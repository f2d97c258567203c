#include "api/json.hpp"
#include "events/event_log.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
using namespace std;

namespace {
const Address A { Address::parent_t { 1 } };
const Address B { Address::parent_t { 2 } };

void test_sequence_and_subscriptions()
{
    events::EventLog log;
    log.append(nft::event::Transfer { Address::null(), A, TokenId(1) });
    log.append(nft::event::Approval { A, B, TokenId(1) });
    log.dispatch();

    // replay delivers the history before live entries
    vector<uint64_t> seen;
    auto id { log.subscribe([&](const events::Entry& e) { seen.push_back(e.seq); }, true) };
    assert((seen == vector<uint64_t> { 0, 1 }));

    // recorded entries reach subscribers on dispatch only
    log.append(nft::event::ApprovalForAll { A, B, true });
    assert(seen.size() == 2);
    log.dispatch();
    assert((seen == vector<uint64_t> { 0, 1, 2 }));
    log.dispatch();
    assert(seen.size() == 3);

    // an undelivered entry is not replayed, it arrives with the next dispatch
    log.append(nft::event::ApprovalForAll { A, B, false });
    vector<uint64_t> late;
    log.subscribe([&](const events::Entry& e) { late.push_back(e.seq); }, true);
    assert((late == vector<uint64_t> { 0, 1, 2 }));
    log.dispatch();
    assert((late == vector<uint64_t> { 0, 1, 2, 3 }));
    assert((seen == vector<uint64_t> { 0, 1, 2, 3 }));

    assert(log.unsubscribe(id));
    assert(!log.unsubscribe(id));
    log.append(nft::event::Transfer { A, B, TokenId(1) });
    log.dispatch();
    assert(seen.size() == 4);
    assert(late.size() == 5);

    assert(log.size() == 5);
    auto tail { log.entries_since(3) };
    assert(tail.size() == 2);
    assert(tail[0].seq == 3);
    assert(nft::event_name(tail[1].event) == "Transfer");
    assert(log.entries_since(5).empty());
    assert(log.entries_since(100).empty());
}

// callbacks may append, delivery stays in sequence order for everyone
void test_appending_callback()
{
    events::EventLog log;
    vector<uint64_t> first, second;
    log.subscribe([&](const events::Entry& e) {
        first.push_back(e.seq);
        if (e.seq == 0) {
            log.append(nft::event::Approval { A, B, TokenId(1) });
            log.dispatch();
        }
    });
    log.subscribe([&](const events::Entry&) { throw std::runtime_error("failing subscriber"); });
    log.subscribe([&](const events::Entry& e) { second.push_back(e.seq); });
    log.append(nft::event::Transfer { Address::null(), A, TokenId(1) });
    log.dispatch();
    assert((first == vector<uint64_t> { 0, 1 }));
    assert((second == vector<uint64_t> { 0, 1 }));
}

void test_json()
{
    events::Entry e { 7, nft::event::ApprovalForAll { A, B, false } };
    auto j { jsonmsg::to_json(e) };
    assert(j["seq"] == 7);
    assert(j["event"] == "ApprovalForAll");
    assert(j["owner"] == A.to_string());
    assert(j["operator"] == B.to_string());
    assert(j["approved"] == false);

    events::Entry t { 0, nft::event::Transfer { Address::null(), A, TokenId(42) } };
    j = jsonmsg::to_json(t);
    assert(j["from"] == "0x0000000000000000000000000000000000000000");
    assert(j["tokenId"] == 42);

    assert(jsonmsg::to_json(vector<events::Entry> { e, t }).size() == 2);
}
}

int main()
{
    test_sequence_and_subscriptions();
    test_appending_callback();
    test_json();
    cout << "event log tests passed" << endl;
    return 0;
}
