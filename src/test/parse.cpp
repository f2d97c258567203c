#include "general/address.hpp"
#include "general/errors.hpp"
#include "general/writer.hpp"
#include "nft/interface_id.hpp"
#include "nft/token_id.hpp"
#include <cassert>
#include <iostream>
using namespace std;

namespace {
template <typename F>
int32_t thrown_code(F&& f)
{
    try {
        f();
    } catch (Error e) {
        return e.code;
    }
    return 0;
}

void test_address()
{
    const string s { "0x00112233445566778899aabbccddeeff00112233" };
    auto a { Address::parse(s) };
    assert(a);
    assert((*a)[0] == 0x00 && (*a)[1] == 0x11 && (*a)[19] == 0x33);
    assert(a->to_string() == s);
    assert(!a->is_null());

    // prefix is optional and digits are case insensitive
    assert(Address::parse("00112233445566778899AABBCCDDEEFF00112233") == a);
    assert(Address::parse("0X00112233445566778899aabbccddeeff00112233") == a);

    assert(!Address::parse(""));
    assert(!Address::parse("0x"));
    assert(!Address::parse("0x0011")); // too short
    assert(!Address::parse(s + "44")); // too long
    assert(!Address::parse("0x00112233445566778899aabbccddeeff0011223g"));
    assert(thrown_code([] { Address("xyz"); }) == EBADADDRESS);

    auto n { Address::parse("0x0000000000000000000000000000000000000000") };
    assert(n && n->is_null() && *n == Address::null());

    // ordering is bytewise
    assert(Address::null() < *a);
}

void test_token_id()
{
    assert(TokenId::parse("0") == TokenId(0));
    assert(TokenId::parse("18446744073709551615") == TokenId(18446744073709551615ull));
    assert(!TokenId::parse("18446744073709551616"));
    assert(!TokenId::parse(""));
    assert(!TokenId::parse("-1"));
    assert(!TokenId::parse("12a"));
    assert(!TokenId::parse(" 1"));
    assert(TokenId(12).to_string() == "12");
    assert(thrown_code([] { TokenId::parse_throw("x"); }) == EBADTOKENID);
    assert(TokenId(1) < TokenId(2));
}

void test_interface_id()
{
    assert(InterfaceId::parse("0x80ac58cd") == InterfaceId::OWNERSHIP_REGISTRY);
    assert(InterfaceId::parse("01ffc9a7") == InterfaceId::DISCOVERY);
    assert(InterfaceId::parse("0x5B5E139F") == InterfaceId::METADATA);
    assert(InterfaceId::INVALID.to_string() == "0xffffffff");
    assert(!InterfaceId::parse("0x80ac58"));
    assert(!InterfaceId::parse("0x80ac58cd00"));
    assert(thrown_code([] { InterfaceId::parse_throw("nope"); }) == EBADINTERFACEID);
}

void test_errors()
{
    Error e(ENOTAUTHORIZED);
    assert(e.is_error());
    assert(e.is_rejection());
    assert(!e.is_input_error());
    assert(string(e.err_name()) == "ENOTAUTHORIZED");
    assert(Error(EBADADDRESS).is_input_error());
    assert(!Error(EBADADDRESS).is_rejection());
    assert(!Error::none.is_error());
    assert(!Error::none.is_rejection());
}

void test_serialization()
{
    Address a { Address::parse("0x0102030405060708090a0b0c0d0e0f1011121314").value() };
    auto bytes { serialize_to_vector(a) };
    assert(bytes.size() == 20);
    assert(bytes[0] == 1 && bytes[19] == 0x14);

    // integers are written big endian
    bytes = serialize_to_vector(TokenId(0x0102));
    assert((bytes == vector<uint8_t> { 0, 0, 0, 0, 0, 0, 1, 2 }));
}
}

int main()
{
    test_address();
    test_token_id();
    test_interface_id();
    test_errors();
    test_serialization();
    cout << "parse tests passed" << endl;
    return 0;
}
