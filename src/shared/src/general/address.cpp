#include "address.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"

std::optional<Address> Address::parse(std::string_view s)
{
    parent_t bytes;
    if (!parse_hex(strip_hex_prefix(s), bytes))
        return {};
    return Address(bytes);
}

Address::Address(std::string_view s)
    : Address([&]() {
        auto a { parse(s) };
        if (!a)
            throw Error(EBADADDRESS);
        return *a;
    }())
{
}

std::string Address::to_string() const
{
    return "0x" + serialize_hex(*this);
}
