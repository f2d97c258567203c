#include "interface_id.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"
#include <cstring>

std::optional<InterfaceId> InterfaceId::parse(std::string_view s)
{
    std::array<uint8_t, 4> bytes;
    if (!parse_hex(strip_hex_prefix(s), bytes))
        return {};
    uint32_t v;
    memcpy(&v, bytes.data(), 4);
    return InterfaceId(ntoh32(v));
}

InterfaceId InterfaceId::parse_throw(std::string_view s)
{
    if (auto p { parse(s) })
        return *p;
    throw Error(EBADINTERFACEID);
}

std::string InterfaceId::to_string() const
{
    return "0x" + serialize_hex(value());
}
