#pragma once
#include "general/with_uint64.hpp"
#include <optional>
#include <string>
#include <string_view>

// 4 byte capability identifier used for interface discovery
struct InterfaceId : public IsUint32 {
    using IsUint32::IsUint32;
    static const InterfaceId DISCOVERY;
    static const InterfaceId OWNERSHIP_REGISTRY;
    static const InterfaceId METADATA;
    static const InterfaceId INVALID;

    // "0x80ac58cd" or "80ac58cd", throws Error(EBADINTERFACEID)
    static InterfaceId parse_throw(std::string_view);
    static std::optional<InterfaceId> parse(std::string_view);
    std::string to_string() const;
};

inline constexpr InterfaceId InterfaceId::DISCOVERY { 0x01ffc9a7 };
inline constexpr InterfaceId InterfaceId::OWNERSHIP_REGISTRY { 0x80ac58cd };
inline constexpr InterfaceId InterfaceId::METADATA { 0x5b5e139f };
inline constexpr InterfaceId InterfaceId::INVALID { 0xffffffff };
