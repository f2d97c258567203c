#pragma once
#include "general/serializer_fwd.hxx"
#include <compare>
#include <cstdint>

struct IsUint32 {
public:
    constexpr explicit IsUint32(uint32_t val)
        : val(val) { };

    bool operator==(const IsUint32&) const = default;
    auto operator<=>(const IsUint32&) const = default;

    constexpr uint32_t value() const
    {
        return val;
    }
    void serialize(Serializer auto& s) const
    {
        s << value();
    }

protected:
    uint32_t val;
};

struct IsUint64 {
public:
    explicit constexpr IsUint64(uint64_t val)
        : val(val) { };

    bool operator==(const IsUint64&) const = default;
    auto operator<=>(const IsUint64&) const = default;
    constexpr uint64_t value() const
    {
        return val;
    }
    void serialize(Serializer auto& s) const
    {
        s << value();
    }

protected:
    uint64_t val;
};
