#pragma once
#include "general/serializer_fwd.hxx"
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// 20 byte account identity, the all-zero value is the null account
class Address : public std::array<uint8_t, 20> {
public:
    using parent_t = std::array<uint8_t, 20>;
    static constexpr Address null() { return parent_t {}; }

    constexpr Address(parent_t arr)
        : parent_t(arr) { };
    // throws Error(EBADADDRESS)
    explicit Address(std::string_view);
    static std::optional<Address> parse(std::string_view);

    [[nodiscard]] bool is_null() const { return *this == null(); }
    std::string to_string() const;

    bool operator==(const Address&) const = default;
    auto operator<=>(const Address&) const = default;

    void serialize(Serializer auto& s) const
    {
        s << std::span<const uint8_t>(data(), size());
    }
};
