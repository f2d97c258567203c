#pragma once
#include "general/byte_order.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

void serialize_hex(const uint8_t* data, size_t size, char* out);
std::string serialize_hex(const uint8_t* data, size_t size);

template <size_t N>
std::string serialize_hex(const std::array<uint8_t, N>& arr)
{
    return serialize_hex(arr.data(), arr.size());
}

inline std::string serialize_hex(const std::vector<uint8_t>& vec)
{
    return serialize_hex(vec.data(), vec.size());
}
inline std::string serialize_hex(uint32_t v)
{
    uint32_t network = hton32(v);
    return serialize_hex((const uint8_t*)&network, 4);
}

// removes a leading "0x" or "0X"
std::string_view strip_hex_prefix(std::string_view in);

bool parse_hex(std::string_view in, uint8_t* out, size_t out_size);

template <size_t N>
bool parse_hex(std::string_view in, std::array<uint8_t, N>& out)
{
    return parse_hex(in, out.data(), out.size());
}
