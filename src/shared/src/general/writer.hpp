#pragma once

#include "general/serializer.hxx"
#include <cassert>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

class Writer {
public:
    Writer(uint8_t* pos, size_t n)
        : pos(pos)
        , end(pos + n)
    {
    }
    Writer(std::span<uint8_t> s)
        : Writer(s.data(), s.size())
    {
    }
    ~Writer() { assert(pos <= end); }

    void write(const std::span<const uint8_t>& s)
    {
        assert(remaining() >= s.size());
        memcpy(pos, s.data(), s.size());
        pos += s.size();
    }

    size_t remaining()
    {
        assert(end >= pos);
        return end - pos;
    }

private:
    uint8_t* pos;
    uint8_t* const end;
};

// serializes into a buffer of exactly the counted size
template <typename T>
std::vector<uint8_t> serialize_to_vector(const T& t)
{
    std::vector<uint8_t> out(count_bytes(t));
    Writer w(out);
    w << t;
    assert(w.remaining() == 0);
    return out;
}
