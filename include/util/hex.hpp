#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace brickhub
{

// "0f00043c0114..." style dump used in frame logs
inline std::string to_hex(const std::uint8_t *data, std::size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string       out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const std::vector<std::uint8_t> &bytes)
{
    return to_hex(bytes.data(), bytes.size());
}

}  // namespace brickhub
