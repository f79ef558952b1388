#pragma once



#include <cstdint>
#include <string>
#include <vector>



namespace mediarip
{

inline std::string bin2hex(const std::vector<uint8_t> &data)
{
    static const char DIGITS[] = "0123456789abcdef";

    std::string hex_string;
    hex_string.reserve(data.size() * 2);

    for(auto b : data)
    {
        hex_string += DIGITS[b >> 4];
        hex_string += DIGITS[b & 0x0F];
    }

    return hex_string;
}

}
