#pragma once



#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>



namespace mediarip
{

template<typename T>
constexpr T bits_reflect(T word)
{
    T r = word;

    int s = sizeof(word) * CHAR_BIT - 1;

    for(word >>= 1; word; word >>= 1)
    {
        r <<= 1;
        r |= word & 1;
        --s;
    }
    r <<= s;

    return r;
}


template<typename T>
T digits_count(T value)
{
    return (value ? log10(value) : 0) + 1;
}


// calls func(offset, size) for each consecutive batch of the [first, second) range,
// returns true if func requested an interruption
template<typename T>
bool batch_process_range(const std::pair<T, T> &range, T batch_size, const std::function<bool(T, T)> &func)
{
    bool interrupted = false;

    for(T offset = range.first; offset != range.second;)
    {
        T size = std::min(range.second - offset, batch_size);

        T offset_next = offset + size;

        if(func(offset, size))
        {
            interrupted = true;
            break;
        }

        offset = offset_next;
    }

    return interrupted;
}


std::string system_date_time(std::string fmt);

}
