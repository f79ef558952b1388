#pragma once



#include <array>
#include <climits>
#include <cstdint>
#include <type_traits>
#include "utils/misc.hh"



// generic CRC implementation with compile time table optimization
// invaluable and thoroughly explained resource:
// http://www.sunshine2k.de/articles/coding/crc/understanding_crc.html
//
// catalog of CRC algorithms:
// https://reveng.sourceforge.io/crc-catalogue/all.htm



namespace mediarip
{

template<typename T, T polynomial, T seed, T final_xor, bool reflect_input, bool reflect_output>
class CRC
{
public:
    CRC()
    {
        reset();
    }


    CRC &reset()
    {
        _crc = reflect_input ? bits_reflect(seed) : seed;

        return *this;
    }


    CRC &update(const uint8_t *data, uint64_t size)
    {
        for(uint64_t i = 0; i < size; ++i)
        {
            if constexpr(reflect_input)
                _crc = (_crc >> CHAR_BIT) ^ _TABLE[(_crc ^ data[i]) & 0xFF];
            else
                _crc = (_crc << CHAR_BIT) ^ _TABLE[((_crc >> (sizeof(T) - 1) * CHAR_BIT) ^ data[i]) & 0xFF];
        }

        return *this;
    }


    T final() const
    {
        return (reflect_input != reflect_output ? bits_reflect(_crc) : _crc) ^ final_xor;
    }

private:
    static constexpr auto _TABLE = []()
    {
        std::array<T, 0x100> table{};

        for(T i = 0; i < 0x100; ++i)
        {
            T crc;
            if constexpr(reflect_input)
            {
                crc = i;
                for(T b = 0; b < CHAR_BIT; ++b)
                    crc = (crc >> 1) ^ (crc & 1 ? bits_reflect(polynomial) : 0);
            }
            else
            {
                crc = (T)(i << (sizeof(T) - 1) * CHAR_BIT);
                for(T b = 0; b < CHAR_BIT; ++b)
                    crc = (T)(crc << 1) ^ (crc & (T)1 << (sizeof(T) * CHAR_BIT - 1) ? polynomial : 0);
            }

            table[i] = crc;
        }

        return table;
    }();

    T _crc;
};

}
