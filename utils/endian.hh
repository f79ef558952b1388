#pragma once



#include <cstdint>



namespace mediarip
{

// host independent little-endian load
template<typename T>
T le_load(const uint8_t *data)
{
    T v = 0;
    for(unsigned i = 0; i < sizeof(T); ++i)
        v |= (T)data[i] << (i * 8);

    return v;
}


// host independent big-endian load
template<typename T>
T be_load(const uint8_t *data)
{
    T v = 0;
    for(unsigned i = 0; i < sizeof(T); ++i)
        v = (T)(v << 8) | data[i];

    return v;
}

}
