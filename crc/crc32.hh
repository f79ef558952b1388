#pragma once



#include <cstdint>
#include "crc.hh"



namespace mediarip
{

// CRC-32
// check value: 0xCBF43926
typedef CRC<uint32_t, 0x04C11DB7, 0xFFFFFFFF, 0xFFFFFFFF, true, true> CRC32;

}
