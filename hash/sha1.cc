#include "utils/endian.hh"
#include "sha1.hh"



namespace mediarip
{

SHA1::SHA1()
    : BlockHasher(16 * sizeof(uint32_t))
    , _hash(defaultHash())
{
    ;
}


std::vector<uint32_t> SHA1::defaultHash()
{
    return std::vector<uint32_t>{ 0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0 };
}


void SHA1::updateBlock(const uint8_t *block)
{
    uint32_t w[80];

    // break chunk into sixteen 32-bit big-endian words
    for(uint32_t i = 0; i < 16; ++i)
        w[i] = be_load<uint32_t>(block + i * sizeof(uint32_t));

    // extend the sixteen 32-bit words into eighty 32-bit words
    for(uint32_t i = 16; i < 32; ++i)
        w[i] = ROTL(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    // alternative 32-79 rounds computation keeps 64-bit alignment which allows efficient SIMD implementation
    for(uint32_t i = 32; i < 80; ++i)
        w[i] = ROTL(w[i - 6] ^ w[i - 16] ^ w[i - 28] ^ w[i - 32], 2);

    uint32_t a = _hash[0];
    uint32_t b = _hash[1];
    uint32_t c = _hash[2];
    uint32_t d = _hash[3];
    uint32_t e = _hash[4];

    for(uint32_t i = 0; i < 80; ++i)
    {
        uint32_t f, k;

        if(i < 20)
        {
            f = (b & c) | (~b & d);
            k = 0x5A827999;
        }
        else if(i < 40)
        {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1;
        }
        else if(i < 60)
        {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDC;
        }
        else
        {
            f = b ^ c ^ d;
            k = 0xCA62C1D6;
        }

        uint32_t temp = ROTL(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = ROTL(b, 30);
        b = a;
        a = temp;
    }

    _hash[0] += a;
    _hash[1] += b;
    _hash[2] += c;
    _hash[3] += d;
    _hash[4] += e;
}


void SHA1::storeML(uint8_t *dst, uint64_t ml)
{
    for(uint32_t i = 0; i < sizeof(ml); ++i)
        dst[i] = (uint8_t)(ml >> (sizeof(ml) - 1 - i) * 8);
}


std::vector<uint8_t> SHA1::hash()
{
    std::vector<uint8_t> digest;
    for(auto h : _hash)
        for(uint32_t i = 0; i < sizeof(h); ++i)
            digest.push_back((uint8_t)(h >> (sizeof(h) - 1 - i) * 8));

    _hash = defaultHash();

    return digest;
}

}
