#pragma once



#include <cstdint>
#include <vector>
#include "block_hasher.hh"



namespace mediarip
{

class SHA1 : public BlockHasher
{
public:
    SHA1();

private:
    std::vector<uint32_t> _hash;

    void updateBlock(const uint8_t *block) override;
    void storeML(uint8_t *dst, uint64_t ml) override;
    std::vector<uint8_t> hash() override;

    static std::vector<uint32_t> defaultHash();
};

}
