#pragma once



#include <algorithm>
#include <climits>
#include <cstdint>
#include <string>
#include <vector>
#include "utils/hex_bin.hh"



namespace mediarip
{

// Merkle-Damgard block hasher base: buffers the input into fixed size blocks and
// applies the standard "1 bit + zero padding + message length" finalization
class BlockHasher
{
public:
    BlockHasher(uint32_t block_size)
        : _blockSize(block_size)
        , _blocksHashed(0)
    {
        _tail.reserve(_blockSize);
    }


    virtual ~BlockHasher() {}


    void update(const uint8_t *data, uint64_t size)
    {
        auto data_end = data + size;

        if(!_tail.empty())
        {
            auto size_to_copy = std::min((uint64_t)_blockSize - _tail.size(), size);
            _tail.insert(_tail.end(), data, data + size_to_copy);
            data += size_to_copy;

            if(_tail.size() == _blockSize)
            {
                updateCounted(_tail.data());
                _tail.clear();
            }
        }

        for(; (uint64_t)(data_end - data) >= _blockSize; data += _blockSize)
            updateCounted(data);

        _tail.insert(_tail.end(), data, data_end);
    }


    std::string final()
    {
        // original message length in bits
        uint64_t ml = (_blocksHashed * _blockSize + _tail.size()) * CHAR_BIT;

        // append the bit '1' to the message e.g. by adding 0x80
        _tail.push_back(0x80);

        // pad chunk with '0' bits
        auto bytes_left = _blockSize - (uint64_t)_tail.size();
        _tail.resize(_blockSize, 0);

        // if no space to store message length, store it in the next block
        if(bytes_left < sizeof(uint64_t))
        {
            updateBlock(_tail.data());
            std::fill(_tail.begin(), _tail.end(), 0);
        }

        storeML(_tail.data() + _blockSize - sizeof(uint64_t), ml);
        updateBlock(_tail.data());

        _blocksHashed = 0;
        _tail.clear();

        return bin2hex(hash());
    }

protected:
    virtual void updateBlock(const uint8_t *block) = 0;
    virtual void storeML(uint8_t *dst, uint64_t ml) = 0;
    virtual std::vector<uint8_t> hash() = 0;

    static uint32_t ROTL(uint32_t x, uint32_t n)
    {
        return x << n | x >> ((0 - n) & 31);
    }

private:
    uint32_t _blockSize;
    uint64_t _blocksHashed;
    std::vector<uint8_t> _tail;

    void updateCounted(const uint8_t *block)
    {
        updateBlock(block);
        ++_blocksHashed;
    }
};

}
