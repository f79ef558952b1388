#pragma once



#include <cstdint>
#include <string>
#include <vector>
#include "readers/block_reader.hh"



namespace mediarip
{

struct Partition
{
    uint64_t start = 0;
    uint64_t length = 0;
    uint64_t sequence = 0;
    std::string scheme;
    std::string type;

    bool operator==(const Partition &other) const = default;
};


class PartitionScheme
{
public:
    virtual ~PartitionScheme() {}

    virtual std::string name() const = 0;

    // partitions described by a table located at LBA offset, empty if not recognized
    virtual std::vector<Partition> detect(BlockReader &reader, uint64_t offset) const = 0;
};

}
