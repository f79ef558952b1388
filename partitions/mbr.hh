#pragma once



#include <cstdint>
#include <string>
#include <vector>
#include "partitions/partition.hh"



namespace mediarip
{

// PC master boot record, including the extended boot record chain of logical partitions
class MBR : public PartitionScheme
{
public:
    static constexpr uint32_t SIGNATURE_OFFSET = 0x1FE;
    static constexpr uint32_t ENTRIES_OFFSET = 0x1BE;
    static constexpr uint32_t ENTRY_SIZE = 16;
    static constexpr uint32_t ENTRIES_COUNT = 4;
    static constexpr uint32_t EBR_CHAIN_LIMIT = 256;

    struct Entry
    {
        uint8_t status;
        uint8_t type;
        uint32_t start;
        uint32_t sectors;
    };

    std::string name() const override;
    std::vector<Partition> detect(BlockReader &reader, uint64_t offset) const override;

    static bool isExtended(uint8_t type);
    static std::string typeName(uint8_t type);

private:
    // false if the sector is not a valid table
    static bool readTable(BlockReader &reader, uint64_t lba, std::vector<Entry> &entries);
};

}
