#include <algorithm>
#include <fmt/format.h>
#include <set>
#include "utils/endian.hh"
#include "utils/logger.hh"
#include "mbr.hh"



namespace mediarip
{

std::string MBR::name() const
{
    return "MBR";
}


bool MBR::isExtended(uint8_t type)
{
    return type == 0x05 || type == 0x0F || type == 0x85;
}


std::string MBR::typeName(uint8_t type)
{
    switch(type)
    {
    case 0x01:
        return "FAT12";
    case 0x04:
    case 0x06:
        return "FAT16";
    case 0x07:
        return "NTFS / exFAT";
    case 0x0B:
        return "FAT32";
    case 0x0C:
        return "FAT32 (LBA)";
    case 0x0E:
        return "FAT16 (LBA)";
    case 0x82:
        return "Linux swap";
    case 0x83:
        return "Linux";
    case 0x8E:
        return "Linux LVM";
    case 0xA5:
        return "FreeBSD";
    case 0xAF:
        return "HFS / HFS+";
    case 0xEE:
        return "GPT protective";
    case 0xEF:
        return "EFI system";
    case 0xFD:
        return "Linux RAID";
    default:
        return fmt::format("0x{:02X}", type);
    }
}


bool MBR::readTable(BlockReader &reader, uint64_t lba, std::vector<Entry> &entries)
{
    entries.clear();

    if(reader.blockSize() < SIGNATURE_OFFSET + 2 || lba >= reader.blocksCount())
        return false;

    auto result = reader.readBlock(lba);
    if(!result.success() || result.data.size() < SIGNATURE_OFFSET + 2)
        return false;

    auto const &sector = result.data;
    if(sector[SIGNATURE_OFFSET] != 0x55 || sector[SIGNATURE_OFFSET + 1] != 0xAA)
        return false;

    for(uint32_t i = 0; i < ENTRIES_COUNT; ++i)
    {
        auto e = &sector[ENTRIES_OFFSET + i * ENTRY_SIZE];

        Entry entry;
        entry.status = e[0];
        entry.type = e[4];
        entry.start = le_load<uint32_t>(e + 8);
        entry.sectors = le_load<uint32_t>(e + 12);

        // boot code of a volume boot record rarely passes this
        if(entry.status != 0x00 && entry.status != 0x80)
            return false;

        entries.push_back(entry);
    }

    return true;
}


std::vector<Partition> MBR::detect(BlockReader &reader, uint64_t offset) const
{
    std::vector<Partition> partitions;

    std::vector<Entry> entries;
    if(!readTable(reader, offset, entries))
        return partitions;

    uint64_t blocks_count = reader.blocksCount();

    auto add_partition = [&](uint64_t start, uint64_t length, uint8_t type)
    {
        if(!length || start >= blocks_count)
            return;

        Partition p;
        p.start = start;
        p.length = std::min(length, blocks_count - start);
        p.scheme = name();
        p.type = typeName(type);
        partitions.push_back(p);
    };

    for(auto const &e : entries)
    {
        if(!e.type || !e.sectors)
            continue;

        if(!isExtended(e.type))
        {
            add_partition(offset + e.start, e.sectors, e.type);
            continue;
        }

        // logical partition starts are relative to their own EBR, next EBR links to the extended partition start
        uint64_t extended_start = offset + e.start;
        std::set<uint64_t> visited;
        for(uint64_t ebr = extended_start; visited.size() < EBR_CHAIN_LIMIT && visited.insert(ebr).second;)
        {
            std::vector<Entry> ebr_entries;
            if(!readTable(reader, ebr, ebr_entries))
            {
                LOG("warning: broken extended boot record chain (LBA: {})", ebr);
                break;
            }

            if(ebr_entries[0].type && ebr_entries[0].sectors)
                add_partition(ebr + ebr_entries[0].start, ebr_entries[0].sectors, ebr_entries[0].type);

            if(!isExtended(ebr_entries[1].type) || !ebr_entries[1].start)
                break;

            ebr = extended_start + ebr_entries[1].start;
        }
    }

    return partitions;
}

}
