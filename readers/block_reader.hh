#pragma once



#include <cstdint>
#include <string>
#include <vector>



namespace mediarip
{

struct DeviceIdentity
{
    std::string manufacturer;
    std::string model;
    std::string serial;
    std::string platform;

    bool operator==(const DeviceIdentity &other) const = default;
};


enum class ReadStatus
{
    SUCCESS,
    // media error, timeout or transport error: the block goes to the bad block set
    ERROR,
    // device is gone, nothing else can be read in this run
    DISCONNECTED
};


struct ReadResult
{
    ReadStatus status = ReadStatus::ERROR;
    // on failure may hold whatever partial data the device returned
    std::vector<uint8_t> data;
    // milliseconds
    double duration = 0.;

    bool success() const
    {
        return status == ReadStatus::SUCCESS;
    }
};


class BlockReader
{
public:
    virtual ~BlockReader() {}

    virtual ReadResult readBlocks(uint64_t lba, uint32_t count) = 0;

    virtual ReadResult readBlock(uint64_t lba)
    {
        return readBlocks(lba, 1);
    }

    // best-effort vendor specific "retry harder / return partial data" mode, false if unsupported
    virtual bool trySetPersistentRecovery(bool enable)
    {
        (void)enable;
        return false;
    }

    virtual DeviceIdentity identity() const = 0;
    virtual uint32_t blockSize() const = 0;
    virtual uint64_t blocksCount() const = 0;
};

}
