#pragma once



#include <cstdint>
#include <filesystem>
#include "readers/block_reader.hh"



namespace mediarip
{

// POSIX block device or regular file reader
class FileBlockReader : public BlockReader
{
public:
    // block_size 0: query the device (512 for regular files), timeout 0: none
    FileBlockReader(const std::filesystem::path &path, uint32_t block_size = 0, uint32_t timeout = 0);
    ~FileBlockReader() override;

    FileBlockReader(const FileBlockReader &) = delete;
    FileBlockReader &operator=(const FileBlockReader &) = delete;

    ReadResult readBlocks(uint64_t lba, uint32_t count) override;

    DeviceIdentity identity() const override;
    uint32_t blockSize() const override;
    uint64_t blocksCount() const override;

private:
    int _fd;
    DeviceIdentity _identity;
    uint32_t _blockSize;
    uint64_t _blocksCount;
    uint32_t _timeout;
};

}
