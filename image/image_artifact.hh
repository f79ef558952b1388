#pragma once



#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>



namespace mediarip
{

// flat output image, byte offset of an LBA is always lba * block size
class ImageArtifact
{
public:
    // truncate creates a fresh image, otherwise the image must exist and is kept (resume)
    ImageArtifact(std::filesystem::path path, uint32_t block_size, bool truncate);

    void seek(uint64_t byte_offset);
    void write(const uint8_t *data, uint64_t size);
    // returns number of bytes read, less than requested at the end of file
    uint64_t read(uint8_t *data, uint64_t size);

    void writeBlocks(uint64_t lba, const uint8_t *data, uint32_t count);
    // zero filled placeholder keeping the image geometrically aligned with the medium
    void writePlaceholder(uint64_t lba, uint32_t count);
    // partial device data, zero padded or clipped to exactly count blocks
    void writePartial(uint64_t lba, const std::vector<uint8_t> &data, uint32_t count);
    // short reads are zero filled, returns number of bytes actually read
    uint64_t readBlocks(uint64_t lba, uint8_t *data, uint32_t count);

    uint64_t size();
    void flush();

    const std::filesystem::path &path() const;
    uint32_t blockSize() const;

private:
    std::filesystem::path _path;
    uint32_t _blockSize;
    std::fstream _fs;
};

}
