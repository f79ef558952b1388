#include <algorithm>
#include <utility>
#include "utils/file_io.hh"
#include "utils/throw_line.hh"
#include "image_artifact.hh"



namespace mediarip
{

ImageArtifact::ImageArtifact(std::filesystem::path path, uint32_t block_size, bool truncate)
    : _path(std::move(path))
    , _blockSize(block_size)
{
    if(!_blockSize)
        throw_line("block size must be non-zero");

    // resumed image must already be there, recreating it would zero acquired data
    auto file_mode = std::fstream::out | std::fstream::in | std::fstream::binary;
    if(truncate)
        file_mode |= std::fstream::trunc;
    else if(!std::filesystem::exists(_path))
        throw_line("image file not found ({})", _path.filename().string());

    _fs.open(_path, file_mode);
    if(!_fs.is_open())
        throw_line("unable to open file ({})", _path.filename().string());
}


void ImageArtifact::seek(uint64_t byte_offset)
{
    _fs.clear();
    _fs.seekp(byte_offset);
    _fs.seekg(byte_offset);
    if(_fs.fail())
        throw_line("seek failed ({}, offset: {})", _path.filename().string(), byte_offset);
}


void ImageArtifact::write(const uint8_t *data, uint64_t size)
{
    _fs.write((const char *)data, size);
    if(_fs.fail())
        throw_line("write failed ({})", _path.filename().string());
}


uint64_t ImageArtifact::read(uint8_t *data, uint64_t size)
{
    _fs.read((char *)data, size);
    uint64_t bytes_read = _fs.gcount();

    // end of file is not an error
    if(_fs.bad())
        throw_line("read failed ({})", _path.filename().string());
    _fs.clear();

    return bytes_read;
}


void ImageArtifact::writeBlocks(uint64_t lba, const uint8_t *data, uint32_t count)
{
    _fs.clear();
    write_entry(_fs, data, _blockSize, lba, count);
}


void ImageArtifact::writePlaceholder(uint64_t lba, uint32_t count)
{
    std::vector<uint8_t> placeholder((uint64_t)_blockSize * count, 0);
    writeBlocks(lba, placeholder.data(), count);
}


void ImageArtifact::writePartial(uint64_t lba, const std::vector<uint8_t> &data, uint32_t count)
{
    std::vector<uint8_t> blocks((uint64_t)_blockSize * count, 0);
    std::copy_n(data.begin(), std::min(data.size(), blocks.size()), blocks.begin());
    writeBlocks(lba, blocks.data(), count);
}


uint64_t ImageArtifact::readBlocks(uint64_t lba, uint8_t *data, uint32_t count)
{
    _fs.clear();
    return read_entry(_fs, data, _blockSize, lba, count, 0);
}


uint64_t ImageArtifact::size()
{
    _fs.clear();
    _fs.seekg(0, std::fstream::end);
    if(_fs.fail())
        throw_line("seek failed ({})", _path.filename().string());

    return _fs.tellg();
}


void ImageArtifact::flush()
{
    _fs.flush();
    if(_fs.fail())
        throw_line("flush failed ({})", _path.filename().string());
}


const std::filesystem::path &ImageArtifact::path() const
{
    return _path;
}


uint32_t ImageArtifact::blockSize() const
{
    return _blockSize;
}

}
