#include <algorithm>
#include <cstring>
#include "utils/throw_line.hh"
#include "file_io.hh"



namespace mediarip
{

void write_entry(std::fstream &fs, const uint8_t *data, uint64_t entry_size, uint64_t index, uint64_t count)
{
    uint64_t size = entry_size * count;
    if(!size)
        return;

    fs.seekp(index * entry_size);
    if(fs.fail())
        throw_line("seek failed");

    fs.write((const char *)data, size);
    if(fs.fail())
        throw_line("write failed");
}


uint64_t read_entry(std::fstream &fs, uint8_t *data, uint64_t entry_size, uint64_t index, uint64_t count, uint8_t fill_byte)
{
    uint64_t file_offset = index * entry_size;
    uint64_t total_size = entry_size * count;

    fs.seekg(0, std::fstream::end);
    if(fs.fail())
        throw_line("seek failed");

    uint64_t file_size = fs.tellg();
    uint64_t size = file_offset < file_size ? std::min(total_size, file_size - file_offset) : 0;

    memset(data + size, fill_byte, total_size - size);

    if(size)
    {
        fs.seekg(file_offset);
        if(fs.fail())
            throw_line("seek failed");

        fs.read((char *)data, size);
        if(fs.fail())
            throw_line("read failed");
    }

    return size;
}


std::vector<uint8_t> read_vector(const std::filesystem::path &file_path)
{
    std::vector<uint8_t> data((std::vector<uint8_t>::size_type)std::filesystem::file_size(file_path));

    std::fstream fs(file_path, std::fstream::in | std::fstream::binary);
    if(!fs.is_open())
        throw_line("unable to open file ({})", file_path.filename().string());

    fs.read((char *)data.data(), data.size());
    if(fs.fail())
        throw_line("read failed ({})", file_path.filename().string());

    return data;
}


void write_vector(const std::filesystem::path &file_path, const std::vector<uint8_t> &data)
{
    std::fstream fs(file_path, std::fstream::out | std::fstream::binary);
    if(!fs.is_open())
        throw_line("unable to create file ({})", file_path.filename().string());

    fs.write((const char *)data.data(), data.size());
    if(fs.fail())
        throw_line("write failed ({})", file_path.filename().string());
}

}
