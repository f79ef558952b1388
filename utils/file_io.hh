#pragma once



#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>



namespace mediarip
{

void write_entry(std::fstream &fs, const uint8_t *data, uint64_t entry_size, uint64_t index, uint64_t count);
// reads past the end of file are filled with fill_byte, returns number of bytes actually read
uint64_t read_entry(std::fstream &fs, uint8_t *data, uint64_t entry_size, uint64_t index, uint64_t count, uint8_t fill_byte);
std::vector<uint8_t> read_vector(const std::filesystem::path &file_path);
void write_vector(const std::filesystem::path &file_path, const std::vector<uint8_t> &data);

}
