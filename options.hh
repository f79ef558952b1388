#pragma once



#include <cstdint>
#include <memory>
#include <string>



namespace mediarip
{

struct Options
{
    std::string command;
    std::string arguments;

    bool help;
    bool version;
    bool verbose;

    std::string image_path;
    std::string image_name;
    bool overwrite;

    std::string drive;
    std::unique_ptr<uint64_t> block_size;
    std::unique_ptr<uint64_t> blocks;
    uint64_t chunk_size;
    uint64_t retries;
    bool persistent;
    bool stop_on_error;
    std::string retry_order;
    std::string resume_file;
    uint64_t timeout;

    Options(int argc, const char *argv[]);

    void printUsage();
};

}
