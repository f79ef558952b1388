#pragma once



#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "dump/bad_blocks.hh"
#include "readers/block_reader.hh"



namespace mediarip
{

struct AttemptRecord
{
    std::string software;
    std::string version;
    std::string os;
    // half-open [start, end) ranges acquired during this attempt
    std::vector<std::pair<uint64_t, uint64_t>> extents;

    bool operator==(const AttemptRecord &other) const = default;
};


struct ResumeLedger
{
    uint64_t next_block = 0;
    uint64_t total_blocks = 0;
    uint32_t block_size = 0;
    DeviceIdentity identity;
    BadBlockSet bad_blocks;
    std::vector<AttemptRecord> attempts;

    bool operator==(const ResumeLedger &other) const = default;
};


// ledger belongs to a different medium or drive, requires an explicit fresh start
class ResumeMismatch : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};


class ResumeStore
{
public:
    explicit ResumeStore(std::filesystem::path path);

    const std::filesystem::path &path() const;
    bool exists() const;

    // ledger as stored, no target checks
    std::optional<ResumeLedger> read() const;
    // std::nullopt if there is nothing to resume, throws ResumeMismatch if the ledger doesn't match the target
    std::optional<ResumeLedger> load(const DeviceIdentity &identity, uint64_t total_blocks, uint32_t block_size) const;
    // complete overwrite, never leaves a partially written ledger behind
    void save(const ResumeLedger &ledger) const;
    void remove() const;

    static std::string serialize(const ResumeLedger &ledger);
    static ResumeLedger parse(const std::string &text);

private:
    std::filesystem::path _path;
};

}
