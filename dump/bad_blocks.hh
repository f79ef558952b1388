#pragma once



#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>
#include <vector>



namespace mediarip
{

enum class RetryDirection
{
    FORWARD,
    REVERSE
};


// deduplicated set of failed LBAs awaiting recovery
class BadBlockSet
{
public:
    void add(uint64_t lba);
    void add(uint64_t lba, uint64_t count);
    bool remove(uint64_t lba);
    bool contains(uint64_t lba) const;

    size_t size() const;
    bool empty() const;
    void clear();

    // independent ordered copy, safe to iterate while the set is being modified
    std::vector<uint64_t> snapshot(RetryDirection direction) const;

    // compacted half-open [start, end) runs
    std::vector<std::pair<uint64_t, uint64_t>> toRanges() const;
    void addRanges(const std::vector<std::pair<uint64_t, uint64_t>> &ranges);

    bool operator==(const BadBlockSet &other) const = default;

private:
    std::set<uint64_t> _lbas;
};

}
