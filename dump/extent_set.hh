#pragma once



#include <cstdint>
#include <map>
#include <vector>



namespace mediarip
{

// ordered set of disjoint, non-abutting half-open LBA ranges
class ExtentSet
{
public:
    struct Extent
    {
        uint64_t start;
        uint64_t length;

        bool operator==(const Extent &other) const = default;
    };

    void add(uint64_t start, uint64_t length = 1);
    bool contains(uint64_t lba) const;
    std::vector<Extent> toRanges() const;

    uint64_t blocks() const;
    size_t size() const;
    bool empty() const;
    void clear();

    bool operator==(const ExtentSet &other) const = default;

private:
    // start -> end
    std::map<uint64_t, uint64_t> _extents;
};

}
