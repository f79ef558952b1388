#pragma once



#include <memory>
#include <vector>
#include "partitions/partition.hh"
#include "readers/block_reader.hh"



namespace mediarip
{

class PartitionRegistry
{
public:
    void add(std::unique_ptr<PartitionScheme> scheme);
    size_t size() const;

    // every scheme is tried at LBA 0 and then at the start of each found partition,
    // nested tables replace their parent, result is ordered by start and renumbered
    std::vector<Partition> getPartitions(BlockReader &reader) const;

    static PartitionRegistry defaults();

private:
    std::vector<std::unique_ptr<PartitionScheme>> _schemes;
};

}
