#include <algorithm>
#include <deque>
#include <set>
#include "partitions/mbr.hh"
#include "utils/logger.hh"
#include "registry.hh"



namespace mediarip
{

void PartitionRegistry::add(std::unique_ptr<PartitionScheme> scheme)
{
    _schemes.push_back(std::move(scheme));
}


size_t PartitionRegistry::size() const
{
    return _schemes.size();
}


std::vector<Partition> PartitionRegistry::getPartitions(BlockReader &reader) const
{
    std::vector<Partition> partitions;

    auto detect_all = [&](uint64_t offset)
    {
        std::vector<Partition> found;
        for(auto const &s : _schemes)
        {
            auto p = s->detect(reader, offset);
            found.insert(found.end(), p.begin(), p.end());
        }
        return found;
    };

    std::set<uint64_t> checked;
    auto top = detect_all(0);
    checked.insert(0);

    std::deque<Partition> pending(top.begin(), top.end());
    while(!pending.empty())
    {
        auto p = pending.front();
        pending.pop_front();

        if(checked.find(p.start) != checked.end())
        {
            partitions.push_back(p);
            continue;
        }

        auto children = detect_all(p.start);
        checked.insert(p.start);

        if(children.empty())
            partitions.push_back(p);
        else
            for(auto const &c : children)
            {
                if(checked.find(c.start) != checked.end())
                    partitions.push_back(c);
                else
                    pending.push_back(c);
            }
    }

    std::sort(partitions.begin(), partitions.end(), [](const Partition &a, const Partition &b)
    {
        if(a.start != b.start)
            return a.start < b.start;
        if(a.length != b.length)
            return a.length < b.length;
        return a.scheme < b.scheme;
    });

    for(uint64_t i = 0; i < partitions.size(); ++i)
        partitions[i].sequence = i;

    return partitions;
}


PartitionRegistry PartitionRegistry::defaults()
{
    PartitionRegistry registry;
    registry.add(std::make_unique<MBR>());

    return registry;
}

}
