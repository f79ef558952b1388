#include <algorithm>
#include <iterator>
#include "extent_set.hh"



namespace mediarip
{

void ExtentSet::add(uint64_t start, uint64_t length)
{
    if(!length)
        return;

    uint64_t end = start + length;

    // sequential append fast path
    if(_extents.empty() || start > std::prev(_extents.end())->second)
    {
        _extents.emplace_hint(_extents.end(), start, end);
        return;
    }

    auto last = std::prev(_extents.end());
    if(start >= last->first)
    {
        last->second = std::max(last->second, end);
        return;
    }

    // first extent that overlaps or touches the new range
    auto it = _extents.upper_bound(start);
    if(it != _extents.begin())
    {
        auto prev = std::prev(it);
        if(prev->second >= start)
            it = prev;
    }

    while(it != _extents.end() && it->first <= end)
    {
        start = std::min(start, it->first);
        end = std::max(end, it->second);
        it = _extents.erase(it);
    }

    _extents.emplace_hint(it, start, end);
}


bool ExtentSet::contains(uint64_t lba) const
{
    auto it = _extents.upper_bound(lba);
    if(it == _extents.begin())
        return false;

    --it;
    return lba < it->second;
}


std::vector<ExtentSet::Extent> ExtentSet::toRanges() const
{
    std::vector<Extent> ranges;
    ranges.reserve(_extents.size());

    for(auto const &e : _extents)
        ranges.push_back({ e.first, e.second - e.first });

    return ranges;
}


uint64_t ExtentSet::blocks() const
{
    uint64_t blocks = 0;
    for(auto const &e : _extents)
        blocks += e.second - e.first;

    return blocks;
}


size_t ExtentSet::size() const
{
    return _extents.size();
}


bool ExtentSet::empty() const
{
    return _extents.empty();
}


void ExtentSet::clear()
{
    _extents.clear();
}

}
