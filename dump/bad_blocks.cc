#include "bad_blocks.hh"



namespace mediarip
{

void BadBlockSet::add(uint64_t lba)
{
    _lbas.insert(_lbas.end(), lba);
}


void BadBlockSet::add(uint64_t lba, uint64_t count)
{
    for(uint64_t i = 0; i < count; ++i)
        _lbas.insert(_lbas.end(), lba + i);
}


bool BadBlockSet::remove(uint64_t lba)
{
    return _lbas.erase(lba) != 0;
}


bool BadBlockSet::contains(uint64_t lba) const
{
    return _lbas.find(lba) != _lbas.end();
}


size_t BadBlockSet::size() const
{
    return _lbas.size();
}


bool BadBlockSet::empty() const
{
    return _lbas.empty();
}


void BadBlockSet::clear()
{
    _lbas.clear();
}


std::vector<uint64_t> BadBlockSet::snapshot(RetryDirection direction) const
{
    if(direction == RetryDirection::REVERSE)
        return std::vector<uint64_t>(_lbas.rbegin(), _lbas.rend());

    return std::vector<uint64_t>(_lbas.begin(), _lbas.end());
}


std::vector<std::pair<uint64_t, uint64_t>> BadBlockSet::toRanges() const
{
    std::vector<std::pair<uint64_t, uint64_t>> ranges;

    for(auto lba : _lbas)
    {
        if(!ranges.empty() && ranges.back().second == lba)
            ++ranges.back().second;
        else
            ranges.emplace_back(lba, lba + 1);
    }

    return ranges;
}


void BadBlockSet::addRanges(const std::vector<std::pair<uint64_t, uint64_t>> &ranges)
{
    for(auto const &r : ranges)
        add(r.first, r.second - r.first);
}

}
