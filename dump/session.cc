#include <utility>
#include "utils/throw_line.hh"
#include "session.hh"



namespace mediarip
{

Session::Session(const SessionConfig &session_config, ResumeLedger resume_ledger, const AttemptInfo &attempt, const CancellationToken &cancel_token, const ResumeStore *store)
    : config(session_config)
    , ledger(std::move(resume_ledger))
    , token(cancel_token)
    , _store(store)
{
    if(!config.total_blocks)
        throw_line("medium is empty");
    if(!config.block_size)
        throw_line("block size must be non-zero");
    if(!config.chunk_size)
        throw_line("chunk size must be non-zero");

    // fresh ledger
    if(!ledger.total_blocks && ledger.attempts.empty())
    {
        ledger.total_blocks = config.total_blocks;
        ledger.block_size = config.block_size;
    }
    else if(ledger.total_blocks != config.total_blocks || ledger.block_size != config.block_size)
        throw_line("ledger geometry doesn't match the session ({} x {} != {} x {})", ledger.total_blocks, ledger.block_size, config.total_blocks, config.block_size);

    for(auto const &a : ledger.attempts)
        for(auto const &e : a.extents)
            extents.add(e.first, e.second - e.first);

    ledger.attempts.push_back(AttemptRecord{ attempt.software, attempt.version, attempt.os });
}


bool Session::cancelled() const
{
    return token.cancelled();
}


void Session::recordSuccess(uint64_t lba, uint64_t count)
{
    extents.add(lba, count);
    attemptExtents.add(lba, count);
}


void Session::recordFailure(uint64_t lba, uint64_t count)
{
    ledger.bad_blocks.add(lba, count);
}


void Session::recordRecovered(uint64_t lba)
{
    ledger.bad_blocks.remove(lba);
    recordSuccess(lba, 1);
}


void Session::persist()
{
    auto &extents_out = ledger.attempts.back().extents;
    extents_out.clear();
    for(auto const &e : attemptExtents.toRanges())
        extents_out.emplace_back(e.start, e.start + e.length);

    if(_store != nullptr)
        _store->save(ledger);
}

}
