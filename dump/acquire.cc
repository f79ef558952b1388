#include <algorithm>
#include "utils/logger.hh"
#include "utils/throw_line.hh"
#include "acquire.hh"



namespace mediarip
{

void checkpoint(Session &session, ImageArtifact &artifact)
{
    artifact.flush();
    session.persist();
}


void image_check_ledger(const Session &session, ImageArtifact &artifact)
{
    uint64_t expected = session.ledger.next_block * session.config.block_size;
    uint64_t size = artifact.size();
    if(size < expected)
        throw_line("image file is shorter than the resume ledger (image: {}, size: {}, expected: {})", artifact.path().filename().string(), size, expected);
}


PhaseResult acquire(Session &session, BlockReader &reader, ImageArtifact &artifact)
{
    auto const &config = session.config;
    auto &ledger = session.ledger;

    image_check_ledger(session, artifact);

    if(ledger.next_block)
        LOG("resuming from LBA {}", ledger.next_block);

    while(ledger.next_block < config.total_blocks)
    {
        uint64_t lba = ledger.next_block;

        if(session.cancelled())
        {
            checkpoint(session, artifact);
            LOG_R("[LBA: {}] forced stop", lba);
            return { Outcome::CANCELLED, fmt::format("cancelled at LBA {}", lba) };
        }

        session.telemetry.progress(lba, config.total_blocks);

        auto count = (uint32_t)std::min<uint64_t>(config.chunk_size, config.total_blocks - lba);
        uint64_t bytes = (uint64_t)count * config.block_size;

        auto result = reader.readBlocks(lba, count);

        // short successful read can't be placed geometrically, treat as a failure
        if(result.success() && result.data.size() < bytes)
            result.status = ReadStatus::ERROR;

        if(result.success())
        {
            artifact.writeBlocks(lba, result.data.data(), count);
            session.recordSuccess(lba, count);
            session.telemetry.sample(bytes, result.duration);
        }
        else
        {
            if(result.status == ReadStatus::DISCONNECTED)
            {
                checkpoint(session, artifact);
                LOG_R("[LBA: {}] device disconnected", lba);
                return { Outcome::FATAL, fmt::format("device disconnected (LBA: {})", lba) };
            }

            if(config.stop_on_error)
            {
                checkpoint(session, artifact);
                LOG_R("[LBA: {}] read error, stopping", lba);
                return { Outcome::FATAL, fmt::format("read error (LBA: {}, count: {})", lba, count) };
            }

            artifact.writePlaceholder(lba, count);
            session.recordFailure(lba, count);
            session.telemetry.sampleFailure(bytes, result.duration);

            if(config.verbose)
                LOG_R("[LBA: {}] read error (count: {})", lba, count);
        }

        ledger.next_block = lba + count;
        checkpoint(session, artifact);
    }

    checkpoint(session, artifact);
    session.telemetry.progress(config.total_blocks, config.total_blocks);

    return { Outcome::COMPLETED, "" };
}

}
