#include "dump/acquire.hh"
#include "utils/logger.hh"
#include "recovery.hh"



namespace mediarip
{

RetryDirection retry_direction(RetryOrder order, uint32_t pass)
{
    if(order == RetryOrder::FORWARD)
        return RetryDirection::FORWARD;
    else if(order == RetryOrder::REVERSE)
        return RetryDirection::REVERSE;
    else
        return pass % 2 ? RetryDirection::FORWARD : RetryDirection::REVERSE;
}


static void persistent_restore(BlockReader &reader, bool &enabled)
{
    if(!enabled)
        return;

    if(!reader.trySetPersistentRecovery(false))
        LOG("warning: unable to restore drive recovery mode");
    enabled = false;
}


RecoveryResult recover(Session &session, BlockReader &reader, ImageArtifact &artifact)
{
    RecoveryResult r;

    auto const &config = session.config;
    auto &bad_blocks = session.ledger.bad_blocks;

    if(bad_blocks.empty())
        return r;

    image_check_ledger(session, artifact);

    bool persistent_enabled = false;
    bool persistent_tried = false;
    uint32_t nominal_passes = 0;

    while(!bad_blocks.empty())
    {
        if(nominal_passes < config.max_retry_passes)
            ++nominal_passes;
        else if(config.persistent_recovery && !persistent_tried)
        {
            persistent_tried = true;

            if(reader.trySetPersistentRecovery(true))
            {
                persistent_enabled = true;
                r.escalated = true;
                LOG("persistent recovery mode enabled");
            }
            else
            {
                LOG("warning: persistent recovery mode unavailable");
                break;
            }
        }
        else
            break;

        ++r.passes;
        auto direction = retry_direction(config.retry_order, r.passes);
        auto lbas = bad_blocks.snapshot(direction);

        LOG_R("retry pass {}{} ({}, {} blocks)", r.passes, persistent_enabled ? " [persistent]" : "", direction == RetryDirection::FORWARD ? "forward" : "reverse", lbas.size());

        for(auto lba : lbas)
        {
            if(session.cancelled())
            {
                persistent_restore(reader, persistent_enabled);
                checkpoint(session, artifact);
                LOG_R("[LBA: {}] forced stop", lba);

                r.outcome = Outcome::CANCELLED;
                r.message = fmt::format("cancelled at LBA {}", lba);
                r.remaining = bad_blocks.size();
                return r;
            }

            session.telemetry.progress(lba, config.total_blocks);

            auto result = reader.readBlock(lba);
            if(result.success() && result.data.size() >= config.block_size)
            {
                artifact.writeBlocks(lba, result.data.data(), 1);
                session.recordRecovered(lba);
                ++r.recovered;

                if(config.verbose)
                    LOG_R("[LBA: {}] correction success", lba);
            }
            else if(result.status == ReadStatus::DISCONNECTED)
            {
                persistent_restore(reader, persistent_enabled);
                checkpoint(session, artifact);
                LOG_R("[LBA: {}] device disconnected", lba);

                r.outcome = Outcome::FATAL;
                r.message = fmt::format("device disconnected (LBA: {})", lba);
                r.remaining = bad_blocks.size();
                return r;
            }
            else
            {
                // best effort data is still better than a zeroed placeholder
                if(persistent_enabled && !result.data.empty())
                    artifact.writePartial(lba, result.data, 1);

                if(config.verbose)
                    LOG_R("[LBA: {}] correction failure", lba);
            }
        }

        checkpoint(session, artifact);
    }

    persistent_restore(reader, persistent_enabled);
    checkpoint(session, artifact);

    r.remaining = bad_blocks.size();
    LOG_R("recovery: {} blocks recovered, {} remaining ({} passes)", r.recovered, r.remaining, r.passes);

    return r;
}

}
