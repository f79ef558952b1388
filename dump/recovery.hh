#pragma once



#include <cstdint>
#include <string>
#include "dump/session.hh"
#include "image/image_artifact.hh"
#include "readers/block_reader.hh"



namespace mediarip
{

struct RecoveryResult
{
    Outcome outcome = Outcome::COMPLETED;
    std::string message;

    // total including the escalated pass
    uint32_t passes = 0;
    bool escalated = false;
    uint64_t recovered = 0;
    uint64_t remaining = 0;
};


RetryDirection retry_direction(RetryOrder order, uint32_t pass);

// single block retry passes over the bad block set, optionally escalated to the
// reader persistent recovery mode once all nominal passes are exhausted
RecoveryResult recover(Session &session, BlockReader &reader, ImageArtifact &artifact);

}
