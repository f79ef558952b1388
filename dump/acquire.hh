#pragma once



#include "dump/session.hh"
#include "image/image_artifact.hh"
#include "readers/block_reader.hh"



namespace mediarip
{

// sequential chunked pass from ledger.next_block to the end of the medium
PhaseResult acquire(Session &session, BlockReader &reader, ImageArtifact &artifact);

// throws if the image doesn't hold every block the ledger accounts for
void image_check_ledger(const Session &session, ImageArtifact &artifact);

// image data reaches the disk before the ledger that references it
void checkpoint(Session &session, ImageArtifact &artifact);

}
