#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include "dump/telemetry.hh"
#include "image/image_artifact.hh"
#include "utils/cancel.hh"



namespace mediarip
{

struct Digest
{
    uint64_t size = 0;
    uint32_t crc32 = 0;
    std::string md5;
    std::string sha1;

    std::string xmlLine(const std::string &name) const;
};


struct VerifyResult
{
    // false if cancelled, the digest is then absent and must not be reported
    bool complete = false;
    uint64_t covered_bytes = 0;
    std::optional<Digest> digest;
};


constexpr uint32_t VERIFY_WINDOW_BLOCKS = 500;

VerifyResult verify(ImageArtifact &artifact, uint64_t total_blocks, uint32_t block_size, const CancellationToken &token, Telemetry *telemetry = nullptr);

}
