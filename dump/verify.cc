#include <chrono>
#include <fmt/format.h>
#include <vector>
#include "crc/crc32.hh"
#include "hash/md5.hh"
#include "hash/sha1.hh"
#include "utils/misc.hh"
#include "utils/throw_line.hh"
#include "verify.hh"



namespace mediarip
{

std::string Digest::xmlLine(const std::string &name) const
{
    return fmt::format("<rom name=\"{}\" size=\"{}\" crc=\"{:08x}\" md5=\"{}\" sha1=\"{}\" />", name, size, crc32, md5, sha1);
}


VerifyResult verify(ImageArtifact &artifact, uint64_t total_blocks, uint32_t block_size, const CancellationToken &token, Telemetry *telemetry)
{
    VerifyResult r;

    CRC32 crc;
    MD5 md5;
    SHA1 sha1;

    std::vector<uint8_t> window((uint64_t)VERIFY_WINDOW_BLOCKS * block_size);

    bool interrupted = batch_process_range<uint64_t>(std::pair<uint64_t, uint64_t>(0, total_blocks), VERIFY_WINDOW_BLOCKS, [&](uint64_t lba, uint64_t count) -> bool
    {
        if(token.cancelled())
            return true;

        if(telemetry != nullptr)
            telemetry->progress(lba, total_blocks);

        uint64_t bytes = count * block_size;

        auto start = std::chrono::steady_clock::now();
        if(artifact.readBlocks(lba, window.data(), (uint32_t)count) != bytes)
            throw_line("image file is shorter than expected (LBA: {}, image: {})", lba, artifact.path().filename().string());

        crc.update(window.data(), bytes);
        md5.update(window.data(), bytes);
        sha1.update(window.data(), bytes);
        r.covered_bytes += bytes;

        if(telemetry != nullptr)
            telemetry->sample(bytes, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

        return false;
    });

    if(interrupted)
        return r;

    r.complete = true;
    r.digest = Digest{ r.covered_bytes, crc.final(), md5.final(), sha1.final() };

    return r;
}

}
