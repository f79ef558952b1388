#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "crc/crc32.hh"
#include "dump/acquire.hh"
#include "dump/recovery.hh"
#include "dump/resume.hh"
#include "dump/session.hh"
#include "dump/verify.hh"
#include "hash/md5.hh"
#include "hash/sha1.hh"
#include "image/image_artifact.hh"
#include "mediarip.hh"
#include "options.hh"
#include "partitions/mbr.hh"
#include "partitions/registry.hh"
#include "utils/cancel.hh"
#include "utils/file_io.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"



using namespace mediarip;



// in-memory medium with injectable read faults
class MediumReader : public BlockReader
{
public:
    MediumReader(uint64_t blocks_count, uint32_t block_size)
        : data(blocks_count * block_size)
        , _blockSize(block_size)
        , _blocksCount(blocks_count)
    {
        for(uint64_t lba = 0; lba < blocks_count; ++lba)
            for(uint32_t i = 0; i < block_size; ++i)
                data[lba * block_size + i] = (uint8_t)(lba * 7 + i * 13 + (lba >> 8));
    }

    std::vector<uint8_t> data;

    // fail on every read
    std::set<uint64_t> bad;
    // fail the given number of reads, then succeed
    std::map<uint64_t, uint32_t> transient;
    uint64_t disconnect_lba = std::numeric_limits<uint64_t>::max();
    bool persistent_supported = true;

    CancellationFlag *cancel = nullptr;
    uint32_t cancel_after = 0;

    uint32_t reads = 0;
    std::vector<uint64_t> single_reads;
    // (single reads issued so far, enable)
    std::vector<std::pair<size_t, bool>> persistent_requests;

    ReadResult readBlocks(uint64_t lba, uint32_t count) override
    {
        ++reads;
        if(cancel != nullptr && reads == cancel_after)
            cancel->cancel();

        ReadResult r;
        r.duration = 1.;

        for(uint64_t i = lba; i < lba + count; ++i)
        {
            if(i >= disconnect_lba)
            {
                r.status = ReadStatus::DISCONNECTED;
                return r;
            }

            bool failed = bad.find(i) != bad.end();
            if(auto it = transient.find(i); !failed && it != transient.end() && it->second)
            {
                --it->second;
                failed = true;
            }

            if(failed)
            {
                r.status = ReadStatus::ERROR;
                if(_persistent)
                    r.data.assign(_blockSize, 0xEE);
                return r;
            }
        }

        r.status = ReadStatus::SUCCESS;
        r.data.assign(data.begin() + lba * _blockSize, data.begin() + (lba + count) * _blockSize);

        return r;
    }


    ReadResult readBlock(uint64_t lba) override
    {
        single_reads.push_back(lba);
        return readBlocks(lba, 1);
    }


    bool trySetPersistentRecovery(bool enable) override
    {
        persistent_requests.emplace_back(single_reads.size(), enable);
        if(!persistent_supported)
            return false;

        _persistent = enable;
        return true;
    }


    DeviceIdentity identity() const override
    {
        return DeviceIdentity{ "ACME", "Medium", "0001", "test" };
    }


    uint32_t blockSize() const override
    {
        return _blockSize;
    }


    uint64_t blocksCount() const override
    {
        return _blocksCount;
    }

private:
    uint32_t _blockSize;
    uint64_t _blocksCount;
    bool _persistent = false;
};


const AttemptInfo TEST_ATTEMPT{ "mediarip", "test", "test" };


std::filesystem::path test_directory(const std::string &name)
{
    auto dir = std::filesystem::temp_directory_path() / "mediarip_tests" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    return dir;
}


SessionConfig test_config(const MediumReader &reader, uint32_t chunk_size)
{
    SessionConfig config;
    config.total_blocks = reader.blocksCount();
    config.block_size = reader.blockSize();
    config.chunk_size = chunk_size;

    return config;
}


ResumeLedger fresh_ledger(const BlockReader &reader)
{
    ResumeLedger ledger;
    ledger.identity = reader.identity();

    return ledger;
}


bool check(const std::string &name, bool condition)
{
    std::cout << name << "... " << (condition ? "success" : "failure") << std::endl;

    return condition;
}


int run_mediarip(const std::vector<std::string> &arguments)
{
    std::vector<const char *> argv{ "mediarip" };
    for(auto const &a : arguments)
        argv.push_back(a.c_str());

    Options options((int)argv.size(), argv.data());
    return mediarip::mediarip(options);
}


std::string read_text(const std::filesystem::path &file_path)
{
    std::ifstream ifs(file_path);
    std::stringstream ss;
    ss << ifs.rdbuf();

    return ss.str();
}


bool test_crc()
{
    bool success = true;

    std::string check_value("123456789");

    auto crc32 = CRC32().update((uint8_t *)check_value.data(), check_value.length()).final();
    auto crc32_match = crc32 == 0xCBF43926;
    std::cout << fmt::format("CRC-32: 0x{:08X}, {}", crc32, crc32_match ? "success" : "failure") << std::endl;
    if(!crc32_match)
        success = false;

    return success;
}


bool test_hash()
{
    bool success = true;

    std::vector<std::pair<std::string, std::pair<std::string, std::string>>> cases = {
        { "",                                            { "d41d8cd98f00b204e9800998ecf8427e", "da39a3ee5e6b4b0d3255bfef95601890afd80709" } },
        { "abc",                                         { "900150983cd24fb0d6963f7d28e17f72", "a9993e364706816aba3e25717850c26c9cd0d89d" } },
        { "The quick brown fox jumps over the lazy dog", { "9e107d9d372bb6826bd81d3542a419d6", "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12" } },
        { std::string(1000, 'a'),                        { "cabe45dcc9ae5b66ba86600cca6b8ba8", "291e9a6c66994949b57ba5e650361e98fc36b1ba" } }
    };

    for(auto const &c : cases)
    {
        std::cout << fmt::format("MD5/SHA-1 (length: {})... ", c.first.length()) << std::flush;

        // split input to exercise partial block buffering
        auto split = c.first.length() / 3;
        MD5 md5;
        SHA1 sha1;
        md5.update((uint8_t *)c.first.data(), split);
        md5.update((uint8_t *)c.first.data() + split, c.first.length() - split);
        sha1.update((uint8_t *)c.first.data(), split);
        sha1.update((uint8_t *)c.first.data() + split, c.first.length() - split);

        auto md5_hash = md5.final();
        auto sha1_hash = sha1.final();
        if(md5_hash == c.second.first && sha1_hash == c.second.second)
            std::cout << "success";
        else
        {
            std::cout << fmt::format("failure, result: {} {}", md5_hash, sha1_hash);
            success = false;
        }

        std::cout << std::endl;
    }

    return success;
}


bool test_extent_set()
{
    bool success = true;

    ExtentSet extents;
    extents.add(0, 64);
    extents.add(64, 64);
    success &= check("sequential chunks merge", extents.size() == 1 && extents.blocks() == 128);

    extents.add(200, 10);
    extents.add(150, 10);
    success &= check("disjoint extents stay apart", extents.size() == 3 && extents.toRanges()[1] == ExtentSet::Extent{ 150, 10 });

    extents.add(128, 22);
    success &= check("abutting extent bridges neighbors", extents.size() == 2 && extents.toRanges()[0] == ExtentSet::Extent{ 0, 160 });

    extents.add(100, 120);
    success &= check("overlapping extent merges", extents.size() == 1 && extents.toRanges()[0] == ExtentSet::Extent{ 0, 220 });

    extents.add(500, 0);
    success &= check("zero length add ignored", extents.size() == 1 && extents.blocks() == 220);

    success &= check("contains", extents.contains(0) && extents.contains(219) && !extents.contains(220) && !extents.contains(500));

    return success;
}


bool test_bad_blocks()
{
    bool success = true;

    BadBlockSet bad_blocks;
    bad_blocks.add(30);
    bad_blocks.add(10, 3);
    bad_blocks.add(11);

    success &= check("deduplicated", bad_blocks.size() == 4);
    success &= check("ascending snapshot", bad_blocks.snapshot(RetryDirection::FORWARD) == std::vector<uint64_t>{ 10, 11, 12, 30 });
    success &= check("descending snapshot", bad_blocks.snapshot(RetryDirection::REVERSE) == std::vector<uint64_t>{ 30, 12, 11, 10 });

    auto snapshot = bad_blocks.snapshot(RetryDirection::FORWARD);
    for(auto lba : snapshot)
        bad_blocks.remove(lba);
    success &= check("snapshot survives removal", snapshot.size() == 4 && bad_blocks.empty());

    bad_blocks.addRanges(string_to_ranges("5-7:9"));
    success &= check("ranges", ranges_to_string(bad_blocks.toRanges()) == "5-7:9" && bad_blocks.contains(6) && !bad_blocks.contains(8));

    return success;
}


bool test_ledger()
{
    bool success = true;

    ResumeLedger ledger;
    ledger.next_block = 768;
    ledger.total_blocks = 1000;
    ledger.block_size = 2048;
    ledger.identity = DeviceIdentity{ "ACME", "Medium X", "0001", "test" };
    ledger.bad_blocks.add(500, 3);
    ledger.bad_blocks.add(700);
    ledger.attempts.push_back(AttemptRecord{ "mediarip", "1", "Linux 6.1 x86_64", { { 0, 500 }, { 503, 700 } } });
    ledger.attempts.push_back(AttemptRecord{ "mediarip", "2", "Linux 6.1 x86_64", { { 701, 768 } } });

    success &= check("ledger text round trip", ResumeStore::parse(ResumeStore::serialize(ledger)) == ledger);

    bool unknown_rejected = false;
    try
    {
        ResumeStore::parse("version=1\nfoo=bar\n");
    }
    catch(const std::runtime_error &)
    {
        unknown_rejected = true;
    }
    success &= check("ledger unknown key rejected", unknown_rejected);

    auto dir = test_directory("ledger");
    ResumeStore store(dir / "image.resume");
    success &= check("ledger not found", !store.load(ledger.identity, 1000, 2048));

    store.save(ledger);
    store.save(ledger);
    auto loaded = store.load(ledger.identity, 1000, 2048);
    success &= check("ledger save is idempotent", loaded && *loaded == ledger && !std::filesystem::exists(dir / "image.resume.tmp"));

    bool identity_mismatch = false;
    try
    {
        store.load(DeviceIdentity{ "ACME", "Medium X", "0002", "test" }, 1000, 2048);
    }
    catch(const ResumeMismatch &)
    {
        identity_mismatch = true;
    }
    success &= check("ledger identity mismatch", identity_mismatch);

    bool geometry_mismatch = false;
    try
    {
        store.load(ledger.identity, 1000, 512);
    }
    catch(const ResumeMismatch &)
    {
        geometry_mismatch = true;
    }
    success &= check("ledger geometry mismatch", geometry_mismatch);

    return success;
}


bool test_telemetry()
{
    bool success = true;

    Telemetry telemetry;
    success &= check("zero bytes sample ignored", !telemetry.sample(0, 10.) && !telemetry.valid());
    success &= check("zero duration sample ignored", !telemetry.sample(1024, 0.) && !telemetry.valid());

    telemetry.sample(1024 * 1024, 1000.);
    telemetry.sample(4 * 1024 * 1024, 1000.);
    telemetry.sample(2 * 1024 * 1024, 1000.);
    success &= check("speed bounds", telemetry.valid() && telemetry.minSpeed() == 1. && telemetry.maxSpeed() == 4. && telemetry.currentSpeed() == 2.
                                         && telemetry.minSpeed() <= telemetry.currentSpeed() && telemetry.currentSpeed() <= telemetry.maxSpeed());

    success &= check("fast failure penalized", Telemetry::penalizedDuration(100.) == Telemetry::FAILURE_PENALTY && Telemetry::penalizedDuration(600.) == 600.);

    std::vector<uint64_t> feed;
    telemetry.setProgressCallback([&feed](uint64_t lba, uint64_t, double) { feed.push_back(lba); });
    telemetry.progress(5, 10);
    success &= check("progress feed", feed == std::vector<uint64_t>{ 5 });

    return success;
}


// scenario: clean medium
bool test_clean_dump()
{
    bool success = true;

    auto dir = test_directory("clean");
    MediumReader reader(1000, 512);
    ResumeStore store(dir / "image.resume");
    CancellationFlag token;

    Session session(test_config(reader, 64), fresh_ledger(reader), TEST_ATTEMPT, token, &store);
    ImageArtifact artifact(dir / "image.img", 512, true);

    std::vector<uint64_t> progress;
    session.telemetry.setProgressCallback([&progress](uint64_t lba, uint64_t, double) { progress.push_back(lba); });

    auto result = acquire(session, reader, artifact);
    success &= check("clean dump completed", result.outcome == Outcome::COMPLETED && session.ledger.next_block == 1000);
    success &= check("clean dump single extent", session.extents.size() == 1 && session.extents.blocks() == 1000 && session.ledger.bad_blocks.empty());
    success &= check("clean dump progress", progress.size() == 17 && progress.front() == 0 && progress.back() == 1000);
    success &= check("clean dump telemetry", session.telemetry.valid() && session.telemetry.totalBytes() == 1000 * 512);

    auto recovery = recover(session, reader, artifact);
    success &= check("clean dump nothing to recover", recovery.outcome == Outcome::COMPLETED && recovery.passes == 0 && reader.single_reads.empty());

    success &= check("clean dump image", read_vector(dir / "image.img") == reader.data);

    auto loaded = store.load(reader.identity(), 1000, 512);
    success &= check("clean dump ledger", loaded && loaded->next_block == 1000 && loaded->attempts.size() == 1
                                              && loaded->attempts.front().extents == std::vector<std::pair<uint64_t, uint64_t>>{ { 0, 1000 } });

    auto verification = verify(artifact, 1000, 512, token);

    CRC32 crc;
    MD5 md5;
    SHA1 sha1;
    crc.update(reader.data.data(), reader.data.size());
    md5.update(reader.data.data(), reader.data.size());
    sha1.update(reader.data.data(), reader.data.size());
    success &= check("clean dump digest", verification.complete && verification.digest && verification.digest->size == 512000 && verification.digest->crc32 == crc.final()
                                              && verification.digest->md5 == md5.final() && verification.digest->sha1 == sha1.final());
    success &= check("clean dump dat line", verification.digest && verification.digest->xmlLine("image.img").starts_with("<rom name=\"image.img\" size=\"512000\" crc=\""));

    return success;
}


// scenario: block that reads after a couple of retries
bool test_transient_error()
{
    bool success = true;

    auto dir = test_directory("transient");
    MediumReader reader(1000, 512);
    reader.transient[500] = 2;
    CancellationFlag token;

    Session session(test_config(reader, 64), fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    auto result = acquire(session, reader, artifact);
    success &= check("transient dump completed", result.outcome == Outcome::COMPLETED && session.ledger.next_block == 1000);
    success &= check("transient chunk marked bad", session.ledger.bad_blocks.size() == 64 && session.ledger.bad_blocks.contains(448)
                                                       && session.ledger.bad_blocks.contains(511) && !session.extents.contains(500));

    auto placeholder = read_vector(dir / "image.img");
    success &= check("transient placeholder", placeholder.size() == reader.data.size() && placeholder[500 * 512] == 0 && placeholder[500 * 512 + 511] == 0);

    auto recovery = recover(session, reader, artifact);
    success &= check("transient recovered", recovery.outcome == Outcome::COMPLETED && recovery.recovered == 64 && recovery.remaining == 0 && recovery.passes == 2
                                                && !recovery.escalated);
    success &= check("transient coverage", session.extents.size() == 1 && session.extents.blocks() == 1000 && session.ledger.bad_blocks.empty());

    artifact.flush();
    success &= check("transient image", read_vector(dir / "image.img") == reader.data);

    return success;
}


// scenario: interrupted and resumed dump is equivalent to an uninterrupted one
bool test_cancel_resume()
{
    bool success = true;

    auto dir = test_directory("resume");
    MediumReader reader(1000, 512);
    reader.bad.insert(900);
    ResumeStore store(dir / "image.resume");
    CancellationFlag token;
    reader.cancel = &token;
    reader.cancel_after = 4;

    {
        Session session(test_config(reader, 64), fresh_ledger(reader), TEST_ATTEMPT, token, &store);
        ImageArtifact artifact(dir / "image.img", 512, true);

        auto result = acquire(session, reader, artifact);
        success &= check("cancelled at chunk boundary", result.outcome == Outcome::CANCELLED && session.ledger.next_block == 256 && reader.reads == 4);
    }

    auto ledger = store.load(reader.identity(), 1000, 512);
    success &= check("cancelled ledger persisted", ledger && ledger->next_block == 256 && ledger->bad_blocks.empty());

    token.reset();
    reader.cancel = nullptr;

    Session session(test_config(reader, 64), *ledger, TEST_ATTEMPT, token, &store);
    ImageArtifact artifact(dir / "image.img", 512, false);
    success &= check("resumed extents restored", session.extents.blocks() == 256 && session.ledger.attempts.size() == 2);

    auto result = acquire(session, reader, artifact);
    success &= check("resumed dump completed", result.outcome == Outcome::COMPLETED && reader.reads == 4 + 12);

    // uninterrupted reference
    auto reference_dir = test_directory("resume_reference");
    MediumReader reference_reader(1000, 512);
    reference_reader.bad.insert(900);
    Session reference(test_config(reference_reader, 64), fresh_ledger(reference_reader), TEST_ATTEMPT, token);
    ImageArtifact reference_artifact(reference_dir / "image.img", 512, true);
    acquire(reference, reference_reader, reference_artifact);
    reference_artifact.flush();

    success &= check("resume equivalence extents", session.extents == reference.extents);
    success &= check("resume equivalence bad blocks", session.ledger.bad_blocks == reference.ledger.bad_blocks);
    success &= check("resume equivalence image", read_vector(dir / "image.img") == read_vector(reference_dir / "image.img"));

    auto final_ledger = store.load(reader.identity(), 1000, 512);
    success &= check("resume attempts", final_ledger && final_ledger->attempts.size() == 2
                                            && final_ledger->attempts[0].extents == std::vector<std::pair<uint64_t, uint64_t>>{ { 0, 256 } }
                                            && final_ledger->attempts[1].extents == std::vector<std::pair<uint64_t, uint64_t>>{ { 256, 896 }, { 960, 1000 } });

    return success;
}


// scenario: unreadable block, persistent recovery escalation
bool test_escalation()
{
    bool success = true;

    auto dir = test_directory("escalation");
    MediumReader reader(1000, 512);
    reader.bad.insert(550);
    CancellationFlag token;

    auto config = test_config(reader, 64);
    config.max_retry_passes = 5;
    config.persistent_recovery = true;

    Session session(config, fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    acquire(session, reader, artifact);
    auto recovery = recover(session, reader, artifact);

    success &= check("escalation passes", recovery.outcome == Outcome::COMPLETED && recovery.passes == 6 && recovery.escalated);
    success &= check("escalation residual", recovery.remaining == 1 && session.ledger.bad_blocks.size() == 1 && session.ledger.bad_blocks.contains(550));

    // 64 reads in the first pass, 4 more until nominal passes are exhausted
    bool once = reader.persistent_requests.size() == 2 && reader.persistent_requests[0] == std::pair<size_t, bool>(68, true)
             && reader.persistent_requests[1] == std::pair<size_t, bool>(69, false);
    success &= check("escalation exactly once, then restored", once);

    artifact.flush();
    auto image = read_vector(dir / "image.img");
    success &= check("escalation partial data captured", image[550 * 512] == 0xEE && image[550 * 512 + 511] == 0xEE && image[549 * 512] == reader.data[549 * 512]);

    return success;
}


bool test_escalation_unavailable()
{
    bool success = true;

    auto dir = test_directory("escalation_unavailable");
    MediumReader reader(100, 512);
    reader.bad.insert(10);
    reader.persistent_supported = false;
    CancellationFlag token;

    auto config = test_config(reader, 1);
    config.max_retry_passes = 3;
    config.persistent_recovery = true;

    Session session(config, fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    acquire(session, reader, artifact);
    auto recovery = recover(session, reader, artifact);

    success &= check("unavailable escalation is not fatal", recovery.outcome == Outcome::COMPLETED && recovery.passes == 3 && !recovery.escalated && recovery.remaining == 1);
    success &= check("unavailable escalation tried once", reader.persistent_requests.size() == 1 && reader.persistent_requests[0].second);

    auto image = read_vector(dir / "image.img");
    success &= check("unavailable escalation keeps placeholder", image[10 * 512] == 0);

    return success;
}


bool test_retry_direction()
{
    bool success = true;

    std::vector<std::pair<RetryOrder, std::vector<uint64_t>>> cases = {
        { RetryOrder::ALTERNATE, { 10, 20, 30, 30, 20, 10, 10, 20, 30 } },
        { RetryOrder::FORWARD,   { 10, 20, 30, 10, 20, 30, 10, 20, 30 } },
        { RetryOrder::REVERSE,   { 30, 20, 10, 30, 20, 10, 30, 20, 10 } }
    };

    for(auto const &c : cases)
    {
        auto dir = test_directory("direction");
        MediumReader reader(100, 512);
        reader.bad = { 10, 20, 30 };
        CancellationFlag token;

        auto config = test_config(reader, 1);
        config.max_retry_passes = 3;
        config.retry_order = c.first;

        Session session(config, fresh_ledger(reader), TEST_ATTEMPT, token);
        ImageArtifact artifact(dir / "image.img", 512, true);

        acquire(session, reader, artifact);
        auto recovery = recover(session, reader, artifact);

        success &= check(fmt::format("retry direction (order: {})", (int)c.first), recovery.passes == 3 && reader.single_reads == c.second);
    }

    return success;
}


// scenario: cancelled while retrying, escalated mode is restored and the ledger keeps the remaining work
bool test_recovery_cancel()
{
    bool success = true;

    for(uint32_t cancel_after : { 101u, 104u })
    {
        bool escalated = cancel_after == 104;

        auto dir = test_directory("recovery_cancel");
        MediumReader reader(100, 512);
        reader.bad = { 10, 20, 30 };
        ResumeStore store(dir / "image.resume");
        CancellationFlag token;
        reader.cancel = &token;
        // 100 chunk reads, 3 in the nominal pass, then the escalated pass
        reader.cancel_after = cancel_after;

        auto config = test_config(reader, 1);
        config.max_retry_passes = 1;
        config.persistent_recovery = true;

        Session session(config, fresh_ledger(reader), TEST_ATTEMPT, token, &store);
        ImageArtifact artifact(dir / "image.img", 512, true);

        acquire(session, reader, artifact);
        auto recovery = recover(session, reader, artifact);

        std::string mode(escalated ? "escalated" : "nominal");
        success &= check(fmt::format("recovery cancelled ({})", mode), recovery.outcome == Outcome::CANCELLED && recovery.remaining == 3 && recovery.passes == (escalated ? 2 : 1)
                                                                           && recovery.escalated == escalated);

        auto ledger = store.load(reader.identity(), 100, 512);
        success &= check(fmt::format("recovery cancel ledger ({})", mode), ledger && ledger->next_block == 100 && ledger->bad_blocks.size() == 3 && ledger->bad_blocks.contains(10)
                                                                               && ledger->bad_blocks.contains(20) && ledger->bad_blocks.contains(30));

        if(escalated)
        {
            bool restored = reader.persistent_requests.size() == 2 && reader.persistent_requests[0] == std::pair<size_t, bool>(3, true)
                         && reader.persistent_requests[1] == std::pair<size_t, bool>(4, false);
            success &= check("recovery cancel restores drive mode", restored);
        }
        else
            success &= check("recovery cancel before escalation", reader.persistent_requests.empty());
    }

    return success;
}


// scenario: resume ledger refers to image data that is gone
bool test_resume_image()
{
    bool success = true;

    auto dir = test_directory("resume_image");

    bool missing = false;
    try
    {
        ImageArtifact artifact(dir / "missing.img", 512, false);
    }
    catch(const std::runtime_error &)
    {
        missing = true;
    }
    success &= check("resumed image must exist", missing && !std::filesystem::exists(dir / "missing.img"));

    MediumReader reader(16, 512);
    ResumeStore store(dir / "image.resume");
    CancellationFlag token;
    reader.cancel = &token;
    reader.cancel_after = 2;

    {
        Session session(test_config(reader, 4), fresh_ledger(reader), TEST_ATTEMPT, token, &store);
        ImageArtifact artifact(dir / "image.img", 512, true);
        acquire(session, reader, artifact);
    }
    std::filesystem::resize_file(dir / "image.img", 4 * 512);

    token.reset();
    reader.cancel = nullptr;

    auto ledger = store.load(reader.identity(), 16, 512);
    bool shorter = false;
    try
    {
        Session session(test_config(reader, 4), *ledger, TEST_ATTEMPT, token, &store);
        ImageArtifact artifact(dir / "image.img", 512, false);
        acquire(session, reader, artifact);
    }
    catch(const std::runtime_error &)
    {
        shorter = true;
    }
    success &= check("image shorter than the ledger", ledger && ledger->next_block == 8 && shorter && reader.reads == 2);

    return success;
}


// scenario: command line dump, resume and verify of a regular file
bool test_dump_commands()
{
    bool success = true;

    auto dir = test_directory("commands");
    MediumReader medium(16, 512);
    write_vector(dir / "medium.bin", medium.data);

    std::vector<std::string> dump{ "dump", "--drive=" + (dir / "medium.bin").string(), "--image-path=" + dir.string(), "--image-name=x", "--chunk-size=4" };
    std::vector<std::string> verify{ "verify", "--image-path=" + dir.string(), "--image-name=x" };

    success &= check("dump command", run_mediarip(dump) == 0 && read_vector(dir / "x.img") == medium.data);

    // ledger claims acquired blocks the image no longer holds
    ResumeStore store(dir / "x.resume");
    auto ledger = *store.read();
    ledger.next_block = 8;
    ledger.attempts = { AttemptRecord{ "mediarip", "test", "test", { { 0, 8 } } } };
    store.save(ledger);
    std::filesystem::remove(dir / "x.img");

    bool missing = false;
    try
    {
        run_mediarip(dump);
    }
    catch(const std::runtime_error &e)
    {
        missing = std::string(e.what()).find("image file not found") != std::string::npos;
    }
    success &= check("dump resume without image", missing && !std::filesystem::exists(dir / "x.img"));

    // interrupted dump is verified up to the next block, no DAT entry
    write_vector(dir / "x.img", std::vector<uint8_t>(medium.data.begin(), medium.data.begin() + 8 * 512));
    std::filesystem::remove(dir / "x.dat");
    success &= check("verify incomplete dump", run_mediarip(verify) == 0 && !std::filesystem::exists(dir / "x.dat"));

    success &= check("dump command resumed", run_mediarip(dump) == 0 && read_vector(dir / "x.img") == medium.data && store.read()->next_block == 16);

    CRC32 crc;
    crc.update(medium.data.data(), medium.data.size());
    success &= check("verify command", run_mediarip(verify) == 0 && read_text(dir / "x.dat").find(fmt::format("crc=\"{:08x}\"", crc.final())) != std::string::npos);

    return success;
}


bool test_options()
{
    bool success = true;

    std::vector<const char *> argv{ "mediarip", "dump", "--block-size=4096", "--chunk-size=4294967295", "--timeout=100" };
    Options options((int)argv.size(), argv.data());
    success &= check("options parsed", options.command == "dump" && options.block_size && *options.block_size == 4096 && options.chunk_size == 4294967295ULL && options.timeout == 100);

    for(auto o : { "--block-size=4294967808", "--chunk-size=4294967296", "--retries=99999999999", "--timeout=4294967296" })
    {
        bool range = false;
        try
        {
            std::vector<const char *> a{ "mediarip", "dump", o };
            Options out_of_range((int)a.size(), a.data());
        }
        catch(const std::runtime_error &)
        {
            range = true;
        }
        success &= check(fmt::format("option out of range ({})", o), range);
    }

    return success;
}


bool test_stop_on_error()
{
    bool success = true;

    auto dir = test_directory("stop_on_error");
    MediumReader reader(1000, 512);
    reader.bad.insert(100);
    CancellationFlag token;

    auto config = test_config(reader, 64);
    config.stop_on_error = true;

    Session session(config, fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    auto result = acquire(session, reader, artifact);
    success &= check("stop on error is fatal", result.outcome == Outcome::FATAL && !result.message.empty());
    success &= check("stop on error state", session.ledger.next_block == 64 && session.extents.blocks() == 64 && session.ledger.bad_blocks.empty());

    return success;
}


bool test_disconnect()
{
    bool success = true;

    auto dir = test_directory("disconnect");
    MediumReader reader(1000, 512);
    reader.bad.insert(10);
    reader.disconnect_lba = 300;
    CancellationFlag token;

    Session session(test_config(reader, 64), fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    auto result = acquire(session, reader, artifact);
    success &= check("disconnect is fatal", result.outcome == Outcome::FATAL && session.ledger.next_block == 256);

    auto recovery = recover(session, reader, artifact);
    success &= check("disconnect recovery continues below the cut", recovery.outcome == Outcome::COMPLETED && recovery.recovered == 63 && recovery.remaining == 1
                                                                        && recovery.passes == 5);

    reader.bad.clear();
    reader.disconnect_lba = 0;
    recovery = recover(session, reader, artifact);
    success &= check("disconnect during recovery is fatal", recovery.outcome == Outcome::FATAL && recovery.remaining == 1 && reader.single_reads.size() == 64 + 4 + 1);

    return success;
}


bool test_coverage()
{
    bool success = true;

    auto dir = test_directory("coverage");
    MediumReader reader(777, 512);
    reader.bad = { 0, 63, 64, 300, 301, 776 };
    CancellationFlag token;

    Session session(test_config(reader, 50), fresh_ledger(reader), TEST_ATTEMPT, token);
    ImageArtifact artifact(dir / "image.img", 512, true);

    acquire(session, reader, artifact);

    bool partition = true;
    for(uint64_t lba = 0; lba < 777; ++lba)
        if(session.extents.contains(lba) == session.ledger.bad_blocks.contains(lba))
            partition = false;
    success &= check("coverage is a partition of the medium", partition && session.extents.blocks() + session.ledger.bad_blocks.size() == 777);
    success &= check("coverage tail chunk clipped", std::filesystem::file_size(dir / "image.img") == 777 * 512);

    recover(session, reader, artifact);
    partition = true;
    for(uint64_t lba = 0; lba < 777; ++lba)
        if(session.extents.contains(lba) == session.ledger.bad_blocks.contains(lba))
            partition = false;
    success &= check("coverage after recovery", partition && session.ledger.bad_blocks.size() == 6);

    return success;
}


bool test_idempotence()
{
    bool success = true;

    auto dir = test_directory("idempotence");
    MediumReader reader(500, 512);
    ResumeStore store(dir / "image.resume");
    CancellationFlag token;

    {
        Session session(test_config(reader, 64), fresh_ledger(reader), TEST_ATTEMPT, token, &store);
        ImageArtifact artifact(dir / "image.img", 512, true);
        acquire(session, reader, artifact);
    }
    auto image = read_vector(dir / "image.img");
    auto reads = reader.reads;

    auto ledger = store.load(reader.identity(), 500, 512);
    Session session(test_config(reader, 64), *ledger, TEST_ATTEMPT, token, &store);
    ImageArtifact artifact(dir / "image.img", 512, false);
    auto result = acquire(session, reader, artifact);
    artifact.flush();

    success &= check("completed dump is idempotent", result.outcome == Outcome::COMPLETED && reader.reads == reads && read_vector(dir / "image.img") == image
                                                         && session.extents.blocks() == 500);

    bool mismatch = false;
    try
    {
        auto config = test_config(reader, 64);
        config.total_blocks = 400;
        Session other(config, *ledger, TEST_ATTEMPT, token);
    }
    catch(const std::runtime_error &)
    {
        mismatch = true;
    }
    success &= check("session rejects ledger geometry", mismatch);

    return success;
}


bool test_verify()
{
    bool success = true;

    auto dir = test_directory("verify");
    write_vector(dir / "image.img", std::vector<uint8_t>(1200 * 512, 0x5A));

    ImageArtifact artifact(dir / "image.img", 512, false);

    CancellationFlag cancelled;
    cancelled.cancel();
    auto result = verify(artifact, 1200, 512, cancelled);
    success &= check("cancelled verification is partial", !result.complete && !result.digest && result.covered_bytes == 0);

    CancellationFlag token;
    Telemetry telemetry;
    std::vector<uint64_t> windows;
    telemetry.setProgressCallback([&windows](uint64_t lba, uint64_t, double) { windows.push_back(lba); });
    result = verify(artifact, 1200, 512, token, &telemetry);
    success &= check("verification windows", result.complete && result.covered_bytes == 1200 * 512 && windows == std::vector<uint64_t>{ 0, 500, 1000 });

    bool short_artifact = false;
    try
    {
        verify(artifact, 1300, 512, token);
    }
    catch(const std::runtime_error &)
    {
        short_artifact = true;
    }
    success &= check("short image detected", short_artifact);

    return success;
}


bool test_image_artifact()
{
    bool success = true;

    auto dir = test_directory("artifact");
    ImageArtifact artifact(dir / "image.img", 4, true);

    std::vector<uint8_t> block{ 1, 2, 3, 4 };
    artifact.writeBlocks(2, block.data(), 1);
    success &= check("artifact sparse write", artifact.size() == 12);

    artifact.writePartial(0, std::vector<uint8_t>{ 9, 9 }, 1);
    artifact.writePartial(1, std::vector<uint8_t>{ 7, 7, 7, 7, 7, 7 }, 1);

    std::vector<uint8_t> data(16, 0xFF);
    artifact.seek(0);
    auto bytes_read = artifact.read(data.data(), data.size());
    success &= check("artifact partial data padded and clipped", bytes_read == 12 && data == std::vector<uint8_t>{ 9, 9, 0, 0, 7, 7, 7, 7, 1, 2, 3, 4, 0xFF, 0xFF, 0xFF, 0xFF });

    artifact.seek(12);
    artifact.write(block.data(), block.size());
    std::vector<uint8_t> blocks(8, 0xFF);
    success &= check("artifact block read past the end", artifact.readBlocks(3, blocks.data(), 2) == 4 && blocks == std::vector<uint8_t>{ 1, 2, 3, 4, 0, 0, 0, 0 });

    return success;
}


void mbr_entry(std::vector<uint8_t> &data, uint64_t sector, uint32_t index, uint8_t type, uint32_t start, uint32_t sectors)
{
    auto e = &data[sector * 512 + MBR::ENTRIES_OFFSET + index * MBR::ENTRY_SIZE];
    e[4] = type;
    for(uint32_t i = 0; i < 4; ++i)
    {
        e[8 + i] = (uint8_t)(start >> (i * 8));
        e[12 + i] = (uint8_t)(sectors >> (i * 8));
    }

    data[sector * 512 + MBR::SIGNATURE_OFFSET] = 0x55;
    data[sector * 512 + MBR::SIGNATURE_OFFSET + 1] = 0xAA;
}


bool test_mbr()
{
    bool success = true;

    MediumReader reader(20000, 512);
    std::fill(reader.data.begin(), reader.data.end(), 0);

    mbr_entry(reader.data, 0, 0, 0x83, 2048, 4096);
    mbr_entry(reader.data, 0, 1, 0x0F, 8192, 8192);
    // EBR chain
    mbr_entry(reader.data, 8192, 0, 0x07, 63, 1000);
    mbr_entry(reader.data, 8192, 1, 0x05, 2048, 600);
    mbr_entry(reader.data, 8192 + 2048, 0, 0x0B, 63, 500);

    auto partitions = PartitionRegistry::defaults().getPartitions(reader);

    std::vector<Partition> expected = {
        { 2048,  4096, 0, "MBR", "Linux"        },
        { 8255,  1000, 1, "MBR", "NTFS / exFAT" },
        { 10303, 500,  2, "MBR", "FAT32"        }
    };
    success &= check("MBR partitions", partitions == expected);

    MediumReader blank(100, 512);
    std::fill(blank.data.begin(), blank.data.end(), 0);
    success &= check("no partition table", PartitionRegistry::defaults().getPartitions(blank).empty());

    return success;
}


int main(int argc, char *argv[])
{
    int success = 0;

    // keep engine log output out of the test report
    Logger::get().console(false);

    success |= (int)!test_crc();
    std::cout << std::endl;
    success |= (int)!test_hash();
    std::cout << std::endl;
    success |= (int)!test_extent_set();
    std::cout << std::endl;
    success |= (int)!test_bad_blocks();
    std::cout << std::endl;
    success |= (int)!test_ledger();
    std::cout << std::endl;
    success |= (int)!test_telemetry();
    std::cout << std::endl;
    success |= (int)!test_clean_dump();
    std::cout << std::endl;
    success |= (int)!test_transient_error();
    std::cout << std::endl;
    success |= (int)!test_cancel_resume();
    std::cout << std::endl;
    success |= (int)!test_escalation();
    std::cout << std::endl;
    success |= (int)!test_escalation_unavailable();
    std::cout << std::endl;
    success |= (int)!test_retry_direction();
    std::cout << std::endl;
    success |= (int)!test_recovery_cancel();
    std::cout << std::endl;
    success |= (int)!test_resume_image();
    std::cout << std::endl;
    success |= (int)!test_stop_on_error();
    std::cout << std::endl;
    success |= (int)!test_disconnect();
    std::cout << std::endl;
    success |= (int)!test_coverage();
    std::cout << std::endl;
    success |= (int)!test_idempotence();
    std::cout << std::endl;
    success |= (int)!test_image_artifact();
    std::cout << std::endl;
    success |= (int)!test_verify();
    std::cout << std::endl;
    success |= (int)!test_mbr();
    std::cout << std::endl;
    success |= (int)!test_options();
    std::cout << std::endl;
    success |= (int)!test_dump_commands();
    std::cout << std::endl;

    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "mediarip_tests");

    return success;
}
