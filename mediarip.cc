#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <list>
#include <map>
#include <sys/utsname.h>
#include "dump/acquire.hh"
#include "dump/recovery.hh"
#include "dump/verify.hh"
#include "image/image_artifact.hh"
#include "partitions/registry.hh"
#include "readers/file_block_reader.hh"
#include "utils/animation.hh"
#include "utils/logger.hh"
#include "utils/misc.hh"
#include "utils/signal.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "version.hh"
#include "mediarip.hh"



namespace mediarip
{

const std::map<std::string, RetryOrder> RETRY_ORDER_STRING = {
    { "alternate", RetryOrder::ALTERNATE },
    { "forward",   RetryOrder::FORWARD   },
    { "reverse",   RetryOrder::REVERSE   }
};


RetryOrder string_to_retry_order(const std::string &value)
{
    auto it = RETRY_ORDER_STRING.find(str_lowercase(value));
    if(it == RETRY_ORDER_STRING.end())
        throw_line("unknown retry order ({})", value);

    return it->second;
}


std::string image_prefix(const Options &options)
{
    return (std::filesystem::path(options.image_path) / options.image_name).string();
}


std::filesystem::path image_file(const Options &options)
{
    return image_prefix(options) + ".img";
}


std::filesystem::path resume_file(const Options &options)
{
    return options.resume_file.empty() ? std::filesystem::path(image_prefix(options) + ".resume") : std::filesystem::path(options.resume_file);
}


void image_check_overwrite(const Options &options)
{
    if(!options.overwrite && std::filesystem::exists(image_file(options)))
        throw_line("dump already exists (image name: {})", options.image_name);
}


AttemptInfo attempt_info()
{
    AttemptInfo attempt{ "mediarip", mediarip_version_build(), "unknown" };

    struct utsname u;
    if(!uname(&u))
        attempt.os = fmt::format("{} {} {}", u.sysname, u.release, u.machine);

    return attempt;
}


void progress_output(uint64_t lba, uint64_t lba_end, double speed, uint64_t errors)
{
    char animation = lba == lba_end ? '*' : spinner_animation();

    LOGC_RF("{} [{:3}%] LBA: {}/{}, speed: {:.2f} MiB/s, errors: {}", animation, lba * 100 / lba_end, extend_left(std::to_string(lba), ' ', digits_count(lba_end)), lba_end,
        speed, errors);
}


Session &session_open(Context &ctx, const Options &options, bool resume)
{
    if(ctx.session)
        return *ctx.session;

    SessionConfig config;
    config.block_size = ctx.reader->blockSize();
    config.total_blocks = options.blocks ? *options.blocks : ctx.reader->blocksCount();
    config.chunk_size = (uint32_t)options.chunk_size;
    config.max_retry_passes = (uint32_t)options.retries;
    config.persistent_recovery = options.persistent;
    config.stop_on_error = options.stop_on_error;
    config.retry_order = string_to_retry_order(options.retry_order);
    config.verbose = options.verbose;

    if(options.blocks && *options.blocks > ctx.reader->blocksCount())
        LOG("warning: requested blocks count exceeds device capacity ({} > {})", *options.blocks, ctx.reader->blocksCount());

    auto identity = ctx.reader->identity();

    ResumeLedger ledger;
    if(resume)
    {
        auto l = ctx.store->load(identity, config.total_blocks, config.block_size);
        if(l)
        {
            ledger = *l;
            LOG("resume ledger: {} (attempts: {}, next LBA: {}, bad blocks: {})", ctx.store->path().filename().string(), ledger.attempts.size(), ledger.next_block,
                ledger.bad_blocks.size());
        }
        else
            ledger.identity = identity;
    }
    else
        ledger.identity = identity;

    ctx.session = std::make_unique<Session>(config, ledger, attempt_info(), *ctx.token, ctx.store.get());

    auto s = ctx.session.get();
    s->telemetry.setProgressCallback([s](uint64_t lba, uint64_t total, double speed) { progress_output(lba, total, speed, s->ledger.bad_blocks.size()); });

    return *s;
}


void speed_output(const Telemetry &telemetry)
{
    if(telemetry.valid())
        LOG("speed: {:.2f} MiB/s (min: {:.2f}, max: {:.2f})", telemetry.averageSpeed(), telemetry.minSpeed(), telemetry.maxSpeed());
}


int phase_exit_code(Outcome outcome, const std::string &message)
{
    if(outcome == Outcome::FATAL)
        throw_line("{}", message);

    return outcome == Outcome::CANCELLED ? 1 : 0;
}


int mediarip_dump(Context &ctx, Options &options)
{
    bool resume = ctx.store->exists() && !options.overwrite;
    if(!resume)
    {
        image_check_overwrite(options);
        if(ctx.store->exists())
            ctx.store->remove();
    }

    auto &session = session_open(ctx, options, resume);

    LOG("geometry: {} blocks x {} bytes", session.config.total_blocks, session.config.block_size);

    // nothing acquired yet, a leftover image can be recreated
    ImageArtifact artifact(image_file(options), session.config.block_size, !resume || !session.ledger.next_block);
    image_check_ledger(session, artifact);

    if(session.ledger.next_block == session.config.total_blocks)
    {
        LOG("dump is complete, nothing to do");
        ctx.refine = !session.ledger.bad_blocks.empty();
        return 0;
    }

    auto result = acquire(session, *ctx.reader, artifact);
    LOG("");

    LOG("media errors: {}", session.ledger.bad_blocks.size());
    speed_output(session.telemetry);

    ctx.refine = !session.ledger.bad_blocks.empty();

    return phase_exit_code(result.outcome, result.message);
}


int mediarip_refine(Context &ctx, Options &options)
{
    if(ctx.refine && !*ctx.refine)
        return 0;

    if(!ctx.store->exists())
        throw_line("resume ledger not found, nothing to refine ({})", ctx.store->path().filename().string());
    if(!std::filesystem::exists(image_file(options)))
        throw_line("image file not found ({})", image_file(options).filename().string());

    auto &session = session_open(ctx, options, true);
    if(session.ledger.bad_blocks.empty())
    {
        LOG("no bad blocks to refine");
        return 0;
    }

    ImageArtifact artifact(image_file(options), session.config.block_size, false);

    auto result = recover(session, *ctx.reader, artifact);
    LOG("");

    LOG("recovered: {}, remaining: {}, passes: {}{}", result.recovered, result.remaining, result.passes, result.escalated ? " (persistent)" : "");
    if(result.remaining)
        LOG("bad blocks: {}", ranges_to_string(session.ledger.bad_blocks.toRanges()));
    ctx.refine = result.remaining != 0;

    return phase_exit_code(result.outcome, result.message);
}


int mediarip_verify(Context &ctx, Options &options)
{
    auto image_path = image_file(options);
    if(!std::filesystem::exists(image_path))
        throw_line("image file not found ({})", image_path.filename().string());

    uint32_t block_size = options.block_size ? (uint32_t)*options.block_size : 512;
    uint64_t total_blocks = std::filesystem::file_size(image_path) / block_size;
    bool partial = false;
    if(auto ledger = ctx.store->read())
    {
        block_size = ledger->block_size;
        total_blocks = ledger->total_blocks;

        // interrupted dump, only the acquired prefix is in the image
        if(ledger->next_block < ledger->total_blocks)
        {
            LOG("warning: dump is incomplete (next LBA: {}, blocks: {}), hashing acquired blocks only", ledger->next_block, ledger->total_blocks);
            total_blocks = ledger->next_block;
            partial = true;
        }
        else if(!ledger->bad_blocks.empty())
            LOG("warning: image has bad blocks, hashes won't match the medium");
    }

    if(!block_size || !total_blocks)
        throw_line("image is empty ({})", image_path.filename().string());

    Telemetry telemetry;
    telemetry.setProgressCallback([](uint64_t lba, uint64_t total, double speed) { progress_output(lba, total, speed, 0); });

    ImageArtifact artifact(image_path, block_size, false);
    auto result = verify(artifact, total_blocks, block_size, *ctx.token, &telemetry);
    if(result.complete)
        telemetry.progress(total_blocks, total_blocks);
    LOG("");

    if(!result.complete)
    {
        LOG("warning: verification incomplete ({} of {} bytes hashed)", result.covered_bytes, total_blocks * block_size);
        return 1;
    }

    auto dat_line = result.digest->xmlLine(image_path.filename().string());

    LOG("dat{}:", partial ? fmt::format(" (first {} blocks)", total_blocks) : "");
    LOG("{}", dat_line);
    speed_output(telemetry);

    // prefix hashes don't describe the medium
    if(partial)
        return 0;

    std::ofstream ofs(image_prefix(options) + ".dat");
    if(ofs.fail())
        throw_line("unable to create file ({}.dat)", options.image_name);
    ofs << dat_line << std::endl;

    return 0;
}


int mediarip_info(Context &ctx, Options &options)
{
    auto ledger = ctx.store->read();
    if(!ledger)
    {
        LOG("warning: resume ledger not found, coverage unknown");
    }
    else
    {
        auto const &identity = ledger->identity;
        LOG("device: {} {} (serial: {}, platform: {})", identity.manufacturer, identity.model, identity.serial, identity.platform);
        LOG("geometry: {} blocks x {} bytes", ledger->total_blocks, ledger->block_size);

        ExtentSet extents;
        for(auto const &a : ledger->attempts)
        {
            uint64_t blocks = 0;
            for(auto const &e : a.extents)
            {
                extents.add(e.first, e.second - e.first);
                blocks += e.second - e.first;
            }
            LOG("attempt: {} {} [{}], blocks: {}", a.software, a.version, a.os, blocks);
        }

        LOG("acquired: {}/{}, bad: {}, unread: {}", extents.blocks(), ledger->total_blocks, ledger->bad_blocks.size(), ledger->total_blocks - ledger->next_block);
        if(!ledger->bad_blocks.empty())
            LOG("bad blocks: {}", ranges_to_string(ledger->bad_blocks.toRanges()));
    }

    auto image_path = image_file(options);
    if(std::filesystem::exists(image_path))
    {
        // partition detection is informational, failures are not fatal
        try
        {
            FileBlockReader image_reader(image_path, ledger ? ledger->block_size : (options.block_size ? (uint32_t)*options.block_size : 0));

            auto partitions = PartitionRegistry::defaults().getPartitions(image_reader);
            if(!partitions.empty())
            {
                LOG("");
                LOG("partitions:");
                for(auto const &p : partitions)
                    LOG("  {}: {} [LBA: {} .. {}, type: {}]", p.sequence, p.scheme, p.start, p.start + p.length - 1, p.type);
            }
        }
        catch(const std::exception &e)
        {
            LOG("warning: partition detection failed ({})", e.what());
        }
    }

    return 0;
}


struct Command
{
    using Handler = int (*)(Context &, Options &);

    bool drive_required;
    bool image_name_generate;
    Handler handler;
};


const std::map<std::string, Command> COMMANDS{
  // NAME       DRIVE  GENERATE HANDLER
    { "dump",   { true, true, mediarip_dump }     },
    { "refine", { true, false, mediarip_refine }  },
    { "verify", { false, false, mediarip_verify } },
    { "info",   { false, false, mediarip_info }   },
};


std::string generate_image_name(std::string drive)
{
    auto pos = drive.find_last_of('/');
    std::string d(drive, pos == std::string::npos ? 0 : pos + 1);

    return fmt::format("dump_{}_{}", system_date_time("%y%m%d_%H%M%S"), d);
}


int mediarip(Options &options)
{
    std::list<std::pair<std::string, Command>> commands;
    Command aggregate = {};

    if(options.command.empty() || options.command == "rip")
    {
        for(auto const &name : { "dump", "refine", "verify", "info" })
        {
            auto it = COMMANDS.find(name);
            commands.emplace_back(it->first, it->second);
            aggregate.drive_required = aggregate.drive_required || it->second.drive_required;
            aggregate.image_name_generate = aggregate.image_name_generate || it->second.image_name_generate;
        }
    }
    else
    {
        auto it = COMMANDS.find(options.command);
        if(it == COMMANDS.end())
            throw_line("unknown command (command: {})", options.command);

        commands.emplace_back(it->first, it->second);
        aggregate = it->second;
    }

    if(options.chunk_size == 0)
        throw_line("chunk size must be non-zero");
    string_to_retry_order(options.retry_order);

    Context ctx;

    if(aggregate.drive_required && options.drive.empty())
        throw_line("drive is not provided");

    if(options.image_name.empty())
    {
        if(aggregate.image_name_generate)
            options.image_name = generate_image_name(options.drive);
        else
            throw_line("image name is not provided");
    }

    // init log file early not to miss any messages
    Logger::get().reset(image_prefix(options) + ".log");

    LOG("{}", mediarip_version());

    if(!options.arguments.empty())
    {
        LOG("");
        LOG("arguments: {}", options.arguments);
    }

    if(aggregate.drive_required)
    {
        ctx.reader = std::make_shared<FileBlockReader>(options.drive, options.block_size ? (uint32_t)*options.block_size : 0, (uint32_t)options.timeout);

        auto identity = ctx.reader->identity();
        LOG("");
        LOG("drive path: {}", options.drive);
        LOG("drive: {} - {} (serial: {})", identity.manufacturer.empty() ? "<unknown>" : identity.manufacturer, identity.model, identity.serial.empty() ? "<none>" : identity.serial);
        LOG("drive capacity: {} blocks x {} bytes", ctx.reader->blocksCount(), ctx.reader->blockSize());
    }

    LOG("");
    LOG("image path: {}", options.image_path.empty() ? "." : options.image_path);
    LOG("image name: {}", options.image_name);

    ctx.store = std::make_unique<ResumeStore>(resume_file(options));

    SignalINT signal;
    ctx.token = &signal;

    int exit_code = 0;

    std::chrono::seconds time_check = std::chrono::seconds::zero();
    for(auto const &c : commands)
    {
        LOG("");
        LOG("*** {}{}", str_uppercase(c.first), time_check == std::chrono::seconds::zero() ? "" : fmt::format(" (time check: {}s)", time_check.count()));
        LOG("");

        auto time_start = std::chrono::high_resolution_clock::now();
        exit_code = c.second.handler(ctx, options);
        auto time_stop = std::chrono::high_resolution_clock::now();
        time_check = std::chrono::duration_cast<std::chrono::seconds>(time_stop - time_start);

        if(exit_code)
            break;
    }
    LOG("");
    LOG("*** END{}", time_check == std::chrono::seconds::zero() ? "" : fmt::format(" (time check: {}s)", time_check.count()));

    // state is saved, let the interrupt terminate the process
    if(signal.interrupt())
        signal.raiseDefault();

    return exit_code;
}

}
