#include <limits>
#include <utility>
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "options.hh"



namespace mediarip
{

Options::Options(int argc, const char *argv[])
    : help(false)
    , version(false)
    , verbose(false)
    , overwrite(false)
    , chunk_size(64)
    , retries(5)
    , persistent(false)
    , stop_on_error(false)
    , retry_order("alternate")
    , timeout(0)
{
    for(int i = 1; i < argc; ++i)
    {
        std::string argument(argv[i]);
        arguments += (argument.find(' ') == std::string::npos ? argument : "\"" + argument + "\"") + " ";
    }
    if(!arguments.empty())
        arguments.pop_back();

    std::string *s_value = nullptr;
    uint64_t *i_value = nullptr;
    for(int i = 1; i < argc; ++i)
    {
        std::string o(argv[i]);

        // option
        if(o[0] == '-')
        {
            std::string key;
            auto value_pos = o.find("=");
            if(value_pos == std::string::npos)
            {
                key = o;
                o.clear();
            }
            else
            {
                key = std::string(o, 0, value_pos);
                o = std::string(o, value_pos + 1);
            }

            if(s_value == nullptr && i_value == nullptr)
            {
                if(key == "--help" || key == "-h")
                    help = true;
                else if(key == "--version")
                    version = true;
                else if(key == "--verbose")
                    verbose = true;
                else if(key == "--image-path")
                    s_value = &image_path;
                else if(key == "--image-name")
                    s_value = &image_name;
                else if(key == "--overwrite")
                    overwrite = true;
                else if(key == "--drive")
                    s_value = &drive;
                else if(key == "--block-size")
                {
                    block_size = std::make_unique<uint64_t>();
                    i_value = block_size.get();
                }
                else if(key == "--blocks")
                {
                    blocks = std::make_unique<uint64_t>();
                    i_value = blocks.get();
                }
                else if(key == "--chunk-size")
                    i_value = &chunk_size;
                else if(key == "--retries")
                    i_value = &retries;
                else if(key == "--persistent")
                    persistent = true;
                else if(key == "--stop-on-error")
                    stop_on_error = true;
                else if(key == "--retry-order")
                    s_value = &retry_order;
                else if(key == "--resume-file")
                    s_value = &resume_file;
                else if(key == "--timeout")
                    i_value = &timeout;
                // unknown option
                else
                {
                    throw_line("unknown option ({})", key);
                }
            }
            else
                throw_line("option value expected ({})", argv[i - 1]);
        }

        if(!o.empty())
        {
            if(s_value != nullptr)
            {
                *s_value = o;
                s_value = nullptr;
            }
            else if(i_value != nullptr)
            {
                *i_value = str_to_uint(o);
                i_value = nullptr;
            }
            else
            {
                if(command.empty())
                    command = o;
                else
                    throw_line("command already provided ({})", command);
            }
        }
    }

    if(s_value != nullptr || i_value != nullptr)
        throw_line("option value expected ({})", argv[argc - 1]);

    // 32-bit values
    const std::pair<const char *, const uint64_t *> limited[] = {
        { "--block-size", block_size.get() },
        { "--chunk-size", &chunk_size      },
        { "--retries",    &retries         },
        { "--timeout",    &timeout         }
    };
    for(auto const &o : limited)
        if(o.second != nullptr && *o.second > std::numeric_limits<uint32_t>::max())
            throw_line("option value is out of range ({}={})", o.first, *o.second);
}


void Options::printUsage()
{
    LOG("usage: mediarip [command] [options]");
    LOG("");

    LOG("COMMANDS:");
    LOG("\trip           \taggregate mode that does everything (default)");
    LOG("\tdump          \tdumps the device to an image file, resumes if a resume ledger exists");
    LOG("\trefine        \trefines the image by re-reading blocks that failed");
    LOG("\tverify        \tcomputes image hashes and outputs XML DAT entry");
    LOG("\tinfo          \toutputs image coverage and partition information");
    LOG("");

    LOG("OPTIONS:");
    LOG("\t(general)");
    LOG("\t--help,-h                       \tprint usage");
    LOG("\t--version                       \tprint version");
    LOG("\t--verbose                       \tverbose output");
    LOG("\t--drive=VALUE                   \tblock device or file to dump");
    LOG("\t--image-path=VALUE              \tdump files base directory");
    LOG("\t--image-name=VALUE              \tdump files prefix, autogenerated in dump mode if not provided");
    LOG("\t--overwrite                     \toverwrites previously generated dump files");
    LOG("");
    LOG("\t(geometry)");
    LOG("\t--block-size=VALUE              \tlogical block size in bytes, queried from the device if not provided");
    LOG("\t--blocks=VALUE                  \tnumber of blocks to dump, queried from the device if not provided");
    LOG("");
    LOG("\t(dump)");
    LOG("\t--chunk-size=VALUE              \tnumber of blocks per read (default: {})", chunk_size);
    LOG("\t--stop-on-error                 \tstop dumping on the first read error");
    LOG("\t--timeout=VALUE                 \tread timeout in milliseconds, a read that returns later is a failure, a hung read is not interrupted (default: none)");
    LOG("\t--resume-file=VALUE             \tresume ledger path (default: image prefix + .resume)");
    LOG("");
    LOG("\t(refine)");
    LOG("\t--retries=VALUE                 \tnumber of retry passes over failed blocks (default: {})", retries);
    LOG("\t--retry-order=VALUE             \tretry pass direction, possible values: alternate, forward, reverse (default: {})", retry_order);
    LOG("\t--persistent                    \tenable drive persistent recovery mode once retry passes are exhausted");
}

}
