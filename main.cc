#include <exception>
#include "mediarip.hh"
#include "options.hh"
#include "utils/logger.hh"
#include "version.hh"



using namespace mediarip;



int main(int argc, char *argv[])
{
    int exit_code = 0;

    try
    {
        Options options(argc, const_cast<const char **>(argv));

        if(options.help)
            options.printUsage();
        else if(options.version)
            LOG("{}", mediarip_version());
        else
            exit_code = mediarip::mediarip(options);
    }
    catch(const std::exception &e)
    {
        LOG("error: {}", e.what());
        exit_code = -1;
    }
    catch(...)
    {
        LOG("error: unhandled exception");
        exit_code = -2;
    }

    return exit_code;
}
