#pragma once



#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>



namespace mediarip
{

class Logger
{
public:
    static Logger &get();

    template<typename... Args>
    void log(bool file, std::string fmt, const Args &...args)
    {
        auto message = fmt::vformat(fmt, fmt::make_format_args(args...));

        if(_console)
            std::cout << message;

        if(file && _fs.is_open())
            _fs << message;
    }

    bool reset(std::filesystem::path log_path);
    void console(bool enable);

    void NL(bool file = true);
    void flush(bool file);
    void returnLine(bool erase);

private:
    static Logger _logger;

    std::filesystem::path _log_path;
    std::fstream _fs;
    bool _console = true;
};


// log message followed by a new line (console & file)
template<typename... Args>
void LOG(std::string fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.log(true, fmt, args...);
    logger.NL(true);
}


// erase current console line, log message followed by a new line (console & file)
template<typename... Args>
void LOG_R(std::string fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.returnLine(true);
    logger.log(true, fmt, args...);
    logger.NL(true);
}


// return line and log message, no new line (console only)
template<typename... Args>
void LOGC_RF(std::string fmt, const Args &...args)
{
    auto &logger = Logger::get();
    logger.returnLine(false);
    logger.log(false, fmt, args...);
    logger.flush(false);
}

}
