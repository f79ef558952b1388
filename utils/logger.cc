#include "utils/misc.hh"
#include "utils/throw_line.hh"
#include "logger.hh"



namespace mediarip
{

Logger Logger::_logger;


Logger &Logger::get()
{
    return _logger;
}


bool Logger::reset(std::filesystem::path log_path)
{
    bool reset = false;
    if(_log_path != log_path)
    {
        _log_path = log_path;
        if(_fs.is_open())
            _fs.close();

        if(!_log_path.empty())
        {
            auto pp = log_path.parent_path();
            if(!pp.empty())
                std::filesystem::create_directories(pp);

            bool nl = std::filesystem::exists(log_path);

            _fs.open(log_path, std::fstream::out | std::fstream::app);
            if(_fs.fail())
                throw_line("unable to open file ({})", log_path.filename().string());

            if(nl)
                _fs << std::endl;

            auto dt = system_date_time(" %F %T ");
            _fs << fmt::format("{}{}{}", std::string(3, '='), dt, std::string(80 - 3 - dt.length(), '=')) << std::endl;
        }

        reset = true;
    }

    return reset;
}


void Logger::console(bool enable)
{
    _console = enable;
}


void Logger::NL(bool file)
{
    if(_console)
        std::cout << std::endl;
    if(file && _fs.is_open())
        _fs << std::endl;
}


void Logger::flush(bool file)
{
    if(_console)
        std::cout << std::flush;
    if(file && _fs.is_open())
        _fs << std::flush;
}


void Logger::returnLine(bool erase)
{
    if(!_console)
        return;

    // default 80 terminal width - 1 is the largest value which doesn't wrap to a new line on Windows 7
    if(erase)
        std::cout << fmt::format("\r{:79}", "");
    std::cout << '\r';
}

}
