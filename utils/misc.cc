#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "misc.hh"



namespace mediarip
{

std::string system_date_time(std::string fmt)
{
    auto time_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    ss << std::put_time(localtime(&time_now), fmt.c_str());
    return ss.str();
}

}
