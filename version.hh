#pragma once



#include <string>



#define XSTRINGIFY(arg__) STRINGIFY(arg__)
#define STRINGIFY(arg__) #arg__

#ifndef MEDIARIP_VERSION_BUILD
#define MEDIARIP_VERSION_BUILD LOCAL
#endif



namespace mediarip
{

inline std::string mediarip_version_build()
{
    return XSTRINGIFY(MEDIARIP_VERSION_BUILD);
}


inline std::string mediarip_version()
{
    return "mediarip (build: " + mediarip_version_build() + ")";
}

}
