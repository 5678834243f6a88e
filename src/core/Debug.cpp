#include "Debug.hpp"

#include <iostream>

namespace Shrimpy {

namespace DebugUtils {

static bool s_quiet = false;

void debugLog(const std::string &message)
{
    std::cout << "DEBUG | " << message << std::endl;
}

void setQuiet(bool quiet)
{
    s_quiet = quiet;
}

bool quiet()
{
    return s_quiet;
}

}

}
