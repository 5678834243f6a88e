#include "Logging.hpp"

#include <tinyformat/tinyformat.hpp>

#include <iostream>
#include <string>
#include <ctime>

namespace Shrimpy {

static std::string timestamp()
{
    std::time_t t = std::time(NULL);
    char mbstr[100];
    std::strftime(mbstr, sizeof(mbstr), "[%H:%M:%S] ", std::localtime(&t));
    return mbstr;
}

void printTimestampedLog(const std::string &s)
{
    std::cout << timestamp() << s << '\n';
    std::cout.flush();
}

void printWarning(const std::string &s)
{
    std::cerr << tfm::format("%sWARNING: %s", timestamp(), s) << std::endl;
}

}
