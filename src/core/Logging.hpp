#ifndef LOGGING_HPP_
#define LOGGING_HPP_

#include <string>

namespace Shrimpy {

void printTimestampedLog(const std::string &s);
void printWarning(const std::string &s);

}

#endif /* LOGGING_HPP_ */
