#ifndef DEBUG_HPP_
#define DEBUG_HPP_

#include "Platform.hpp"

#include <tinyformat/tinyformat.hpp>
#include <stdexcept>
#include <string>

namespace Shrimpy {

namespace DebugUtils {

void debugLog(const std::string &message);

// Silences DBG output, e.g. for loaders that are expected to skip lines
void setQuiet(bool quiet);
bool quiet();

template<typename... Ts>
NORETURN void fail(const char *file, int line, const char *fmt, const Ts &... ts)
{
    throw std::runtime_error(tfm::format("PROGRAM FAILURE in %s:%d: ", file, line) + tfm::format(fmt, ts...));
}

template<typename... Ts>
NORETURN void assertionFailure(const char *file, int line, const char *expression,
        const char *fmt, const Ts &... ts)
{
    throw std::runtime_error(tfm::format("ASSERTION FAILURE in %s:%d (%s): ", file, line, expression)
            + tfm::format(fmt, ts...));
}

template<typename... Ts>
void debug(const char *file, int line, const char *fmt, const Ts &... ts)
{
    if (!quiet())
        debugLog(tfm::format("%s:%d: ", file, line) + tfm::format(fmt, ts...));
}

}

#define FAIL(...) ::Shrimpy::DebugUtils::fail(__FILE__, __LINE__, __VA_ARGS__)
#define DBG(...) ::Shrimpy::DebugUtils::debug(__FILE__, __LINE__, __VA_ARGS__)
#define ASSERT(EXP, ...) do { \
    if (!bool(EXP)) \
        ::Shrimpy::DebugUtils::assertionFailure(__FILE__, __LINE__, #EXP, __VA_ARGS__); \
    } while (false)

}

#endif /* DEBUG_HPP_ */
