#ifndef CLIPARSER_HPP_
#define CLIPARSER_HPP_

#include "Platform.hpp"

#include <tinyformat/tinyformat.hpp>
#include <stdexcept>
#include <ostream>
#include <vector>
#include <string>

namespace Shrimpy {

class CliParseException : public std::runtime_error
{
public:
    explicit CliParseException(const std::string &message)
    : std::runtime_error(message)
    {
    }
};

// getopt-style parser: short options can be grouped (-bv), long options
// take their parameter either as --opt=value or as the next argument, and
// everything after "--" is treated as an operand. Options are identified by
// caller-chosen integer tokens
class CliParser
{
    struct Option
    {
        char shortName;
        std::string longName;
        std::string description;
        bool takesParam;
        int token;

        bool present;
        std::string param;
    };

    std::string _programName;
    std::string _usage;
    std::vector<Option> _options;
    std::vector<std::string> _operands;

    const Option &byToken(int token) const;
    Option &byShortName(char c);
    Option &byLongName(const std::string &name);

    // Marks opt as present. The parameter comes from "=value" if the argument
    // had one, otherwise from the next argument
    void consume(Option &opt, const std::string &spelling, bool hasInlineParam,
            const std::string &inlineParam, const std::vector<std::string> &args, size_t &i);

    template<typename... Ts>
    NORETURN void fail(const char *fmt, const Ts &... ts) const
    {
        throw CliParseException(_programName + ": " + tfm::format(fmt, ts...));
    }

public:
    CliParser(const std::string &programName, const std::string &usage = "[options] [operands]");

    void printHelpText(std::ostream &out, int maxWidth = 80) const;

    void addOption(char shortName, const std::string &longName,
            const std::string &description, bool takesParam, int token);

    void parse(int argc, const char *argv[]);
    // args excludes the program name
    void parse(const std::vector<std::string> &args);

    bool isPresent(int token) const;
    const std::string &param(int token) const;
    // Parameter as a non-negative 32 bit integer; fails on anything else
    unsigned intParam(int token) const;

    const std::vector<std::string> &operands() const
    {
        return _operands;
    }
};

}

#endif /* CLIPARSER_HPP_ */
