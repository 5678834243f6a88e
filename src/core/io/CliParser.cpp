#include "CliParser.hpp"

#include "Debug.hpp"

#include "math/MathUtil.hpp"

#include "IntTypes.hpp"

#include <sstream>

namespace Shrimpy {

CliParser::CliParser(const std::string &programName, const std::string &usage)
: _programName(programName),
  _usage(usage)
{
}

void CliParser::printHelpText(std::ostream &out, int maxWidth) const
{
    size_t nameWidth = 0;
    for (const Option &o : _options)
        nameWidth = max(nameWidth, o.longName.size() + (o.takesParam ? 4 : 0));
    const int indent = int(nameWidth) + 10;
    const int textWidth = max(maxWidth - indent, 20);

    out << "Usage: " << _programName << " " << _usage << "\nOptions:\n";
    for (const Option &o : _options) {
        std::string name = "--" + o.longName + (o.takesParam ? "=ARG" : "");
        out << (o.shortName ? tfm::format(" -%c  ", o.shortName) : std::string(5, ' '))
            << name << std::string(indent - 5 - int(name.size()), ' ');

        std::istringstream words(o.description);
        std::string word;
        int column = 0;
        while (words >> word) {
            if (column > 0 && column + 1 + int(word.size()) > textWidth) {
                out << '\n' << std::string(indent, ' ');
                column = 0;
            }
            if (column > 0) {
                out << ' ';
                column++;
            }
            out << word;
            column += int(word.size());
        }
        out << '\n';
    }
    out.flush();
}

void CliParser::addOption(char shortName, const std::string &longName,
        const std::string &description, bool takesParam, int token)
{
    for (const Option &o : _options) {
        if (o.token == token)
            FAIL("Duplicate option token %d", token);
        if (shortName && o.shortName == shortName)
            FAIL("Duplicate short option -%c", shortName);
        if (!longName.empty() && o.longName == longName)
            FAIL("Duplicate long option --%s", longName);
    }
    _options.push_back(Option{shortName, longName, description, takesParam, token, false, ""});
}

const CliParser::Option &CliParser::byToken(int token) const
{
    for (const Option &o : _options)
        if (o.token == token)
            return o;
    FAIL("No option registered for token %d", token);
}

CliParser::Option &CliParser::byShortName(char c)
{
    for (Option &o : _options)
        if (o.shortName && o.shortName == c)
            return o;
    fail("Unrecognized command line option -%c", c);
}

CliParser::Option &CliParser::byLongName(const std::string &name)
{
    for (Option &o : _options)
        if (o.longName == name)
            return o;
    fail("Unrecognized command line option --%s", name);
}

void CliParser::consume(Option &opt, const std::string &spelling, bool hasInlineParam,
        const std::string &inlineParam, const std::vector<std::string> &args, size_t &i)
{
    if (opt.present)
        fail("Duplicate command line option %s", spelling);
    if (!opt.takesParam) {
        if (hasInlineParam)
            fail("Command line option %s does not take a parameter", spelling);
    } else if (hasInlineParam) {
        opt.param = inlineParam;
    } else if (i + 1 < args.size()) {
        opt.param = args[++i];
    } else {
        fail("Missing parameter for command line option %s", spelling);
    }
    opt.present = true;
}

void CliParser::parse(int argc, const char *argv[])
{
    parse(std::vector<std::string>(argv + min(argc, 1), argv + argc));
}

void CliParser::parse(const std::vector<std::string> &args)
{
    bool optionsEnded = false;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
            _operands.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        size_t eq = arg.find('=');
        bool hasInlineParam = eq != std::string::npos;
        std::string inlineParam = hasInlineParam ? arg.substr(eq + 1) : std::string();
        if (hasInlineParam)
            arg.erase(eq);

        if (arg[1] == '-') {
            consume(byLongName(arg.substr(2)), arg, hasInlineParam, inlineParam, args, i);
            continue;
        }

        // Grouped short options: only the last one of a group may take a parameter
        for (size_t j = 1; j < arg.size(); ++j) {
            Option &opt = byShortName(arg[j]);
            bool last = j + 1 == arg.size();
            if (opt.takesParam && !last)
                fail("Missing parameter for command line option -%c", arg[j]);
            consume(opt, std::string("-") + arg[j], last && hasInlineParam, inlineParam, args, i);
        }
    }
}

bool CliParser::isPresent(int token) const
{
    return byToken(token).present;
}

const std::string &CliParser::param(int token) const
{
    return byToken(token).param;
}

unsigned CliParser::intParam(int token) const
{
    const Option &opt = byToken(token);
    uint64 value = 0;
    bool valid = !opt.param.empty() && opt.param.size() <= 10;
    for (char c : opt.param) {
        if (c < '0' || c > '9') {
            valid = false;
            break;
        }
        value = value*10 + uint64(c - '0');
    }
    if (!valid || value > 0xFFFFFFFFull)
        fail("Invalid numeric parameter '%s' for option --%s", opt.param, opt.longName);
    return unsigned(value);
}

}
