#ifndef STRINGABLEENUM_HPP_
#define STRINGABLEENUM_HPP_

#include "io/JsonPtr.hpp"

#include "Debug.hpp"

#include <tinyformat/tinyformat.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace Shrimpy {

// Enum wrapper that converts to and from the names used in scene files. Each
// instantiation provides its name table through DEFINE_STRINGABLE_ENUM
template<typename Enum>
class StringableEnum
{
public:
    struct Entry
    {
        const char *name;
        Enum value;
    };

private:
    Enum _t;

    static const char *typeName();
    static const std::vector<Entry> &entries();

    static const Entry *byName(const std::string &name)
    {
        for (const Entry &e : entries())
            if (name == e.name)
                return &e;
        return nullptr;
    }

    static std::string unknownName(const std::string &name)
    {
        return tfm::format("Unknown %s name: \"%s\". Available options are: %s",
                typeName(), name, availableNames());
    }

public:
    StringableEnum(Enum t) : _t(t) {}

    explicit StringableEnum(JsonPtr value)
    {
        std::string name = value.cast<std::string>();
        const Entry *e = byName(name);
        if (!e)
            value.parseError(unknownName(name));
        _t = e->value;
    }

    explicit StringableEnum(const std::string &name)
    {
        const Entry *e = byName(name);
        if (!e)
            throw std::runtime_error(unknownName(name));
        _t = e->value;
    }

    static std::string availableNames()
    {
        std::string result;
        for (const Entry &e : entries())
            result += (result.empty() ? "" : ", ") + std::string(e.name);
        return result;
    }

    const char *toString() const
    {
        for (const Entry &e : entries())
            if (e.value == _t)
                return e.name;
        FAIL("%s %d has no name", typeName(), int(_t));
    }

    operator Enum() const { return _t; }
};

#define DEFINE_STRINGABLE_ENUM(TYPE, NAME, ...)                        \
    template<> const char *TYPE::typeName() { return NAME; }          \
    template<> const std::vector<TYPE::Entry> &TYPE::entries()        \
    {                                                                 \
        static const std::vector<TYPE::Entry> table __VA_ARGS__;      \
        return table;                                                 \
    }

}

#endif /* STRINGABLEENUM_HPP_ */
