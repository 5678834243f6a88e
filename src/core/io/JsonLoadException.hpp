#ifndef JSONLOADEXCEPTION_HPP_
#define JSONLOADEXCEPTION_HPP_

#include <stdexcept>
#include <string>

namespace Shrimpy {

// A scene file that can't be read, parsed or interpreted. what() carries the
// description followed by the source excerpt, if there is one
class JsonLoadException : public std::runtime_error
{
    std::string _description;
    std::string _excerpt;

public:
    static JsonLoadException unreadable(const std::string &path);

    JsonLoadException(const std::string &description, const std::string &excerpt);

    bool haveExcerpt() const { return !_excerpt.empty(); }
    const std::string &description() const { return _description; }
    const std::string &excerpt() const { return _excerpt; }
};

}

#endif /* JSONLOADEXCEPTION_HPP_ */
