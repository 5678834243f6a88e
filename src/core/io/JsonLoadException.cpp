#include "JsonLoadException.hpp"

#include <tinyformat/tinyformat.hpp>

namespace Shrimpy {

JsonLoadException JsonLoadException::unreadable(const std::string &path)
{
    return JsonLoadException(tfm::format("Unable to load scene file '%s'", path), "");
}

JsonLoadException::JsonLoadException(const std::string &description, const std::string &excerpt)
: std::runtime_error(excerpt.empty() ? description : description + "\n\n" + excerpt),
  _description(description),
  _excerpt(excerpt)
{
}

}
