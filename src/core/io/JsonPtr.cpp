#include "JsonPtr.hpp"

#include "JsonLoadException.hpp"
#include "JsonDocument.hpp"

#include <limits>

namespace Shrimpy {

void JsonPtr::get(float &dst) const
{
    if (!_value || !_value->IsNumber())
        parseError("Parameter has wrong type: Expecting a number here");
    dst = float(_value->GetDouble());
}

void JsonPtr::get(uint32 &dst) const
{
    if (!_value || !_value->IsNumber())
        parseError("Parameter has wrong type: Expecting a number here");
    if (_value->IsUint()) {
        dst = _value->GetUint();
        return;
    }
    double d = _value->GetDouble();
    if (d < 0.0 || d > double(std::numeric_limits<uint32>::max()))
        parseError(tfm::format("Expecting a non-negative integer here, received %s", d));
    dst = uint32(d);
}

void JsonPtr::get(std::string &dst) const
{
    dst = cast<const char *>();
}

void JsonPtr::get(const char *&dst) const
{
    if (!isString())
        parseError("Parameter has wrong type: Expecting a string value here");
    dst = _value->GetString();
}

JsonPtr JsonPtr::getRequiredMember(const char *field) const
{
    if (!isObject())
        parseError("Type mismatch: Expecting a JSON object here");
    JsonPtr result = (*this)[field];
    if (!result)
        parseError(tfm::format("Object is missing required field \"%s\"", field));
    return result;
}

void JsonPtr::parseError(std::string description) const
{
    if (!_document)
        throw JsonLoadException(description, "");
    _document->parseError(*this, std::move(description));
}

}
