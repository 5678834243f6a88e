#ifndef JSONDOCUMENT_HPP_
#define JSONDOCUMENT_HPP_

#include "JsonPtr.hpp"

#include "Platform.hpp"

#include <rapidjson/document.h>
#include <string>

namespace Shrimpy {

// Parsed scene file that keeps its source text around, so errors found while
// interpreting values can quote the offending line
class JsonDocument : public JsonPtr
{
    std::string _file;
    rapidjson::Document _document;
    std::string _json;

    void parse();
    bool sourceOffset(const rapidjson::Value *value, size_t &offset) const;

public:
    explicit JsonDocument(const std::string &file);
    JsonDocument(const std::string &file, std::string json);

    JsonDocument(const JsonDocument &) = delete;
    JsonDocument &operator=(const JsonDocument &) = delete;

    NORETURN void parseError(JsonPtr source, std::string description) const;

    const std::string &file() const
    {
        return _file;
    }
};

}

#endif /* JSONDOCUMENT_HPP_ */
