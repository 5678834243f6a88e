#include "JsonDocument.hpp"

#include "JsonLoadException.hpp"
#include "FileUtils.hpp"

#include "math/MathUtil.hpp"

#include <tinyformat/tinyformat.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace Shrimpy {

static CONSTEXPR unsigned ParseFlags = rapidjson::kParseCommentsFlag | rapidjson::kParseTrailingCommasFlag;

// Records one source offset per key or value, in the order the reader reports
// them. Compounds point at their opening bracket, scalars at their last
// character
class OffsetRecorder : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, OffsetRecorder>
{
    const rapidjson::StringStream &_stream;

public:
    std::vector<size_t> offsets;

    explicit OffsetRecorder(const rapidjson::StringStream &stream)
    : _stream(stream)
    {
    }

    bool Default()
    {
        offsets.push_back(_stream.Tell() - 1);
        return true;
    }

    bool EndObject(rapidjson::SizeType) { return true; }
    bool EndArray(rapidjson::SizeType) { return true; }
};

// Number of keys and values preceding target in document order
static bool documentOrderIndex(const rapidjson::Value &v, const rapidjson::Value *target, size_t &index)
{
    if (&v == target)
        return true;
    index++;
    if (v.IsObject()) {
        for (auto m = v.MemberBegin(); m != v.MemberEnd(); ++m)
            if (documentOrderIndex(m->name, target, index) || documentOrderIndex(m->value, target, index))
                return true;
    } else if (v.IsArray()) {
        for (auto e = v.Begin(); e != v.End(); ++e)
            if (documentOrderIndex(*e, target, index))
                return true;
    }
    return false;
}

struct SourceLocation
{
    int row, col;
    std::string excerpt;
};

// The line containing offset with a marker underneath. Lines longer than 90
// characters are cropped to 80 around the offset
static SourceLocation locate(const std::string &json, size_t offset)
{
    const int MaxLineLength = 90;
    const int CropLength = 80;

    offset = min(offset, json.size());
    size_t newline = offset == 0 ? std::string::npos : json.rfind('\n', offset - 1);
    size_t lineStart = newline == std::string::npos ? 0 : newline + 1;
    size_t lineEnd = json.find('\n', lineStart);
    if (lineEnd == std::string::npos)
        lineEnd = json.size();
    while (lineEnd > lineStart && std::iscntrl(static_cast<unsigned char>(json[lineEnd - 1])))
        lineEnd--;

    SourceLocation result;
    result.row = 1 + int(std::count(json.begin(), json.begin() + lineStart, '\n'));
    result.col = 1 + int(offset - lineStart);

    int length = int(lineEnd - lineStart);
    int col = result.col - 1;
    int left = 0, right = length;
    if (length > MaxLineLength) {
        right = min(col + CropLength/2, length);
        left = max(right - CropLength, 0);
        right = min(left + CropLength, length);
    }

    std::string line = json.substr(lineStart + left, right - left);
    int markerCol = col - left;
    if (left > 0) {
        line = "..." + line;
        markerCol += 3;
    }
    if (right < length)
        line += "...";
    result.excerpt = tfm::format("%s\n%s^", line, std::string(max(markerCol, 0), '-'));
    return result;
}

JsonDocument::JsonDocument(const std::string &file)
: JsonPtr(this, &_document),
  _file(file),
  _json(FileUtils::loadText(file))
{
    if (_json.empty())
        throw JsonLoadException::unreadable(file);
    parse();
}

JsonDocument::JsonDocument(const std::string &file, std::string json)
: JsonPtr(this, &_document),
  _file(file),
  _json(std::move(json))
{
    parse();
}

void JsonDocument::parse()
{
    _document.Parse<ParseFlags>(_json.c_str());
    if (!_document.HasParseError())
        return;

    SourceLocation where = locate(_json, _document.GetErrorOffset());
    throw JsonLoadException(tfm::format("Encountered a syntax error at %s:%d:%d:\n    %s",
            FileUtils::fileName(_file), where.row, where.col,
            rapidjson::GetParseError_En(_document.GetParseError())), where.excerpt);
}

bool JsonDocument::sourceOffset(const rapidjson::Value *value, size_t &offset) const
{
    rapidjson::StringStream stream(_json.c_str());
    OffsetRecorder recorder(stream);
    rapidjson::Reader reader;
    if (reader.Parse<ParseFlags>(stream, recorder).IsError())
        return false;

    size_t index = 0;
    if (!value || !documentOrderIndex(_document, value, index) || index >= recorder.offsets.size())
        return false;
    offset = recorder.offsets[index];
    return true;
}

void JsonDocument::parseError(JsonPtr source, std::string description) const
{
    size_t offset;
    if (!sourceOffset(source._value, offset))
        throw JsonLoadException(tfm::format("Encountered an error at %s:\n    %s",
                FileUtils::fileName(_file), description), "");

    SourceLocation where = locate(_json, offset);
    throw JsonLoadException(tfm::format("Encountered an error at %s:%d:%d:\n    %s",
            FileUtils::fileName(_file), where.row, where.col, description), where.excerpt);
}

}
