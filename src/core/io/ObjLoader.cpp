#include "ObjLoader.hpp"

#include "Debug.hpp"

#include <tinyformat/tinyformat.hpp>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <cerrno>

namespace Shrimpy {

// <cctype> only accepts values representable as unsigned char
static inline bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static inline bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static inline int toLower(char c)
{
    return std::tolower(static_cast<unsigned char>(c));
}

ObjLoader::ObjLoader(std::istream &in, const std::string &name, uint32 materialId, std::vector<Triangle> &tris)
: _uvCount(0),
  _materialId(materialId),
  _tris(tris),
  _name(name),
  _lineNumber(0)
{
    std::string strLine;
    while (std::getline(in, strLine)) {
        _lineNumber++;
        const char *line = strLine.c_str();
        if (_lineNumber == 1 && strLine.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line += 3;
        loadLine(line);
    }
}

template<unsigned Size>
bool ObjLoader::loadVector(const char *s, Vec<float, Size> &dst)
{
    for (unsigned i = 0; i < Size; ++i) {
        skipWhitespace(s);
        char *end;
        errno = 0;
        dst[i] = std::strtof(s, &end);
        if (end == s || errno == ERANGE)
            return false;
        s = end;
        if (*s != '\0' && !isSpace(*s))
            return false;
    }
    return true;
}

// Reads one face corner (v, v/t, v/t/n or v//n) and resolves its position
// index. Negative indices count backwards from the last vertex
bool ObjLoader::resolveIndex(const char *&s, uint32 &dst)
{
    char *end;
    long index = std::strtol(s, &end, 10);
    if (end == s || index == 0)
        return false;
    s = end;

    while (*s == '/' || isDigit(*s) || *s == '-')
        s++;
    if (*s != '\0' && !isSpace(*s))
        return false;

    long size = long(_pos.size());
    if (index < 0)
        index += size;
    else
        index -= 1;
    if (index < 0 || index >= size)
        return false;

    dst = uint32(index);
    return true;
}

void ObjLoader::skipWhitespace(const char *&s)
{
    while (isSpace(*s))
        s++;
}

bool ObjLoader::hasPrefix(const char *s, const char *pre)
{
    do {
        if (toLower(*pre) != toLower(*s))
            return false;
    } while (*++s && *++pre);
    return *pre == '\0' && (isSpace(*s) || *s == '\0');
}

void ObjLoader::skipLine(const char *reason)
{
    DBG("%s:%d: %s, skipping line", _name, _lineNumber, reason);
}

void ObjLoader::loadVertex(const char *line)
{
    Vec3f p;
    if (loadVector(line, p))
        _pos.push_back(p);
    else
        skipLine("Malformed vertex");
}

void ObjLoader::loadUv(const char *line)
{
    Vec2f uv;
    if (loadVector(line, uv))
        _uvCount++;
    else
        skipLine("Malformed texture coordinate");
}

void ObjLoader::loadFace(const char *line)
{
    std::vector<uint32> corners;
    skipWhitespace(line);
    while (*line) {
        uint32 index;
        if (!resolveIndex(line, index)) {
            skipLine("Invalid face index");
            return;
        }
        corners.push_back(index);
        skipWhitespace(line);
    }

    if (corners.size() < 3) {
        skipLine("Face with fewer than three vertices");
        return;
    }

    for (size_t i = 2; i < corners.size(); ++i)
        _tris.emplace_back(_pos[corners[0]], _pos[corners[i - 1]], _pos[corners[i]], _materialId);
}

void ObjLoader::loadLine(const char *line)
{
    skipWhitespace(line);
    if (hasPrefix(line, "v"))
        loadVertex(line + 1);
    else if (hasPrefix(line, "vt"))
        loadUv(line + 2);
    else if (hasPrefix(line, "f"))
        loadFace(line + 1);
}

bool ObjLoader::loadTriangles(const std::string &path, uint32 materialId, std::vector<Triangle> &tris)
{
    std::ifstream in(path, std::ios_base::in | std::ios_base::binary);
    if (!in.good()) {
        DBG("Unable to open file at '%s'", path);
        return false;
    }

    size_t previousSize = tris.size();
    ObjLoader loader(in, path, materialId, tris);
    DBG("Loaded %d vertices, %d texture coordinates and %d triangles from '%s'",
            loader._pos.size(), loader._uvCount, tris.size() - previousSize, path);
    return true;
}

void ObjLoader::loadTriangles(std::istream &in, uint32 materialId, std::vector<Triangle> &tris)
{
    ObjLoader loader(in, "<stream>", materialId, tris);
}

}
