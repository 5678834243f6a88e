#ifndef OBJLOADER_HPP_
#define OBJLOADER_HPP_

#include "primitives/Triangle.hpp"

#include "math/Vec.hpp"

#include "IntTypes.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace Shrimpy {

// Minimal Wavefront OBJ reader that only extracts triangle positions.
// Malformed lines are skipped; only an unreadable file counts as failure
class ObjLoader
{
    std::vector<Vec3f> _pos;
    uint32 _uvCount;
    uint32 _materialId;
    std::vector<Triangle> &_tris;
    std::string _name;
    int _lineNumber;

    template<unsigned Size>
    bool loadVector(const char *s, Vec<float, Size> &dst);
    bool resolveIndex(const char *&s, uint32 &dst);

    void skipWhitespace(const char *&s);
    bool hasPrefix(const char *s, const char *pre);

    void loadVertex(const char *line);
    void loadUv(const char *line);
    void loadFace(const char *line);
    void loadLine(const char *line);

    void skipLine(const char *reason);

    ObjLoader(std::istream &in, const std::string &name, uint32 materialId, std::vector<Triangle> &tris);

public:
    // Appends the triangles of the file to tris. Returns false if the file
    // could not be opened
    static bool loadTriangles(const std::string &path, uint32 materialId, std::vector<Triangle> &tris);
    static void loadTriangles(std::istream &in, uint32 materialId, std::vector<Triangle> &tris);
};

}

#endif /* OBJLOADER_HPP_ */
