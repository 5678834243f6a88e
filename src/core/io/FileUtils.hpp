#ifndef FILEUTILS_HPP_
#define FILEUTILS_HPP_

#include "IntTypes.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace Shrimpy {

// Paths are plain '/'-separated strings; backslashes are normalized on the way in
class FileUtils
{
    FileUtils() {}

public:
    static std::string normalizeSeparators(std::string path);
    static std::string fileName(const std::string &path);
    static std::string parentPath(const std::string &path);
    static bool isAbsolute(const std::string &path);
    static std::string resolve(const std::string &base, const std::string &path);

    static bool isFile(const std::string &path);
    static std::string loadText(const std::string &path);
    static bool writeBinary(const std::string &path, const std::vector<uint8> &data);

    template<typename T>
    static inline void streamWrite(std::ostream &out, const T *src, size_t numElements)
    {
        out.write(reinterpret_cast<const char *>(src), numElements*sizeof(T));
    }
};

}

#endif /* FILEUTILS_HPP_ */
