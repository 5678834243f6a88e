#include "FileUtils.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace Shrimpy {

std::string FileUtils::normalizeSeparators(std::string path)
{
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

std::string FileUtils::fileName(const std::string &path)
{
    std::string p = normalizeSeparators(path);
    std::string::size_type pos = p.find_last_of('/');
    if (pos == std::string::npos)
        return p;
    return p.substr(pos + 1);
}

std::string FileUtils::parentPath(const std::string &path)
{
    std::string p = normalizeSeparators(path);
    std::string::size_type pos = p.find_last_of('/');
    if (pos == std::string::npos)
        return std::string();
    if (pos == 0)
        return "/";
    return p.substr(0, pos);
}

bool FileUtils::isAbsolute(const std::string &path)
{
    if (path.empty())
        return false;
    if (path[0] == '/' || path[0] == '\\')
        return true;
    // Drive letter
    return path.size() > 1 && path[1] == ':';
}

std::string FileUtils::resolve(const std::string &base, const std::string &path)
{
    if (base.empty() || isAbsolute(path))
        return normalizeSeparators(path);
    std::string b = normalizeSeparators(base);
    if (b.back() != '/')
        b += '/';
    return b + normalizeSeparators(path);
}

bool FileUtils::isFile(const std::string &path)
{
    struct stat info;
    if (stat(path.c_str(), &info) != 0)
        return false;
    return S_ISREG(info.st_mode);
}

std::string FileUtils::loadText(const std::string &path)
{
    if (!isFile(path))
        return std::string();
    std::ifstream in(path, std::ios_base::in | std::ios_base::binary);
    if (!in.good())
        return std::string();

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    // Strip UTF-8 byte order mark if present (mostly a problem on
    // windows platforms)
    if (text.size() >= 3 && uint8(text[0]) == 0xEF && uint8(text[1]) == 0xBB && uint8(text[2]) == 0xBF)
        text.erase(0, 3);

    return text;
}

bool FileUtils::writeBinary(const std::string &path, const std::vector<uint8> &data)
{
    std::ofstream out(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
    if (!out.good())
        return false;
    streamWrite(out, data.data(), data.size());
    out.close();
    return !out.fail();
}

}
