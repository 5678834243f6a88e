#ifndef GPUWRITER_HPP_
#define GPUWRITER_HPP_

#include "math/Vec.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

// Appends little endian scalars to a byte buffer independent of host byte order
class GpuWriter
{
    std::vector<uint8> &_dst;

public:
    explicit GpuWriter(std::vector<uint8> &dst)
    : _dst(dst)
    {
    }

    void writeU32(uint32 value);
    void writeF32(float value);
    void writeVec3(const Vec3f &v);
    void pad(size_t numBytes);
    void padTo(size_t offset);

    size_t offset() const
    {
        return _dst.size();
    }
};

class GpuReader
{
    const std::vector<uint8> &_src;
    size_t _base;

public:
    GpuReader(const std::vector<uint8> &src, size_t base = 0)
    : _src(src),
      _base(base)
    {
    }

    uint32 readU32(size_t offset) const;
    float readF32(size_t offset) const;
    Vec3f readVec3(size_t offset) const;

    GpuReader at(size_t offset) const
    {
        return GpuReader(_src, _base + offset);
    }

    size_t size() const
    {
        return _src.size();
    }
};

}

#endif /* GPUWRITER_HPP_ */
