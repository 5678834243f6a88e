#include "GpuWriter.hpp"

#include "Debug.hpp"

#include <cstring>

namespace Shrimpy {

void GpuWriter::writeU32(uint32 value)
{
    for (int i = 0; i < 4; ++i)
        _dst.push_back(uint8((value >> (i*8)) & 0xFF));
}

void GpuWriter::writeF32(float value)
{
    uint32 bits;
    std::memcpy(&bits, &value, sizeof(float));
    writeU32(bits);
}

void GpuWriter::writeVec3(const Vec3f &v)
{
    writeF32(v.x());
    writeF32(v.y());
    writeF32(v.z());
}

void GpuWriter::pad(size_t numBytes)
{
    _dst.insert(_dst.end(), numBytes, uint8(0));
}

void GpuWriter::padTo(size_t offset)
{
    ASSERT(offset >= _dst.size(), "Cannot pad to offset %d, already at %d", offset, _dst.size());
    pad(offset - _dst.size());
}

uint32 GpuReader::readU32(size_t offset) const
{
    size_t at = _base + offset;
    if (at + 4 > _src.size())
        FAIL("Read of 4 bytes at offset %d exceeds buffer of size %d", at, _src.size());

    uint32 result = 0;
    for (int i = 0; i < 4; ++i)
        result |= uint32(_src[at + i]) << (i*8);
    return result;
}

float GpuReader::readF32(size_t offset) const
{
    uint32 bits = readU32(offset);
    float result;
    std::memcpy(&result, &bits, sizeof(float));
    return result;
}

Vec3f GpuReader::readVec3(size_t offset) const
{
    return Vec3f(readF32(offset), readF32(offset + 4), readF32(offset + 8));
}

}
