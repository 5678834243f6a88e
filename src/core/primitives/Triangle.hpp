#ifndef TRIANGLE_HPP_
#define TRIANGLE_HPP_

#include "math/Box.hpp"
#include "math/Vec.hpp"

#include "IntTypes.hpp"

#include <type_traits>

namespace Shrimpy {

struct Triangle
{
    Vec3f v0, v1, v2;
    uint32 materialId;

    Triangle() = default;

    Triangle(const Vec3f &v0_, const Vec3f &v1_, const Vec3f &v2_, uint32 materialId_ = 0)
    : v0(v0_), v1(v1_), v2(v2_), materialId(materialId_)
    {
    }

    const Vec3f &vertex(int i) const
    {
        return i == 0 ? v0 : (i == 1 ? v1 : v2);
    }

    // Tight box through the three vertices, not inflated
    Box3f bounds() const
    {
        Box3f result(v0, v0);
        result.grow(v1);
        result.grow(v2);
        return result;
    }

    // Unweighted vertex mean. Only used as a sort key by the BVH builder
    Vec3f centroid() const
    {
        return (v0 + v1 + v2)/3.0f;
    }
};

#ifndef _MSC_VER
static_assert(std::is_pod<Triangle>::value, "Triangle needs to be of POD type!");
#endif

}

#endif /* TRIANGLE_HPP_ */
