#ifndef SPHERE_HPP_
#define SPHERE_HPP_

#include "math/Box.hpp"
#include "math/Vec.hpp"

#include "IntTypes.hpp"

#include <type_traits>

namespace Shrimpy {

// Spheres are intersected exhaustively by the shader and never enter the BVH
struct Sphere
{
    Vec3f center;
    float radius;
    uint32 materialId;

    Sphere() = default;

    Sphere(const Vec3f &center_, float radius_, uint32 materialId_ = 0)
    : center(center_), radius(radius_), materialId(materialId_)
    {
    }

    Box3f bounds() const
    {
        return Box3f(center - radius, center + radius);
    }

    static Sphere unitSphere()
    {
        return Sphere(Vec3f(0.0f), 1.0f, 0);
    }
};

#ifndef _MSC_VER
static_assert(std::is_pod<Sphere>::value, "Sphere needs to be of POD type!");
#endif

}

#endif /* SPHERE_HPP_ */
