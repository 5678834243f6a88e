#ifndef QUATERNION_HPP_
#define QUATERNION_HPP_

#include "Vec.hpp"

#include <cmath>

namespace Shrimpy {

// Unit quaternion, split into its scalar part w and vector part v
template<typename Type>
class Quaternion
{
    typedef Vec<Type, 3> Vec3;

    Type _w;
    Vec3 _v;

public:
    // Rotation by theta radians about the unit axis u
    Quaternion(Type theta, const Vec3 &u)
    : _w(std::cos(theta*Type(0.5))),
      _v(u*std::sin(theta*Type(0.5)))
    {
    }

    // q*p*q^-1, expanded so no intermediate quaternions are formed
    Vec3 operator*(const Vec3 &p) const
    {
        Vec3 t = _v.cross(p)*Type(2);
        return p + t*_w + _v.cross(t);
    }
};

typedef Quaternion<float> QuaternionF;

}

#endif /* QUATERNION_HPP_ */
