#ifndef VEC_HPP_
#define VEC_HPP_

#include "IntTypes.hpp"

#include <type_traits>
#include <ostream>
#include <array>
#include <cmath>

namespace Shrimpy {

// Fixed-size vector used for positions, directions and resolutions. Stays a
// POD so primitives and BVH nodes embedding it can be copied as raw memory
template<typename ElementType, unsigned Size>
class Vec {
    std::array<ElementType, Size> _v;

    template<typename Op>
    Vec map(Op op) const
    {
        Vec result;
        for (unsigned i = 0; i < Size; ++i)
            result._v[i] = op(_v[i], i);
        return result;
    }

public:
    Vec() = default;

    explicit Vec(const ElementType &a)
    {
        _v.fill(a);
    }

    template<typename... Ts>
    Vec(const ElementType &a, const ElementType &b, const Ts &... ts)
    : _v({{a, b, ts...}})
    {
        static_assert(sizeof...(Ts) + 2 == Size, "Wrong number of vector components");
    }

    ElementType x() const { return _v[0]; }
    ElementType y() const { return _v[1]; }
    ElementType z() const
    {
        static_assert(Size > 2, "Vector does not have z coordinate");
        return _v[2];
    }

    ElementType &operator[](unsigned i)
    {
        return _v[i];
    }

    const ElementType &operator[](unsigned i) const
    {
        return _v[i];
    }

    ElementType dot(const Vec &o) const
    {
        ElementType result = ElementType(0);
        for (unsigned i = 0; i < Size; ++i)
            result += _v[i]*o._v[i];
        return result;
    }

    ElementType lengthSq() const
    {
        return dot(*this);
    }

    ElementType length() const
    {
        return std::sqrt(lengthSq());
    }

    // NaN for the zero vector
    Vec normalized() const
    {
        return *this/length();
    }

    Vec cross(const Vec &o) const
    {
        static_assert(Size == 3, "Cross product only defined in three dimensions!");
        return Vec(
            _v[1]*o._v[2] - _v[2]*o._v[1],
            _v[2]*o._v[0] - _v[0]*o._v[2],
            _v[0]*o._v[1] - _v[1]*o._v[0]
        );
    }

    // Index of the largest component. Ties resolve to the lower index
    uint32 maxDim() const
    {
        uint32 best = 0;
        for (unsigned i = 1; i < Size; ++i)
            if (_v[i] > _v[best])
                best = i;
        return best;
    }

    Vec operator-() const
    {
        return map([](ElementType a, unsigned) { return -a; });
    }

    Vec operator+(const Vec &o) const
    {
        return map([&](ElementType a, unsigned i) { return a + o._v[i]; });
    }

    Vec operator-(const Vec &o) const
    {
        return map([&](ElementType a, unsigned i) { return a - o._v[i]; });
    }

    Vec operator+(ElementType s) const
    {
        return map([=](ElementType a, unsigned) { return a + s; });
    }

    Vec operator-(ElementType s) const
    {
        return map([=](ElementType a, unsigned) { return a - s; });
    }

    Vec operator*(ElementType s) const
    {
        return map([=](ElementType a, unsigned) { return a*s; });
    }

    Vec operator/(ElementType s) const
    {
        return map([=](ElementType a, unsigned) { return a/s; });
    }

    Vec &operator+=(const Vec &o)
    {
        return *this = *this + o;
    }

    bool operator==(const Vec &o) const
    {
        return _v == o._v;
    }

    bool operator!=(const Vec &o) const
    {
        return !(*this == o);
    }

    friend std::ostream &operator<<(std::ostream &stream, const Vec &v)
    {
        stream << '(' << v._v[0];
        for (unsigned i = 1; i < Size; ++i)
            stream << ',' << v._v[i];
        return stream << ')';
    }
};

typedef Vec<float, 3> Vec3f;
typedef Vec<float, 2> Vec2f;
typedef Vec<uint32, 2> Vec2u;

#ifndef _MSC_VER
static_assert(std::is_pod<Vec3f>::value, "Vec3f is not a pod!");
static_assert(std::is_pod<Vec2u>::value, "Vec2u is not a pod!");
#endif

}

#endif /* VEC_HPP_ */
