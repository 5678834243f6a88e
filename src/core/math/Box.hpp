#ifndef MATH_BOX_HPP_
#define MATH_BOX_HPP_

#include "MathUtil.hpp"
#include "Vec.hpp"

#include <limits>

namespace Shrimpy {

// Axis-aligned box. Default constructed boxes are empty (min > max) so the
// first grow() snaps them to the point or box added
template<typename ElementType, unsigned Size>
class Box {
    typedef Vec<ElementType, Size> TVec;

    TVec _min;
    TVec _max;

public:
    Box()
    : _min(std::numeric_limits<ElementType>::max()),
      _max(std::numeric_limits<ElementType>::lowest())
    {
    }

    Box(const TVec &min, const TVec &max)
    : _min(min), _max(max)
    {
    }

    const TVec &min() const { return _min; }
    const TVec &max() const { return _max; }
    TVec &min() { return _min; }
    TVec &max() { return _max; }

    // Negative along every axis for an empty box
    TVec extent() const
    {
        return _max - _min;
    }

    void grow(const TVec &p)
    {
        _min = Shrimpy::min(_min, p);
        _max = Shrimpy::max(_max, p);
    }

    void grow(const Box &box)
    {
        _min = Shrimpy::min(_min, box._min);
        _max = Shrimpy::max(_max, box._max);
    }

    // Widens every axis thinner than minExtent by padding on both sides
    void inflateThinAxes(ElementType minExtent, ElementType padding)
    {
        for (unsigned i = 0; i < Size; ++i) {
            if (_max[i] - _min[i] < minExtent) {
                _min[i] -= padding;
                _max[i] += padding;
            }
        }
    }

    bool contains(const Box &box) const
    {
        for (unsigned i = 0; i < Size; ++i)
            if (box._min[i] < _min[i] || box._max[i] > _max[i])
                return false;
        return true;
    }

    bool operator==(const Box &o) const
    {
        return _min == o._min && _max == o._max;
    }

    bool operator!=(const Box &o) const
    {
        return !(*this == o);
    }

    friend std::ostream &operator<<(std::ostream &stream, const Box &box)
    {
        return stream << '(' << box._min << " - " << box._max << ')';
    }
};

typedef Box<float, 3> Box3f;

}

#endif // MATH_BOX_HPP_
