#ifndef MATHUTIL_HPP_
#define MATHUTIL_HPP_

#include "Vec.hpp"

#include <cmath>

namespace Shrimpy {

template<typename T>
T min(const T &a, const T &b)
{
    return a < b ? a : b;
}

template<typename T>
T max(const T &a, const T &b)
{
    return a > b ? a : b;
}

template<typename T>
T clamp(T val, T minVal, T maxVal)
{
    return min(max(val, minVal), maxVal);
}

// Componentwise. A NaN component of b never replaces the one in a
template<typename ElementType, unsigned Size>
Vec<ElementType, Size> min(const Vec<ElementType, Size> &a, const Vec<ElementType, Size> &b)
{
    Vec<ElementType, Size> result(a);
    for (unsigned i = 0; i < Size; ++i)
        if (b[i] < a[i])
            result[i] = b[i];
    return result;
}

template<typename ElementType, unsigned Size>
Vec<ElementType, Size> max(const Vec<ElementType, Size> &a, const Vec<ElementType, Size> &b)
{
    Vec<ElementType, Size> result(a);
    for (unsigned i = 0; i < Size; ++i)
        if (b[i] > a[i])
            result[i] = b[i];
    return result;
}

template<typename ElementType, unsigned Size>
bool isnan(const Vec<ElementType, Size> &t)
{
    for (unsigned i = 0; i < Size; ++i)
        if (std::isnan(t[i]))
            return true;
    return false;
}

}

#endif /* MATHUTIL_HPP_ */
