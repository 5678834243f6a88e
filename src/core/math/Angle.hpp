#ifndef ANGLE_HPP_
#define ANGLE_HPP_

#include "Platform.hpp"

namespace Shrimpy {

CONSTEXPR float PI      = 3.1415926536f;
CONSTEXPR float PI_HALF = PI*0.5f;

// Cameras store radians, scene files and tool output use degrees
namespace Angle {

inline CONSTEXPR float degToRad(float deg)
{
    return deg*(PI/180.0f);
}

inline CONSTEXPR float radToDeg(float rad)
{
    return rad*(180.0f/PI);
}

}

}

#endif /* ANGLE_HPP_ */
