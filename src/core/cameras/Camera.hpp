#ifndef CAMERA_HPP_
#define CAMERA_HPP_

#include "math/Vec.hpp"

#include "io/JsonPtr.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

// Thin lens camera as consumed by the shader. The basis vectors right() and
// up() are derived from the view direction and the world up axis whenever
// they are needed and never stored
class Camera
{
    Vec3f _pos;
    Vec3f _dir;
    float _fov;
    float _width;
    float _focusDistance;
    float _aperture;
    float _divergeStrength;
    uint32 _maxRayBounces;

public:
    static const Vec3f WorldUp;

    Camera();

    void fromJson(JsonPtr value);

    Vec3f right() const;
    Vec3f up() const;

    // Translation along direction, right and up respectively
    void dolly(float amount);
    void strafe(float amount);
    void pedestal(float amount);

    // Approximate rotations: nudge the direction towards right/up and
    // renormalize. Larger amounts rotate by less than atan(amount)
    void pan(float amount);
    void tilt(float amount);

    // Exact rotations in radians about the world up axis and about right()
    void yaw(float angle);
    void pitch(float angle);

    void lookAt(const Vec3f &target);

    std::vector<uint8> serialize() const;

    const Vec3f &pos() const
    {
        return _pos;
    }

    const Vec3f &dir() const
    {
        return _dir;
    }

    float fov() const
    {
        return _fov;
    }

    float width() const
    {
        return _width;
    }

    float focusDistance() const
    {
        return _focusDistance;
    }

    float aperture() const
    {
        return _aperture;
    }

    float divergeStrength() const
    {
        return _divergeStrength;
    }

    uint32 maxRayBounces() const
    {
        return _maxRayBounces;
    }

    void setPos(const Vec3f &pos)
    {
        _pos = pos;
    }

    void setDir(const Vec3f &dir);

    void setFov(float fov)
    {
        _fov = fov;
    }

    void setWidth(float width)
    {
        _width = width;
    }

    void setFocusDistance(float focusDistance)
    {
        _focusDistance = focusDistance;
    }

    void setAperture(float aperture)
    {
        _aperture = aperture;
    }

    void setDivergeStrength(float divergeStrength)
    {
        _divergeStrength = divergeStrength;
    }

    void setMaxRayBounces(uint32 maxRayBounces)
    {
        _maxRayBounces = maxRayBounces;
    }
};

}

#endif /* CAMERA_HPP_ */
