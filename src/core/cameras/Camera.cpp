#include "Camera.hpp"

#include "math/Quaternion.hpp"
#include "math/Angle.hpp"

#include "gpu/GpuPacker.hpp"

#include "Debug.hpp"

#include <cmath>

namespace Shrimpy {

const Vec3f Camera::WorldUp = Vec3f(0.0f, 1.0f, 0.0f);

Camera::Camera()
: _pos(0.0f),
  _dir(0.0f, 0.0f, -1.0f),
  _fov(Angle::degToRad(75.0f)),
  _width(1.0f),
  _focusDistance(2.0f),
  _aperture(0.02f),
  _divergeStrength(0.004f),
  _maxRayBounces(50)
{
}

void Camera::fromJson(JsonPtr value)
{
    value.getField("position", _pos);
    if (auto dir = value["direction"]) {
        Vec3f d = dir.cast<Vec3f>();
        if (d.lengthSq() == 0.0f)
            dir.parseError("Camera direction must not be the zero vector");
        setDir(d);
    }
    if (auto target = value["look_at"]) {
        Vec3f t = target.cast<Vec3f>();
        if (t == _pos)
            target.parseError("Camera look_at target coincides with the camera position");
        lookAt(t);
    }

    float fovDeg;
    if (value.getField("fov", fovDeg))
        _fov = Angle::degToRad(fovDeg);

    value.getField("width", _width);
    value.getField("focus_distance", _focusDistance);
    value.getField("aperture", _aperture);
    value.getField("diverge_strength", _divergeStrength);
    value.getField("max_bounces", _maxRayBounces);

    if (_fov <= 0.0f || _fov >= PI)
        value.parseError(tfm::format("Camera field of view must be between 0 and 180 degrees, received %f",
                Angle::radToDeg(_fov)));
}

Vec3f Camera::right() const
{
    Vec3f r = _dir.cross(WorldUp);
    // Looking straight up or down leaves the horizontal axis undefined
    if (r.lengthSq() < 1e-12f)
        return Vec3f(1.0f, 0.0f, 0.0f);
    return r.normalized();
}

Vec3f Camera::up() const
{
    return right().cross(_dir).normalized();
}

void Camera::dolly(float amount)
{
    _pos += _dir*amount;
}

void Camera::strafe(float amount)
{
    _pos += right()*amount;
}

void Camera::pedestal(float amount)
{
    _pos += up()*amount;
}

void Camera::pan(float amount)
{
    _dir = (_dir + right()*amount).normalized();
}

void Camera::tilt(float amount)
{
    _dir = (_dir + up()*amount).normalized();
}

void Camera::yaw(float angle)
{
    _dir = (QuaternionF(angle, WorldUp)*_dir).normalized();
}

void Camera::pitch(float angle)
{
    _dir = (QuaternionF(angle, right())*_dir).normalized();
}

void Camera::lookAt(const Vec3f &target)
{
    setDir(target - _pos);
}

void Camera::setDir(const Vec3f &dir)
{
    ASSERT(dir.lengthSq() > 0.0f, "Camera direction must not be the zero vector");
    _dir = dir.normalized();
}

std::vector<uint8> Camera::serialize() const
{
    return GpuPacker::packCamera(*this);
}

}
