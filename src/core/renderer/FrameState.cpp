#include "FrameState.hpp"

#include "gpu/GpuPacker.hpp"

#include "math/Vec.hpp"

namespace Shrimpy {

FrameState::FrameState()
: FrameState(800, 600)
{
}

FrameState::FrameState(uint32 width, uint32 height)
: _width(width),
  _height(height),
  _elapsedSeconds(0.0f),
  _frameCount(0),
  _gammaCorrection(2.2f)
{
}

void FrameState::fromJson(JsonPtr value)
{
    if (auto res = value["resolution"]) {
        Vec2u resolution = res.cast<Vec2u>();
        if (resolution.x() == 0 || resolution.y() == 0)
            res.parseError("Frame resolution must be non-zero");
        resize(resolution.x(), resolution.y());
    }
    value.getField("gamma", _gammaCorrection);
    if (_gammaCorrection <= 0.0f)
        value.parseError(tfm::format("Gamma must be positive, received %f", _gammaCorrection));
}

void FrameState::advance(float elapsedSeconds)
{
    _elapsedSeconds = elapsedSeconds;
    _frameCount++;
}

void FrameState::reset()
{
    _frameCount = 0;
}

void FrameState::resize(uint32 width, uint32 height)
{
    _width = width;
    _height = height;
    reset();
}

std::vector<uint8> FrameState::serialize() const
{
    return GpuPacker::packFrame(*this);
}

}
