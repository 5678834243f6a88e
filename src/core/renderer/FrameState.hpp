#ifndef FRAMESTATE_HPP_
#define FRAMESTATE_HPP_

#include "io/JsonPtr.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

// Per-frame uniforms shared with the render loop. The kernel blends the new
// sample into the accumulation buffer with weight 1/frameCount, so resetting
// the counter restarts accumulation from scratch
class FrameState
{
    uint32 _width;
    uint32 _height;
    float _elapsedSeconds;
    uint32 _frameCount;
    float _gammaCorrection;

public:
    FrameState();
    FrameState(uint32 width, uint32 height);

    void fromJson(JsonPtr value);

    // elapsedSeconds is measured from the start of the session
    void advance(float elapsedSeconds);
    void reset();
    void resize(uint32 width, uint32 height);

    // Index of the buffer of the accumulation ping-pong pair written this frame
    uint32 accumulationTarget() const
    {
        return _frameCount % 2;
    }

    std::vector<uint8> serialize() const;

    uint32 width() const
    {
        return _width;
    }

    uint32 height() const
    {
        return _height;
    }

    float elapsedSeconds() const
    {
        return _elapsedSeconds;
    }

    uint32 frameCount() const
    {
        return _frameCount;
    }

    float gammaCorrection() const
    {
        return _gammaCorrection;
    }

    void setGammaCorrection(float gamma)
    {
        _gammaCorrection = gamma;
    }
};

}

#endif /* FRAMESTATE_HPP_ */
