#ifndef VIEWERSESSION_HPP_
#define VIEWERSESSION_HPP_

#include "FrameState.hpp"
#include "FrameSink.hpp"

#include "cameras/Camera.hpp"

#include "scene/Scene.hpp"

#include "Timer.hpp"

#include <vector>

namespace Shrimpy {

// Owns everything the render loop uploads each frame. Any change that
// invalidates previous samples (camera motion, scene edits, resizing) goes
// through here and resets the accumulation counter
class ViewerSession
{
public:
    enum PointerButton
    {
        ButtonNone,
        ButtonPrimary,
        ButtonSecondary,
    };

    static CONSTEXPR float ScrollSensitivity = 0.001f;
    static CONSTEXPR float PointerSensitivity = 0.004f;

private:
    Scene _scene;
    Camera _camera;
    FrameState _frame;
    Timer _timer;
    bool _rebuildFailed;

public:
    ViewerSession();
    ViewerSession(const Scene &scene, const Camera &camera, const FrameState &frame);

    // Applies f to the camera and restarts accumulation
    template<typename Motion>
    void moveCamera(Motion f)
    {
        f(_camera);
        _frame.reset();
    }

    // Applies f to the scene and restarts accumulation. The BVH is rebuilt
    // lazily by the next frameBlob(), which keeps the previous tree if the
    // new one exceeds the node capacity
    template<typename Edit>
    void editScene(Edit f)
    {
        f(_scene);
        _rebuildFailed = false;
        _frame.reset();
    }

    void onScroll(float delta);
    void onPointerMotion(PointerButton button, float dx, float dy);
    void onResize(uint32 width, uint32 height);

    std::vector<uint8> frameBlob();
    std::vector<uint8> frameBlob(float elapsedSeconds);
    void renderFrame(FrameSink &sink);

    void resetAccumulation()
    {
        _frame.reset();
    }

    const Scene &scene() const
    {
        return _scene;
    }

    const Camera &camera() const
    {
        return _camera;
    }

    const FrameState &frame() const
    {
        return _frame;
    }
};

}

#endif /* VIEWERSESSION_HPP_ */
