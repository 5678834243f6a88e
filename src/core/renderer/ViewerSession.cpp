#include "ViewerSession.hpp"

#include "gpu/GpuPacker.hpp"

#include "scene/CapacityException.hpp"

#include "Logging.hpp"

namespace Shrimpy {

CONSTEXPR float ViewerSession::ScrollSensitivity;
CONSTEXPR float ViewerSession::PointerSensitivity;

ViewerSession::ViewerSession()
: ViewerSession(Scene(), Camera(), FrameState())
{
}

ViewerSession::ViewerSession(const Scene &scene, const Camera &camera, const FrameState &frame)
: _scene(scene),
  _camera(camera),
  _frame(frame),
  _rebuildFailed(false)
{
}

void ViewerSession::onScroll(float delta)
{
    moveCamera([&](Camera &c) { c.dolly(delta*ScrollSensitivity); });
}

void ViewerSession::onPointerMotion(PointerButton button, float dx, float dy)
{
    switch (button) {
    case ButtonSecondary:
        moveCamera([&](Camera &c) {
            c.pan(dx*PointerSensitivity);
            c.tilt(dy*PointerSensitivity);
        });
        break;
    case ButtonPrimary:
        moveCamera([&](Camera &c) {
            c.pedestal(dy*PointerSensitivity);
            c.strafe(dx*PointerSensitivity);
        });
        break;
    case ButtonNone:
        break;
    }
}

void ViewerSession::onResize(uint32 width, uint32 height)
{
    _frame.resize(width, height);
}

std::vector<uint8> ViewerSession::frameBlob()
{
    _timer.stop();
    return frameBlob(float(_timer.elapsed()));
}

std::vector<uint8> ViewerSession::frameBlob(float elapsedSeconds)
{
    // A tree that doesn't fit is reported once per edit. The last tree that
    // did fit stays in the buffer until a later edit produces one that fits
    if (_scene.dirty() && !_rebuildFailed) {
        try {
            _scene.build();
        } catch (const CapacityException &e) {
            printWarning(e.what());
            _rebuildFailed = true;
        }
    }
    _frame.advance(elapsedSeconds);
    return GpuPacker::packBlob(_camera, _frame, _scene);
}

void ViewerSession::renderFrame(FrameSink &sink)
{
    sink.submit(frameBlob());
}

}
