#ifndef GPUPACKER_HPP_
#define GPUPACKER_HPP_

#include "GpuWriter.hpp"

#include "primitives/Triangle.hpp"
#include "primitives/Sphere.hpp"

#include "materials/Material.hpp"

#include "bvh/BvhNode.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

class FrameState;
class Camera;
class Scene;

// Converts the CPU side objects to and from the GPU buffer layout described
// in GpuLayout.hpp
class GpuPacker
{
    GpuPacker() {}

public:
    struct SceneCounts
    {
        uint32 sphereCount;
        uint32 triangleCount;
        uint32 materialCount;
        uint32 bvhNodeCount;
    };

    static void writeMaterial(GpuWriter &out, const Material &m);
    static void writeSphere(GpuWriter &out, const Sphere &s);
    static void writeTriangle(GpuWriter &out, const Triangle &t);
    static void writeBvhNode(GpuWriter &out, const Bvh::BvhNode &node);

    static void writeCamera(GpuWriter &out, const Camera &camera);
    static void writeFrame(GpuWriter &out, const FrameState &frame);
    static void writeScene(GpuWriter &out, const Scene &scene);

    static std::vector<uint8> packCamera(const Camera &camera);
    static std::vector<uint8> packFrame(const FrameState &frame);
    static std::vector<uint8> packScene(const Scene &scene);
    static std::vector<uint8> packBlob(const Camera &camera, const FrameState &frame, const Scene &scene);

    static Material readMaterial(const GpuReader &in);
    static Sphere readSphere(const GpuReader &in);
    static Triangle readTriangle(const GpuReader &in);
    static Bvh::BvhNode readBvhNode(const GpuReader &in);
    static Camera readCamera(const GpuReader &in);
    static SceneCounts readSceneCounts(const GpuReader &in);
};

}

#endif /* GPUPACKER_HPP_ */
