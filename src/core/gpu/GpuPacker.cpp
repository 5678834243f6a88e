#include "GpuPacker.hpp"
#include "GpuLayout.hpp"

#include "renderer/FrameState.hpp"

#include "cameras/Camera.hpp"

#include "scene/Scene.hpp"

#include "Debug.hpp"

namespace Shrimpy {

using namespace GpuLayout;

void GpuPacker::writeMaterial(GpuWriter &out, const Material &m)
{
    out.writeVec3(m.color());
    out.writeF32(m.encodedRoughnessOrIor());
    out.writeF32(m.emission());
    out.writeF32(m.density());
    out.pad(8);
}

void GpuPacker::writeSphere(GpuWriter &out, const Sphere &s)
{
    out.writeVec3(s.center);
    out.writeF32(s.radius);
    out.writeU32(s.materialId);
    out.pad(12);
}

void GpuPacker::writeTriangle(GpuWriter &out, const Triangle &t)
{
    for (int i = 0; i < 3; ++i) {
        out.writeVec3(t.vertex(i));
        out.pad(4);
    }
    out.writeU32(t.materialId);
    out.pad(12);
}

void GpuPacker::writeBvhNode(GpuWriter &out, const Bvh::BvhNode &node)
{
    out.writeVec3(node.bboxMin);
    out.pad(4);
    out.writeVec3(node.bboxMax);
    out.pad(4);
    out.writeU32(node.child1);
    out.writeU32(node.child2);
    out.writeU32(node.triangleCount);
    for (uint32 i = 0; i < Bvh::BvhNode::LeafCapacity; ++i)
        out.writeU32(node.triangleIds[i]);
    out.pad(8);
}

void GpuPacker::writeCamera(GpuWriter &out, const Camera &camera)
{
    out.writeVec3(camera.pos());
    out.pad(4);
    out.writeVec3(camera.dir());
    out.writeF32(camera.fov());
    out.writeF32(camera.width());
    out.writeF32(camera.focusDistance());
    out.writeF32(camera.aperture());
    out.writeF32(camera.divergeStrength());
    out.writeU32(camera.maxRayBounces());
    out.pad(12);
}

void GpuPacker::writeFrame(GpuWriter &out, const FrameState &frame)
{
    out.writeU32(frame.width());
    out.writeU32(frame.height());
    out.writeF32(frame.elapsedSeconds());
    out.writeU32(frame.frameCount());
    out.writeF32(frame.gammaCorrection());
    out.pad(12);
}

void GpuPacker::writeScene(GpuWriter &out, const Scene &scene)
{
    size_t base = out.offset();

    // Unused slots hold defaults so the buffer contents are fully deterministic
    for (size_t i = 0; i < Scene::MaxMaterials; ++i)
        writeMaterial(out, i < scene.materials().size() ? scene.materials()[i] : Material());
    for (size_t i = 0; i < Scene::MaxSpheres; ++i)
        writeSphere(out, i < scene.spheres().size() ? scene.spheres()[i] : Sphere::unitSphere());
    for (size_t i = 0; i < Scene::MaxTriangles; ++i)
        writeTriangle(out, i < scene.triangles().size() ? scene.triangles()[i] : Triangle());
    for (size_t i = 0; i < Scene::MaxBvhNodes; ++i)
        writeBvhNode(out, i < scene.bvhNodes().size() ? scene.bvhNodes()[i] : Bvh::BvhNode());

    out.writeU32(uint32(scene.spheres().size()));
    out.writeU32(uint32(scene.triangles().size()));
    out.writeU32(uint32(scene.materials().size()));
    out.writeU32(uint32(scene.bvhNodes().size()));

    ASSERT(out.offset() - base == SceneLayout::Size, "Scene section has size %d, expected %d",
            out.offset() - base, SceneLayout::Size);
}

std::vector<uint8> GpuPacker::packCamera(const Camera &camera)
{
    std::vector<uint8> result;
    result.reserve(CameraLayout::Size);
    GpuWriter out(result);
    writeCamera(out, camera);
    return result;
}

std::vector<uint8> GpuPacker::packFrame(const FrameState &frame)
{
    std::vector<uint8> result;
    result.reserve(FrameLayout::Size);
    GpuWriter out(result);
    writeFrame(out, frame);
    return result;
}

std::vector<uint8> GpuPacker::packScene(const Scene &scene)
{
    std::vector<uint8> result;
    result.reserve(SceneLayout::Size);
    GpuWriter out(result);
    writeScene(out, scene);
    return result;
}

std::vector<uint8> GpuPacker::packBlob(const Camera &camera, const FrameState &frame, const Scene &scene)
{
    std::vector<uint8> result;
    result.reserve(BlobLayout::Size);
    GpuWriter out(result);
    writeCamera(out, camera);
    writeFrame(out, frame);
    writeScene(out, scene);
    return result;
}

Material GpuPacker::readMaterial(const GpuReader &in)
{
    return Material::fromEncoded(
        in.readVec3(MaterialLayout::Color),
        in.readF32(MaterialLayout::RoughnessOrIor),
        in.readF32(MaterialLayout::Emission),
        in.readF32(MaterialLayout::Density)
    );
}

Sphere GpuPacker::readSphere(const GpuReader &in)
{
    return Sphere(
        in.readVec3(SphereLayout::Center),
        in.readF32(SphereLayout::Radius),
        in.readU32(SphereLayout::MaterialId)
    );
}

Triangle GpuPacker::readTriangle(const GpuReader &in)
{
    return Triangle(
        in.readVec3(TriangleLayout::V0),
        in.readVec3(TriangleLayout::V1),
        in.readVec3(TriangleLayout::V2),
        in.readU32(TriangleLayout::MaterialId)
    );
}

Bvh::BvhNode GpuPacker::readBvhNode(const GpuReader &in)
{
    Bvh::BvhNode node = Bvh::BvhNode();
    node.bboxMin = in.readVec3(BvhNodeLayout::BboxMin);
    node.bboxMax = in.readVec3(BvhNodeLayout::BboxMax);
    node.child1 = in.readU32(BvhNodeLayout::Child1);
    node.child2 = in.readU32(BvhNodeLayout::Child2);
    node.triangleCount = in.readU32(BvhNodeLayout::TriangleCount);
    for (uint32 i = 0; i < Bvh::BvhNode::LeafCapacity; ++i)
        node.triangleIds[i] = in.readU32(BvhNodeLayout::TriangleIds + i*4);
    return node;
}

Camera GpuPacker::readCamera(const GpuReader &in)
{
    Camera camera;
    camera.setPos(in.readVec3(CameraLayout::Position));
    Vec3f dir = in.readVec3(CameraLayout::Direction);
    if (dir.lengthSq() == 0.0f)
        FAIL("Packed camera has a zero view direction");
    camera.setDir(dir);
    camera.setFov(in.readF32(CameraLayout::Fov));
    camera.setWidth(in.readF32(CameraLayout::Width));
    camera.setFocusDistance(in.readF32(CameraLayout::FocusDistance));
    camera.setAperture(in.readF32(CameraLayout::Aperture));
    camera.setDivergeStrength(in.readF32(CameraLayout::DivergeStrength));
    camera.setMaxRayBounces(in.readU32(CameraLayout::MaxRayBounces));
    return camera;
}

GpuPacker::SceneCounts GpuPacker::readSceneCounts(const GpuReader &in)
{
    SceneCounts counts;
    counts.sphereCount   = in.readU32(SceneLayout::SphereCount);
    counts.triangleCount = in.readU32(SceneLayout::TriangleCount);
    counts.materialCount = in.readU32(SceneLayout::MaterialCount);
    counts.bvhNodeCount  = in.readU32(SceneLayout::BvhNodeCount);

    if (counts.sphereCount > Scene::MaxSpheres || counts.triangleCount > Scene::MaxTriangles ||
            counts.materialCount > Scene::MaxMaterials || counts.bvhNodeCount > Scene::MaxBvhNodes)
        FAIL("Packed scene counts exceed the buffer capacity (%d spheres, %d triangles, %d materials, %d nodes)",
                counts.sphereCount, counts.triangleCount, counts.materialCount, counts.bvhNodeCount);

    return counts;
}

}
