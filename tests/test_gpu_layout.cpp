#include "TestUtils.hpp"

#include "renderer/FrameState.hpp"

#include "cameras/Camera.hpp"

#include "scene/Scene.hpp"

#include "gpu/GpuLayout.hpp"
#include "gpu/GpuPacker.hpp"

#include "Debug.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

using namespace Shrimpy;
using namespace Shrimpy::GpuLayout;

static bool zeroRange(const std::vector<uint8> &bytes, size_t begin, size_t end)
{
    for (size_t i = begin; i < end; ++i)
        if (bytes[i] != 0)
            return false;
    return true;
}

int main()
{
    DebugUtils::setQuiet(true);

    if (BlobLayout::Size != 28272 || BlobLayout::Frame != 64 || BlobLayout::Scene != 96) {
        std::cerr << "Blob layout constants are off\n";
        return 1;
    }

    Scene scene;
    scene.addMaterial(Material::diffuse(Vec3f(0.8f, 0.2f, 0.1f), 0.25f, 3.0f, 0.5f));
    scene.addMaterial(Material::dielectric(Vec3f(0.9f), 1.5f));
    scene.addSphere(Sphere(Vec3f(1.0f, 2.0f, 3.0f), 0.75f, 1));
    scene.addTriangles(triangleRow(10));
    scene.build();

    Camera camera;
    camera.setPos(Vec3f(0.0f, 1.0f, 4.0f));
    camera.pan(0.2f);

    FrameState frame(640, 480);
    frame.advance(1.5f);
    frame.advance(2.0f);

    std::vector<uint8> blob = GpuPacker::packBlob(camera, frame, scene);
    if (blob.size() != BlobLayout::Size) {
        std::cerr << "Blob has " << blob.size() << " bytes\n";
        return 1;
    }

    // The sections of the blob are the individually serialized parts
    std::vector<uint8> cameraBytes = camera.serialize();
    std::vector<uint8> frameBytes = frame.serialize();
    std::vector<uint8> sceneBytes = scene.serialize();
    if (!std::equal(cameraBytes.begin(), cameraBytes.end(), blob.begin() + BlobLayout::Camera) ||
            !std::equal(frameBytes.begin(), frameBytes.end(), blob.begin() + BlobLayout::Frame) ||
            !std::equal(sceneBytes.begin(), sceneBytes.end(), blob.begin() + BlobLayout::Scene)) {
        std::cerr << "Blob sections don't match the serialized parts\n";
        return 1;
    }

    GpuReader reader(blob);

    // Frame
    {
        GpuReader f = reader.at(BlobLayout::Frame);
        if (f.readU32(FrameLayout::Width) != 640 || f.readU32(FrameLayout::Height) != 480 ||
                f.readF32(FrameLayout::ElapsedSeconds) != 2.0f || f.readU32(FrameLayout::FrameCount) != 2 ||
                f.readF32(FrameLayout::GammaCorrection) != 2.2f) {
            std::cerr << "Frame fields not at their documented offsets\n";
            return 1;
        }
        if (!zeroRange(blob, BlobLayout::Frame + 20, BlobLayout::Frame + 32)) {
            std::cerr << "Frame padding not zero\n";
            return 1;
        }
    }

    // Camera
    {
        Camera read = GpuPacker::readCamera(reader.at(BlobLayout::Camera));
        if (read.pos() != camera.pos() || !near(read.dir(), camera.dir()) || read.fov() != camera.fov() ||
                read.maxRayBounces() != camera.maxRayBounces()) {
            std::cerr << "Camera does not read back unchanged\n";
            return 1;
        }
    }

    GpuReader s = reader.at(BlobLayout::Scene);

    // Materials, including the sign encoding of dielectrics and default filled slots
    {
        GpuReader m0 = s.at(SceneLayout::Materials);
        GpuReader m1 = s.at(SceneLayout::Materials + MaterialLayout::Size);
        if (m0.readVec3(MaterialLayout::Color) != Vec3f(0.8f, 0.2f, 0.1f) ||
                m0.readF32(MaterialLayout::RoughnessOrIor) != 0.25f ||
                m0.readF32(MaterialLayout::Emission) != 3.0f || m0.readF32(MaterialLayout::Density) != 0.5f) {
            std::cerr << "Diffuse material fields not at their documented offsets\n";
            return 1;
        }
        if (m1.readF32(MaterialLayout::RoughnessOrIor) != -1.5f) {
            std::cerr << "Dielectric IOR should be stored negated\n";
            return 1;
        }
        Material decoded = GpuPacker::readMaterial(m1);
        if (!decoded.isDielectric() || decoded.ior() != 1.5f) {
            std::cerr << "Dielectric does not decode back\n";
            return 1;
        }
        for (size_t i = 2; i < Scene::MaxMaterials; ++i) {
            if (GpuPacker::readMaterial(s.at(SceneLayout::Materials + i*MaterialLayout::Size)) != Material()) {
                std::cerr << "Unused material slot " << i << " is not the default material\n";
                return 1;
            }
        }
    }

    // Spheres
    {
        Sphere sphere = GpuPacker::readSphere(s.at(SceneLayout::Spheres));
        if (sphere.center != Vec3f(1.0f, 2.0f, 3.0f) || sphere.radius != 0.75f || sphere.materialId != 1) {
            std::cerr << "Sphere does not read back unchanged\n";
            return 1;
        }
        size_t base = BlobLayout::Scene + SceneLayout::Spheres;
        if (!zeroRange(blob, base + 20, base + 32)) {
            std::cerr << "Sphere padding not zero\n";
            return 1;
        }
    }

    // Triangles; unused slots are zero
    {
        for (size_t i = 0; i < scene.triangles().size(); ++i) {
            Triangle t = GpuPacker::readTriangle(s.at(SceneLayout::Triangles + i*TriangleLayout::Size));
            const Triangle &expected = scene.triangles()[i];
            if (t.v0 != expected.v0 || t.v1 != expected.v1 || t.v2 != expected.v2 ||
                    t.materialId != expected.materialId) {
                std::cerr << "Triangle " << i << " does not read back unchanged\n";
                return 1;
            }
        }
        size_t base = BlobLayout::Scene + SceneLayout::Triangles;
        if (!zeroRange(blob, base + 12, base + 16) || !zeroRange(blob, base + 52, base + 64)) {
            std::cerr << "Triangle padding not zero\n";
            return 1;
        }
        if (!zeroRange(blob, base + 10*TriangleLayout::Size, BlobLayout::Scene + SceneLayout::BvhNodes)) {
            std::cerr << "Unused triangle slots not zero\n";
            return 1;
        }
    }

    // BVH nodes
    {
        for (size_t i = 0; i < scene.bvhNodes().size(); ++i) {
            GpuReader n = s.at(SceneLayout::BvhNodes + i*BvhNodeLayout::Size);
            if (GpuPacker::readBvhNode(n) != scene.bvhNodes()[i]) {
                std::cerr << "BVH node " << i << " does not read back unchanged\n";
                return 1;
            }
        }
        GpuReader root = s.at(SceneLayout::BvhNodes);
        if (root.readU32(BvhNodeLayout::Child1) != 1 || root.readU32(BvhNodeLayout::Child2) != 2 ||
                root.readU32(BvhNodeLayout::TriangleCount) != 0) {
            std::cerr << "Root node fields not at their documented offsets\n";
            return 1;
        }
        GpuReader leaf = s.at(SceneLayout::BvhNodes + BvhNodeLayout::Size);
        if (leaf.readU32(BvhNodeLayout::TriangleCount) != 5 || leaf.readU32(BvhNodeLayout::TriangleIds + 4*4) != 4) {
            std::cerr << "Leaf node fields not at their documented offsets\n";
            return 1;
        }
        size_t base = BlobLayout::Scene + SceneLayout::BvhNodes;
        if (!zeroRange(blob, base + 72, base + 80) ||
                !zeroRange(blob, base + 3*BvhNodeLayout::Size, BlobLayout::Scene + SceneLayout::SphereCount)) {
            std::cerr << "BVH node padding or unused slots not zero\n";
            return 1;
        }
    }

    // Counts
    {
        GpuPacker::SceneCounts counts = GpuPacker::readSceneCounts(s);
        if (counts.sphereCount != 1 || counts.triangleCount != 10 || counts.materialCount != 2 ||
                counts.bvhNodeCount != 3) {
            std::cerr << "Scene counts do not read back unchanged\n";
            return 1;
        }
    }

    // Two identical setups produce identical blobs
    if (GpuPacker::packBlob(camera, frame, scene) != blob) {
        std::cerr << "Packing is not deterministic\n";
        return 1;
    }

    // Reads past the end are errors, not garbage
    {
        bool threw = false;
        try {
            reader.readU32(blob.size() - 2);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Out of bounds read did not throw\n";
            return 1;
        }
    }

    std::cout << "test_gpu_layout passed\n";
    return 0;
}
