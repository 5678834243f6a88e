#include "TestUtils.hpp"

#include "scene/CapacityException.hpp"
#include "scene/Scene.hpp"

#include "gpu/GpuLayout.hpp"
#include "gpu/GpuWriter.hpp"

#include "Debug.hpp"

#include <iostream>
#include <vector>

using namespace Shrimpy;

int main()
{
    DebugUtils::setQuiet(true);

    // Material ids are assigned in insertion order, the 65th overflows
    {
        Scene scene;
        for (uint32 i = 0; i < Scene::MaxMaterials; ++i) {
            if (scene.addMaterial(Material::diffuse(Vec3f(0.5f), 0.5f)) != i) {
                std::cerr << "addMaterial returned the wrong id\n";
                return 1;
            }
        }
        try {
            scene.addMaterial(Material());
            std::cerr << "65th material did not throw\n";
            return 1;
        } catch (const CapacityException &e) {
            if (e.capacity() != 64 || e.requested() != 65 || e.container() != "materials") {
                std::cerr << "Unexpected exception contents: " << e.what() << "\n";
                return 1;
            }
        }
        if (scene.materials().size() != 64) {
            std::cerr << "Failed append changed the material count\n";
            return 1;
        }
    }

    // Sphere overflow
    {
        Scene scene;
        scene.addMaterial(Material());
        for (size_t i = 0; i < Scene::MaxSpheres; ++i)
            scene.addSphere(Sphere(Vec3f(float(i), 0.0f, 0.0f), 0.5f, 0));
        bool threw = false;
        try {
            scene.addSphere(Sphere::unitSphere());
        } catch (const CapacityException &) {
            threw = true;
        }
        if (!threw || scene.spheres().size() != 64) {
            std::cerr << "65th sphere: expected CapacityException with count unchanged\n";
            return 1;
        }
    }

    // Triangle batches are all or nothing
    {
        Scene scene;
        scene.addMaterial(Material());
        bool threw = false;
        try {
            scene.addTriangles(triangleRow(257));
        } catch (const CapacityException &) {
            threw = true;
        }
        if (!threw || !scene.triangles().empty()) {
            std::cerr << "257 triangles: expected CapacityException and an empty scene\n";
            return 1;
        }

        scene.addTriangles(triangleRow(250));
        threw = false;
        try {
            scene.addTriangles(triangleRow(10));
        } catch (const CapacityException &e) {
            threw = e.requested() == 260;
        }
        if (!threw || scene.triangles().size() != 250) {
            std::cerr << "Partial overflow: expected 250 triangles to remain, found "
                      << scene.triangles().size() << "\n";
            return 1;
        }
        scene.addTriangles(triangleRow(6));
        if (scene.triangles().size() != 256) {
            std::cerr << "Filling up to capacity failed\n";
            return 1;
        }
    }

    // Building an empty scene clears the BVH
    {
        Scene scene;
        scene.build();
        if (!scene.bvhNodes().empty() || scene.dirty()) {
            std::cerr << "Empty build should leave no nodes\n";
            return 1;
        }
    }

    // Build is idempotent and tracks the dirty flag
    {
        Scene scene;
        scene.addMaterial(Material());
        scene.addTriangles(triangleRow(10));
        if (!scene.dirty()) {
            std::cerr << "Appending triangles should mark the scene dirty\n";
            return 1;
        }
        scene.build();
        if (scene.dirty() || scene.bvhNodes().size() != 3) {
            std::cerr << "Ten triangles should build 3 nodes, got " << scene.bvhNodes().size() << "\n";
            return 1;
        }
        std::vector<Bvh::BvhNode> first(scene.bvhNodes().begin(), scene.bvhNodes().end());
        scene.build();
        std::vector<Bvh::BvhNode> second(scene.bvhNodes().begin(), scene.bvhNodes().end());
        if (first != second) {
            std::cerr << "Rebuilding produced a different tree\n";
            return 1;
        }

        // A tree that needs more than 96 nodes leaves the previous one in place
        scene.addTriangles(triangleRow(246));
        bool threw = false;
        try {
            scene.build();
        } catch (const CapacityException &e) {
            threw = e.container() == "BVH nodes";
        }
        std::vector<Bvh::BvhNode> third(scene.bvhNodes().begin(), scene.bvhNodes().end());
        if (!threw || third != first || !scene.dirty()) {
            std::cerr << "Node overflow: expected CapacityException with the old tree intact\n";
            return 1;
        }
    }

    // A hundred triangles fit the node budget
    {
        Scene scene;
        scene.addMaterial(Material());
        scene.addTriangles(randomTriangles(100, 99));
        for (Triangle t : randomTriangles(1, 5)) {
            t.materialId = 0;
            scene.addTriangle(t);
        }
        scene.build();
        if (scene.bvhNodes().empty() || scene.bvhNodes().size() > Scene::MaxBvhNodes || scene.bvhNodes()[0].isLeaf()) {
            std::cerr << "101 triangles: unexpected node count " << scene.bvhNodes().size() << "\n";
            return 1;
        }
    }

    // Dangling material references are reported by validate()
    {
        Scene scene;
        scene.addMaterial(Material());
        scene.addTriangle(Triangle(Vec3f(0.0f), Vec3f(1.0f, 0.0f, 0.0f), Vec3f(0.0f, 1.0f, 0.0f), 0));
        scene.validate();
        scene.addSphere(Sphere(Vec3f(0.0f), 1.0f, 3));
        bool threw = false;
        try {
            scene.validate();
        } catch (const std::runtime_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "validate() accepted a sphere with material 3 out of 1\n";
            return 1;
        }
    }

    // Serialized scene section and its live counts
    {
        Scene scene;
        scene.addMaterial(Material());
        scene.addMaterial(Material::dielectric(Vec3f(1.0f), 1.5f));
        scene.addSphere(Sphere(Vec3f(0.0f, 1.0f, 0.0f), 0.5f, 1));
        scene.addTriangles(triangleRow(10));
        scene.build();

        std::vector<uint8> bytes = scene.serialize();
        if (bytes.size() != GpuLayout::SceneLayout::Size || bytes.size() != 28176) {
            std::cerr << "Scene section has " << bytes.size() << " bytes\n";
            return 1;
        }
        GpuReader reader(bytes);
        if (reader.readU32(GpuLayout::SceneLayout::SphereCount) != 1 ||
                reader.readU32(GpuLayout::SceneLayout::TriangleCount) != 10 ||
                reader.readU32(GpuLayout::SceneLayout::MaterialCount) != 2 ||
                reader.readU32(GpuLayout::SceneLayout::BvhNodeCount) != 3) {
            std::cerr << "Scene counts were not serialized at their offsets\n";
            return 1;
        }

        scene.clear();
        if (!scene.materials().empty() || !scene.triangles().empty() || !scene.bvhNodes().empty() || !scene.dirty()) {
            std::cerr << "clear() left content behind\n";
            return 1;
        }
    }

    std::cout << "test_scene passed\n";
    return 0;
}
