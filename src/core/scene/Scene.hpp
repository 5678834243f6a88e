#ifndef SCENE_HPP_
#define SCENE_HPP_

#include "FixedArray.hpp"

#include "primitives/Triangle.hpp"
#include "primitives/Sphere.hpp"

#include "materials/Material.hpp"

#include "bvh/BvhNode.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

// CPU side mirror of the fixed-capacity GPU scene buffer. Materials have to
// be added before the geometry referencing them; validate() reports
// dangling references. The BVH is only updated by an explicit build()
class Scene
{
public:
    static CONSTEXPR size_t MaxMaterials = 64;
    static CONSTEXPR size_t MaxSpheres = 64;
    static CONSTEXPR size_t MaxTriangles = 256;
    static CONSTEXPR size_t MaxBvhNodes = 96;

private:
    FixedArray<Material, MaxMaterials> _materials;
    FixedArray<Sphere, MaxSpheres> _spheres;
    FixedArray<Triangle, MaxTriangles> _triangles;
    FixedArray<Bvh::BvhNode, MaxBvhNodes> _bvhNodes;
    bool _dirty;

public:
    Scene();

    uint32 addMaterial(const Material &material);
    void addSphere(const Sphere &sphere);
    void addTriangle(const Triangle &triangle);
    void addTriangles(const std::vector<Triangle> &triangles);

    void build();
    void validate() const;
    void clear();

    // Scene section of the GPU buffer. Does not build the BVH
    std::vector<uint8> serialize() const;

    const FixedArray<Material, MaxMaterials> &materials() const
    {
        return _materials;
    }

    const FixedArray<Sphere, MaxSpheres> &spheres() const
    {
        return _spheres;
    }

    const FixedArray<Triangle, MaxTriangles> &triangles() const
    {
        return _triangles;
    }

    const FixedArray<Bvh::BvhNode, MaxBvhNodes> &bvhNodes() const
    {
        return _bvhNodes;
    }

    // True if geometry changed since the last build()
    bool dirty() const
    {
        return _dirty;
    }
};

}

#endif /* SCENE_HPP_ */
