#include "Scene.hpp"

#include "bvh/BvhBuilder.hpp"

#include "gpu/GpuPacker.hpp"

#include "Debug.hpp"

namespace Shrimpy {

CONSTEXPR size_t Scene::MaxMaterials;
CONSTEXPR size_t Scene::MaxSpheres;
CONSTEXPR size_t Scene::MaxTriangles;
CONSTEXPR size_t Scene::MaxBvhNodes;

Scene::Scene()
: _materials("materials"),
  _spheres("spheres"),
  _triangles("triangles"),
  _bvhNodes("BVH nodes"),
  _dirty(false)
{
}

uint32 Scene::addMaterial(const Material &material)
{
    _materials.push_back(material);
    _dirty = true;
    return uint32(_materials.size() - 1);
}

void Scene::addSphere(const Sphere &sphere)
{
    _spheres.push_back(sphere);
    _dirty = true;
}

void Scene::addTriangle(const Triangle &triangle)
{
    _triangles.push_back(triangle);
    _dirty = true;
}

void Scene::addTriangles(const std::vector<Triangle> &triangles)
{
    _triangles.append(triangles.begin(), triangles.end());
    _dirty = true;
}

void Scene::build()
{
    if (_triangles.empty()) {
        _bvhNodes.clear();
        _dirty = false;
        return;
    }

    std::vector<uint32> indices(_triangles.size());
    for (size_t i = 0; i < indices.size(); ++i)
        indices[i] = uint32(i);

    Bvh::BvhBuilder builder(Bvh::BvhNode::LeafCapacity);
    builder.build(_triangles.data(), indices);

    // assign() throws before touching the previous tree if it doesn't fit
    const std::vector<Bvh::BvhNode> &nodes = builder.nodes();
    _bvhNodes.assign(nodes.begin(), nodes.end());
    _dirty = false;

    DBG("Built BVH over %d triangles: %d nodes, %d leaves, depth %d", _triangles.size(),
            builder.stats().nodeCount, builder.stats().leafCount, builder.stats().depth);
}

void Scene::validate() const
{
    for (size_t i = 0; i < _spheres.size(); ++i)
        if (_spheres[i].materialId >= _materials.size())
            FAIL("Sphere %d references material %d, but only %d materials exist",
                    i, _spheres[i].materialId, _materials.size());
    for (size_t i = 0; i < _triangles.size(); ++i)
        if (_triangles[i].materialId >= _materials.size())
            FAIL("Triangle %d references material %d, but only %d materials exist",
                    i, _triangles[i].materialId, _materials.size());
}

void Scene::clear()
{
    _materials.clear();
    _spheres.clear();
    _triangles.clear();
    _bvhNodes.clear();
    _dirty = true;
}

std::vector<uint8> Scene::serialize() const
{
    return GpuPacker::packScene(*this);
}

}
