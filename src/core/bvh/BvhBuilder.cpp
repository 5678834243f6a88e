#include "BvhBuilder.hpp"

#include "math/MathUtil.hpp"
#include "math/Box.hpp"
#include "math/Vec.hpp"

#include "IntTypes.hpp"
#include "Debug.hpp"

#include <algorithm>
#include <cmath>

namespace Shrimpy {

namespace Bvh {

CONSTEXPR float BvhBuilder::DegenerateExtent;
CONSTEXPR float BvhBuilder::DegeneratePadding;

// Strict weak ordering even in the presence of NaN centroids, which sort
// last. Equal keys fall back to the triangle index so builds are repeatable
static bool centroidLess(float ca, uint32 a, float cb, uint32 b)
{
    bool nanA = std::isnan(ca);
    bool nanB = std::isnan(cb);
    if (nanA || nanB) {
        if (nanA != nanB)
            return nanB;
        return a < b;
    }
    if (ca != cb)
        return ca < cb;
    return a < b;
}

BvhBuilder::BvhBuilder(uint32 maxLeafSize)
: _stats(Stats{0, 0, 0}),
  _maxLeafSize(maxLeafSize)
{
    ASSERT(maxLeafSize >= 1 && maxLeafSize <= BvhNode::LeafCapacity,
            "Leaf size must be between 1 and %d, received %d", BvhNode::LeafCapacity, maxLeafSize);
}

uint32 BvhBuilder::recursiveBuild(const Triangle *triangles, uint32 *indices, uint32 count, uint32 depth)
{
    _stats.depth = max(_stats.depth, depth);

    Box3f box;
    for (uint32 i = 0; i < count; ++i)
        box.grow(triangles[indices[i]].bounds());
    box.inflateThinAxes(DegenerateExtent, DegeneratePadding);

    if (count <= _maxLeafSize) {
        uint32 index = uint32(_nodes.size());
        _nodes.push_back(BvhNode::leaf(box, indices, count));
        _stats.leafCount++;
        return index;
    }

    int dim = box.extent().maxDim();
    std::sort(indices, indices + count, [&](uint32 a, uint32 b) {
        return centroidLess(triangles[a].centroid()[dim], a, triangles[b].centroid()[dim], b);
    });

    // Claim our slot before the children so parents always precede them
    uint32 index = uint32(_nodes.size());
    _nodes.emplace_back();

    uint32 mid = count/2;
    uint32 left  = recursiveBuild(triangles, indices, mid, depth + 1);
    uint32 right = recursiveBuild(triangles, indices + mid, count - mid, depth + 1);

    _nodes[index] = BvhNode::interior(box, left, right);
    return index;
}

uint32 BvhBuilder::build(const Triangle *triangles, std::vector<uint32> &indices)
{
    ASSERT(!indices.empty(), "Cannot build a BVH over an empty triangle set");

    _nodes.clear();
    _stats = Stats{0, 0, 0};

    uint32 root = recursiveBuild(triangles, indices.data(), uint32(indices.size()), 1);
    _stats.nodeCount = uint32(_nodes.size());

#ifndef NDEBUG
    integrityCheck(triangles, uint32(indices.size()));
#endif

    return root;
}

uint32 BvhBuilder::build(const std::vector<Triangle> &triangles, std::vector<uint32> &indices)
{
    return build(triangles.data(), indices);
}

void BvhBuilder::integrityCheck(const Triangle *triangles, uint32 numTriangles) const
{
    for (size_t i = 0; i < _nodes.size(); ++i) {
        const BvhNode &node = _nodes[i];
        if (node.isLeaf()) {
            for (uint32 t = 0; t < node.triangleCount; ++t) {
                uint32 id = node.triangleIds[t];
                ASSERT(id < numTriangles, "Leaf %d references triangle %d out of %d", i, id, numTriangles);
                ASSERT(isnan(triangles[id].centroid()) || node.bbox().contains(triangles[id].bounds()),
                        "Triangle %d not contained in leaf %d %s", id, i, node.bbox());
            }
        } else {
            ASSERT(node.child1 > i && node.child2 > i && node.child2 < _nodes.size(),
                    "Interior node %d has invalid children %d/%d", i, node.child1, node.child2);

            // Children may be padded past their parent along thin axes
            Box3f bounds = node.bbox();
            bounds.min() = bounds.min() - DegeneratePadding;
            bounds.max() = bounds.max() + DegeneratePadding;
            const BvhNode *children[] = {&_nodes[node.child1], &_nodes[node.child2]};
            for (const BvhNode *child : children)
                ASSERT(isnan(child->bboxMin) || isnan(child->bboxMax) || bounds.contains(child->bbox()),
                        "Child box not contained! %s c/ %s at node %d", child->bbox(), node.bbox(), i);
        }
    }
}

}

}
