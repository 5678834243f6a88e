#ifndef BVHBUILDER_HPP_
#define BVHBUILDER_HPP_

#include "BvhNode.hpp"

#include "primitives/Triangle.hpp"

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

namespace Bvh {

// Median split BVH builder. Each call to build() discards the previous result
// and produces a depth-first node array with the root at index 0 and every
// parent stored before its children.
class BvhBuilder
{
public:
    struct Stats
    {
        uint32 nodeCount;
        uint32 leafCount;
        uint32 depth;
    };

    // Axes thinner than DegenerateExtent are padded by DegeneratePadding on
    // both sides so the shader's slab test never sees a zero-width box
    static CONSTEXPR float DegenerateExtent = 1e-4f;
    static CONSTEXPR float DegeneratePadding = 0.01f;

private:
    std::vector<BvhNode> _nodes;
    Stats _stats;
    uint32 _maxLeafSize;

    uint32 recursiveBuild(const Triangle *triangles, uint32 *indices, uint32 count, uint32 depth);

public:
    explicit BvhBuilder(uint32 maxLeafSize = BvhNode::LeafCapacity);

    // Reorders indices in place. Returns the index of the root node
    uint32 build(const Triangle *triangles, std::vector<uint32> &indices);
    uint32 build(const std::vector<Triangle> &triangles, std::vector<uint32> &indices);

    void integrityCheck(const Triangle *triangles, uint32 numTriangles) const;

    const std::vector<BvhNode> &nodes() const
    {
        return _nodes;
    }

    std::vector<BvhNode> &nodes()
    {
        return _nodes;
    }

    const Stats &stats() const
    {
        return _stats;
    }

    uint32 maxLeafSize() const
    {
        return _maxLeafSize;
    }
};

}

}

#endif /* BVHBUILDER_HPP_ */
