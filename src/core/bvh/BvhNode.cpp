#include "BvhNode.hpp"

#include "Debug.hpp"

namespace Shrimpy {

namespace Bvh {

CONSTEXPR uint32 BvhNode::LeafCapacity;

BvhNode BvhNode::interior(const Box3f &box, uint32 child1, uint32 child2)
{
    BvhNode result = BvhNode();
    result.bboxMin = box.min();
    result.bboxMax = box.max();
    result.child1 = child1;
    result.child2 = child2;
    result.triangleCount = 0;
    return result;
}

BvhNode BvhNode::leaf(const Box3f &box, const uint32 *ids, uint32 count)
{
    ASSERT(count > 0 && count <= LeafCapacity, "Leaf must hold between 1 and %d triangles, received %d",
            LeafCapacity, count);

    BvhNode result = BvhNode();
    result.bboxMin = box.min();
    result.bboxMax = box.max();
    result.triangleCount = count;
    for (uint32 i = 0; i < count; ++i)
        result.triangleIds[i] = ids[i];
    return result;
}

bool BvhNode::operator==(const BvhNode &o) const
{
    if (bboxMin != o.bboxMin || bboxMax != o.bboxMax)
        return false;
    if (child1 != o.child1 || child2 != o.child2 || triangleCount != o.triangleCount)
        return false;
    for (uint32 i = 0; i < LeafCapacity; ++i)
        if (triangleIds[i] != o.triangleIds[i])
            return false;
    return true;
}

}

}
