#ifndef BVHNODE_HPP_
#define BVHNODE_HPP_

#include "math/Box.hpp"
#include "math/Vec.hpp"

#include "IntTypes.hpp"
#include "Platform.hpp"

#include <type_traits>

namespace Shrimpy {

namespace Bvh {

// Flat BVH node as consumed by the shader. Nodes reference each other and
// the scene triangles purely by array index, so an array of nodes can be
// copied to the GPU without pointer fix-up.
//
// triangleCount == 0 marks an interior node: child1/child2 are valid node
// indices and triangleIds is zeroed. triangleCount > 0 marks a leaf: the
// children are zero and the first triangleCount entries of triangleIds are
// indices into the scene's triangle array.
struct BvhNode
{
    static CONSTEXPR uint32 LeafCapacity = 7;

    Vec3f bboxMin;
    Vec3f bboxMax;
    uint32 child1;
    uint32 child2;
    uint32 triangleCount;
    uint32 triangleIds[LeafCapacity];

    bool isLeaf() const
    {
        return triangleCount > 0;
    }

    Box3f bbox() const
    {
        return Box3f(bboxMin, bboxMax);
    }

    static BvhNode interior(const Box3f &box, uint32 child1, uint32 child2);
    static BvhNode leaf(const Box3f &box, const uint32 *ids, uint32 count);

    bool operator==(const BvhNode &o) const;
    bool operator!=(const BvhNode &o) const
    {
        return !(*this == o);
    }
};

#ifndef _MSC_VER
static_assert(std::is_pod<BvhNode>::value, "BvhNode needs to be of POD type!");
#endif

}

}

#endif /* BVHNODE_HPP_ */
