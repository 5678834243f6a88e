#include "TestUtils.hpp"

#include "bvh/BvhBuilder.hpp"

#include <tinyformat/tinyformat.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace Shrimpy;
using Shrimpy::Bvh::BvhBuilder;
using Shrimpy::Bvh::BvhNode;

static std::vector<uint32> identity(size_t n)
{
    std::vector<uint32> result(n);
    for (size_t i = 0; i < n; ++i)
        result[i] = uint32(i);
    return result;
}

// Checks the structural properties every build must satisfy. Returns an empty
// string on success
static std::string checkTree(const std::vector<BvhNode> &nodes, const std::vector<Triangle> &tris,
        uint32 maxLeafSize)
{
    std::vector<int> seen(tris.size(), 0);
    std::vector<int> parents(nodes.size(), 0);
    for (size_t i = 0; i < nodes.size(); ++i) {
        const BvhNode &n = nodes[i];
        if (n.isLeaf()) {
            if (n.triangleCount > maxLeafSize)
                return tfm::format("leaf %d holds %d triangles", i, n.triangleCount);
            if (n.child1 != 0 || n.child2 != 0)
                return tfm::format("leaf %d has non-zero children", i);
            for (uint32 t = 0; t < n.triangleCount; ++t) {
                uint32 id = n.triangleIds[t];
                if (id >= tris.size())
                    return tfm::format("leaf %d references triangle %d", i, id);
                seen[id]++;
                if (!n.bbox().contains(tris[id].bounds()))
                    return tfm::format("triangle %d sticks out of leaf %d", id, i);
            }
            for (uint32 t = n.triangleCount; t < BvhNode::LeafCapacity; ++t)
                if (n.triangleIds[t] != 0)
                    return tfm::format("unused id slot %d of leaf %d is not zero", t, i);
        } else {
            for (uint32 id : n.triangleIds)
                if (id != 0)
                    return tfm::format("interior node %d has triangle ids", i);
            const uint32 children[] = {n.child1, n.child2};
            for (uint32 c : children) {
                if (c <= i || c >= nodes.size())
                    return tfm::format("node %d has child %d stored out of order", i, c);
                parents[c]++;
                Box3f parent = n.bbox();
                parent.min() = parent.min() - 0.0101f;
                parent.max() = parent.max() + 0.0101f;
                if (!parent.contains(nodes[c].bbox()))
                    return tfm::format("child %d not inside parent %d", c, i);
            }

            // The parent box is the union of its children, up to the thin-axis padding
            Box3f children12 = nodes[n.child1].bbox();
            children12.grow(nodes[n.child2].bbox());
            for (int axis = 0; axis < 3; ++axis) {
                if (std::abs(n.bboxMin[axis] - children12.min()[axis]) > 0.0101f ||
                        std::abs(n.bboxMax[axis] - children12.max()[axis]) > 0.0101f)
                    return tfm::format("node %d box %s is not the union %s of its children",
                            i, n.bbox(), children12);
            }
        }
        for (int axis = 0; axis < 3; ++axis)
            if (n.bboxMax[axis] - n.bboxMin[axis] < 1e-4f)
                return tfm::format("node %d is flat along axis %d", i, axis);
    }
    for (size_t i = 0; i < tris.size(); ++i)
        if (seen[i] != 1)
            return tfm::format("triangle %d appears in %d leaves", i, seen[i]);
    for (size_t i = 1; i < nodes.size(); ++i)
        if (parents[i] != 1)
            return tfm::format("node %d has %d parents", i, parents[i]);
    return std::string();
}

int main()
{
    // A single triangle becomes a single leaf, padded along the flat z axis
    {
        std::vector<Triangle> tris{Triangle(Vec3f(0.0f, 0.0f, 0.0f), Vec3f(1.0f, 0.0f, 0.0f),
                Vec3f(0.0f, 1.0f, 0.0f), 0)};
        std::vector<uint32> indices = identity(1);
        BvhBuilder builder;
        uint32 root = builder.build(tris, indices);
        const std::vector<BvhNode> &nodes = builder.nodes();
        if (root != 0 || nodes.size() != 1) {
            std::cerr << "Single triangle: expected one node at index 0, got " << nodes.size() << "\n";
            return 1;
        }
        const BvhNode &n = nodes[0];
        if (n.bboxMin != Vec3f(0.0f, 0.0f, -0.01f) || n.bboxMax != Vec3f(1.0f, 1.0f, 0.01f)) {
            std::cerr << "Single triangle: unexpected box " << n.bboxMin << " - " << n.bboxMax << "\n";
            return 1;
        }
        if (n.triangleCount != 1 || n.triangleIds[0] != 0 || n.child1 != 0 || n.child2 != 0) {
            std::cerr << "Single triangle: leaf contents wrong\n";
            return 1;
        }
    }

    // Ten triangles: one root and two leaves of five
    {
        std::vector<Triangle> tris = triangleRow(10);
        std::vector<uint32> indices = identity(tris.size());
        BvhBuilder builder;
        builder.build(tris, indices);
        const std::vector<BvhNode> &nodes = builder.nodes();
        if (nodes.size() != 3 || nodes[0].isLeaf() || nodes[0].child1 != 1 || nodes[0].child2 != 2) {
            std::cerr << "Ten triangles: expected root with children 1 and 2, got " << nodes.size() << " nodes\n";
            return 1;
        }
        if (nodes[1].triangleCount != 5 || nodes[2].triangleCount != 5) {
            std::cerr << "Ten triangles: leaves hold " << nodes[1].triangleCount << " and "
                      << nodes[2].triangleCount << "\n";
            return 1;
        }
        // Split along x: the left leaf gets the five leftmost triangles
        for (uint32 t = 0; t < 5; ++t) {
            if (nodes[1].triangleIds[t] != t || nodes[2].triangleIds[t] != t + 5) {
                std::cerr << "Ten triangles: leaves not partitioned along x\n";
                return 1;
            }
        }
        std::string err = checkTree(nodes, tris, 7);
        if (!err.empty()) {
            std::cerr << "Ten triangles: " << err << "\n";
            return 1;
        }
        if (builder.stats().nodeCount != 3 || builder.stats().leafCount != 2 || builder.stats().depth != 2) {
            std::cerr << "Ten triangles: unexpected stats\n";
            return 1;
        }

        // A root box larger than its children's union must be rejected
        std::vector<BvhNode> loose = nodes;
        loose[0].bboxMax[0] += 0.5f;
        if (checkTree(loose, tris, 7).empty()) {
            std::cerr << "Ten triangles: oversized root box went unnoticed\n";
            return 1;
        }
    }

    // Exactly seven triangles still fit a single leaf, eight do not
    {
        std::vector<Triangle> seven = triangleRow(7);
        std::vector<uint32> indices = identity(7);
        BvhBuilder builder;
        builder.build(seven, indices);
        if (builder.nodes().size() != 1 || builder.nodes()[0].triangleCount != 7) {
            std::cerr << "Seven triangles should produce a single full leaf\n";
            return 1;
        }
        std::vector<Triangle> eight = triangleRow(8);
        indices = identity(8);
        builder.build(eight, indices);
        if (builder.nodes().size() != 3) {
            std::cerr << "Eight triangles should split once, got " << builder.nodes().size() << " nodes\n";
            return 1;
        }
    }

    // Random soup: structural properties and determinism
    {
        std::vector<Triangle> tris = randomTriangles(200, 1234);
        std::vector<uint32> indicesA = identity(tris.size());
        std::vector<uint32> indicesB = identity(tris.size());
        BvhBuilder a, b;
        a.build(tris, indicesA);
        b.build(tris, indicesB);

        std::string err = checkTree(a.nodes(), tris, 7);
        if (!err.empty()) {
            std::cerr << "Random soup: " << err << "\n";
            return 1;
        }
        if (a.nodes() != b.nodes() || indicesA != indicesB) {
            std::cerr << "Random soup: two builds over the same input differ\n";
            return 1;
        }
        if (a.stats().nodeCount != a.nodes().size()) {
            std::cerr << "Random soup: stats disagree with node array\n";
            return 1;
        }

        // Rebuilding discards the previous tree entirely
        std::vector<Triangle> small = triangleRow(3);
        std::vector<uint32> smallIndices = identity(3);
        a.build(small, smallIndices);
        if (a.nodes().size() != 1) {
            std::cerr << "Rebuild kept nodes from the previous tree\n";
            return 1;
        }
    }

    // Coplanar geometry: every node keeps a non-zero thickness
    {
        std::vector<Triangle> tris;
        TestRng rng(7);
        for (int i = 0; i < 60; ++i) {
            float x = rng.next()*10.0f, y = rng.next()*10.0f;
            tris.emplace_back(Vec3f(x, y, 2.0f), Vec3f(x + 0.5f, y, 2.0f), Vec3f(x, y + 0.5f, 2.0f), 0);
        }
        std::vector<uint32> indices = identity(tris.size());
        BvhBuilder builder;
        builder.build(tris, indices);
        std::string err = checkTree(builder.nodes(), tris, 7);
        if (!err.empty()) {
            std::cerr << "Coplanar: " << err << "\n";
            return 1;
        }
    }

    // Coincident centroids are ordered by triangle index
    {
        std::vector<Triangle> tris(12, Triangle(Vec3f(0.0f, 0.0f, 0.0f), Vec3f(2.0f, 0.0f, 0.0f),
                Vec3f(0.0f, 1.0f, 0.0f), 0));
        std::vector<uint32> indices = identity(tris.size());
        std::reverse(indices.begin(), indices.end());
        BvhBuilder builder;
        builder.build(tris, indices);
        if (indices != identity(tris.size())) {
            std::cerr << "Coincident centroids: ties not broken by triangle index\n";
            return 1;
        }
    }

    // Leaf size of one
    {
        std::vector<Triangle> tris = triangleRow(4);
        std::vector<uint32> indices = identity(4);
        BvhBuilder builder(1);
        builder.build(tris, indices);
        std::string err = checkTree(builder.nodes(), tris, 1);
        if (builder.nodes().size() != 7 || !err.empty()) {
            std::cerr << "Leaf size one: expected 7 nodes, got " << builder.nodes().size() << " " << err << "\n";
            return 1;
        }
    }

    // NaN vertices must not break the build
    {
        std::vector<Triangle> tris = triangleRow(10);
        float nan = std::numeric_limits<float>::quiet_NaN();
        tris[4].v1 = Vec3f(nan, nan, nan);
        std::vector<uint32> indices = identity(tris.size());
        BvhBuilder builder;
        builder.build(tris, indices);
        std::vector<int> seen(tris.size(), 0);
        for (const BvhNode &n : builder.nodes())
            for (uint32 t = 0; t < n.triangleCount; ++t)
                seen[n.triangleIds[t]]++;
        for (size_t i = 0; i < seen.size(); ++i) {
            if (seen[i] != 1) {
                std::cerr << "NaN geometry: triangle " << i << " referenced " << seen[i] << " times\n";
                return 1;
            }
        }
    }

    // Invalid input is rejected
    {
        std::vector<Triangle> tris;
        std::vector<uint32> indices;
        BvhBuilder builder;
        bool threw = false;
        try {
            builder.build(tris, indices);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Empty build did not throw\n";
            return 1;
        }
    }

    std::cout << "test_bvh passed\n";
    return 0;
}
