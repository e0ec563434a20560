#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::Halfedge;

namespace
{
    void ExpectLinkInvariants(const Mesh& mesh)
    {
        for (const HalfedgeHandle h : mesh.Halfedges().Handles())
        {
            EXPECT_EQ(mesh.TwinHalfedge(mesh.TwinHalfedge(h)), h);
            EXPECT_EQ(mesh.NextHalfedge(mesh.PrevHalfedge(h)), h);
            EXPECT_EQ(mesh.PrevHalfedge(mesh.NextHalfedge(h)), h);
            EXPECT_EQ(mesh.FromVertex(mesh.NextHalfedge(h)), mesh.ToVertex(h));
        }
    }

    std::vector<std::size_t> FaceSizes(const PolygonSoup& soup)
    {
        std::vector<std::size_t> sizes;
        for (const auto& f : soup.Faces) sizes.push_back(f.size());
        return sizes;
    }
}

// =============================================================================
// Successful builds
// =============================================================================

TEST(MeshBuilder_Build, SingleTriangleCounts)
{
    auto mesh = MakeSingleTriangle();

    EXPECT_EQ(mesh.FaceCount(), 1u);
    EXPECT_EQ(mesh.VertexCount(), 3u);
    EXPECT_EQ(mesh.EdgeCount(), 3u);
    EXPECT_EQ(mesh.HalfedgeCount(), 6u);

    std::size_t boundary = 0;
    for (const HalfedgeHandle h : mesh.Halfedges().Handles())
        if (mesh.IsBoundary(h)) ++boundary;
    EXPECT_EQ(boundary, 3u);

    const FaceHandle f = FaceAt(mesh, 0);
    auto cycle = Collect(FaceHalfedges(mesh, f));
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(cycle->size(), 3u);

    ExpectLinkInvariants(mesh);
    EXPECT_TRUE(ValidateTopology(mesh).has_value());
}

TEST(MeshBuilder_Build, CubeSatisfiesEuler)
{
    auto mesh = MakeCube();

    EXPECT_EQ(mesh.VertexCount(), 8u);
    EXPECT_EQ(mesh.EdgeCount(), 12u);
    EXPECT_EQ(mesh.FaceCount(), 6u);
    EXPECT_EQ(mesh.EulerCharacteristic(), 2);

    for (const VertexHandle v : mesh.Vertices().Handles())
    {
        EXPECT_FALSE(mesh.IsBoundary(v));
        EXPECT_EQ(mesh.Valence(v), 3u);
    }
    for (const FaceHandle f : mesh.Faces().Handles()) EXPECT_EQ(mesh.Valence(f), 4u);

    ExpectLinkInvariants(mesh);
    EXPECT_TRUE(ValidateTopology(mesh).has_value());
}

TEST(MeshBuilder_Build, IcosahedronCounts)
{
    auto mesh = MakeIcosahedron();

    EXPECT_EQ(mesh.VertexCount(), 12u);
    EXPECT_EQ(mesh.EdgeCount(), 30u);
    EXPECT_EQ(mesh.FaceCount(), 20u);
    EXPECT_EQ(mesh.EulerCharacteristic(), 2);

    for (const VertexHandle v : mesh.Vertices().Handles()) EXPECT_EQ(mesh.Valence(v), 5u);

    ExpectLinkInvariants(mesh);
}

TEST(MeshBuilder_Build, OriginalSolidsAreClosed)
{
    const glm::vec3 apex{0, 1, 0};
    auto tet = BuildOrFail(TetrahedronSoup(apex, {-1, 0, 1}, {1, 0, 1}, {0, 0, -1}));
    EXPECT_EQ(tet.VertexCount(), 4u);
    EXPECT_EQ(tet.EdgeCount(), 6u);
    EXPECT_EQ(tet.EulerCharacteristic(), 2);

    auto octa = BuildOrFail(OctahedronSoup(apex, {-1, 0, 1}, {1, 0, 1}, {-1, 0, -1}, {1, 0, -1}, {0, -1, 0}));
    EXPECT_EQ(octa.VertexCount(), 6u);
    EXPECT_EQ(octa.EdgeCount(), 12u);
    EXPECT_EQ(octa.FaceCount(), 8u);
    EXPECT_EQ(octa.EulerCharacteristic(), 2);
    EXPECT_TRUE(ValidateTopology(octa).has_value());
}

TEST(MeshBuilder_Build, BoundaryVerticesPreferBoundaryOutgoing)
{
    auto mesh = MakeFan();

    for (const VertexHandle v : mesh.Vertices().Handles())
    {
        const auto h = mesh.Halfedge(v);
        ASSERT_TRUE(h.has_value());
        if (v == VertexAt(mesh, 4))
        {
            EXPECT_FALSE(mesh.IsBoundary(v));
            EXPECT_EQ(mesh.Valence(v), 4u);
        }
        else
        {
            EXPECT_TRUE(mesh.IsBoundary(*h));
            EXPECT_TRUE(mesh.IsBoundary(v));
        }
    }
}

TEST(MeshBuilder_Build, UnreferencedPositionsBecomeIsolatedVertices)
{
    auto soup = SingleTriangleSoup();
    soup.Positions.push_back({5.0f, 5.0f, 5.0f});

    auto mesh = BuildOrFail(soup);
    EXPECT_EQ(mesh.VertexCount(), 4u);

    const VertexHandle lone = VertexAt(mesh, 3);
    EXPECT_TRUE(mesh.IsIsolated(lone));
    EXPECT_TRUE(mesh.IsBoundary(lone));
    EXPECT_EQ(mesh.Valence(lone), 0u);
}

TEST(MeshBuilder_Build, EmptySoupYieldsEmptyMesh)
{
    auto mesh = BuildMesh(PolygonSoup{});
    ASSERT_TRUE(mesh.has_value());
    EXPECT_TRUE(mesh->IsEmpty());
    EXPECT_EQ(mesh->HalfedgeCount(), 0u);
}

// =============================================================================
// Face attributes
// =============================================================================

TEST(MeshBuilder_Attributes, ComputedByDefault)
{
    auto mesh = MakeSingleTriangle();
    const auto attr = mesh.FaceAttributesOf(FaceAt(mesh, 0));
    ASSERT_TRUE(attr.has_value());

    EXPECT_NEAR(attr->Normal.z, 1.0f, 1e-6f);
    EXPECT_NEAR(attr->Centroid.x, 1.0f / 3.0f, 1e-6f);
    EXPECT_NEAR(attr->Centroid.y, 1.0f / 3.0f, 1e-6f);
}

TEST(MeshBuilder_Attributes, SkippedWhenDisabled)
{
    auto mesh = BuildOrFail(SingleTriangleSoup(), BuildParams{.ComputeFaceAttributes = false});
    EXPECT_FALSE(mesh.FaceAttributesOf(FaceAt(mesh, 0)).has_value());

    // Geometry queries still work from positions.
    EXPECT_NEAR(mesh.FaceSignedDistance(FaceAt(mesh, 0), {0.2f, 0.2f, 2.0f}), 2.0f, 1e-6f);
}

TEST(MeshBuilder_Attributes, ManualRefreshAfterDeferredBuild)
{
    auto mesh = BuildOrFail(CubeSoup(1.0f), BuildParams{.ComputeFaceAttributes = false});
    for (const FaceHandle f : mesh.Faces().Handles()) EXPECT_FALSE(mesh.FaceAttributesOf(f).has_value());

    mesh.UpdateAllFaceAttributes();
    for (const FaceHandle f : mesh.Faces().Handles())
    {
        const auto attr = mesh.FaceAttributesOf(f);
        ASSERT_TRUE(attr.has_value());
        const glm::vec3 n = mesh.ComputeFaceNormal(f);
        const glm::vec3 c = mesh.ComputeFaceCentroid(f);
        EXPECT_NEAR(glm::dot(attr->Normal, n), 1.0f, 1e-5f);
        EXPECT_NEAR(glm::length(attr->Centroid - c), 0.0f, 1e-6f);
    }

    // Moving a vertex leaves the cache stale until the next refresh.
    const FaceHandle top = FaceAt(mesh, 1);
    const glm::vec3 before = mesh.FaceAttributesOf(top)->Centroid;
    mesh.Position(VertexAt(mesh, 7)) += glm::vec3(0.0f, 0.0f, 4.0f);
    EXPECT_NEAR(glm::length(mesh.FaceAttributesOf(top)->Centroid - before), 0.0f, 1e-6f);

    mesh.UpdateAllFaceAttributes();
    EXPECT_NEAR(mesh.FaceAttributesOf(top)->Centroid.z, 2.0f, 1e-5f);
}

TEST(MeshBuilder_Attributes, DistanceAndVisibility)
{
    auto mesh = MakeSingleTriangle();
    const FaceHandle f = FaceAt(mesh, 0);

    EXPECT_NEAR(mesh.FaceDistance(f, {0.2f, 0.2f, -2.0f}), 2.0f, 1e-6f);
    EXPECT_NEAR(mesh.FaceSignedDistance(f, {0.2f, 0.2f, -2.0f}), -2.0f, 1e-6f);

    EXPECT_TRUE(mesh.CanFaceSee(f, {0.0f, 0.0f, 1.0f}));
    EXPECT_FALSE(mesh.CanFaceSee(f, {0.0f, 0.0f, -1.0f}));
    EXPECT_FALSE(mesh.CanFaceSee(f, {0.5f, 0.5f, 0.0f}));
}

TEST(MeshBuilder_Attributes, CubeNormalsPointOutward)
{
    auto mesh = MakeCube();
    for (const FaceHandle f : mesh.Faces().Handles())
    {
        const glm::vec3 n = mesh.ComputeFaceNormal(f);
        const glm::vec3 c = mesh.ComputeFaceCentroid(f);
        EXPECT_NEAR(glm::length(n), 1.0f, 1e-5f);
        EXPECT_GT(glm::dot(n, c), 0.0f);
    }
}

// =============================================================================
// Rejected input
// =============================================================================

TEST(MeshBuilder_Reject, ThreeFacesOnOneEdge)
{
    PolygonSoup soup;
    soup.Positions = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, -1, 0}, {0, 0, 1}};
    soup.Faces = {{0, 1, 2}, {1, 0, 3}, {0, 1, 4}};

    auto mesh = BuildMesh(soup);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::NonManifoldEdge);
}

TEST(MeshBuilder_Reject, InconsistentOrientation)
{
    PolygonSoup soup;
    soup.Positions = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, -1, 0}};
    soup.Faces = {{0, 1, 2}, {0, 1, 3}};

    auto mesh = BuildMesh(soup);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::NonManifoldEdge);
}

TEST(MeshBuilder_Reject, DegenerateFaces)
{
    PolygonSoup tooSmall;
    tooSmall.Positions = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
    tooSmall.Faces = {{0, 1}};

    auto a = BuildMesh(tooSmall);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error(), Core::ErrorCode::DegenerateFace);

    PolygonSoup repeated = tooSmall;
    repeated.Faces = {{0, 1, 1}};

    auto b = BuildMesh(repeated);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error(), Core::ErrorCode::DegenerateFace);
}

TEST(MeshBuilder_Reject, IndexOutOfRange)
{
    PolygonSoup soup;
    soup.Positions = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
    soup.Faces = {{0, 1, 7}};

    auto mesh = BuildMesh(soup);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::VertexIndexOutOfRange);
}

TEST(MeshBuilder_Reject, OpenBowtieHasTwoBoundaryGaps)
{
    PolygonSoup soup;
    soup.Positions = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {-1, 0, 0}, {-1, -1, 0}};
    soup.Faces = {{0, 1, 2}, {0, 3, 4}};

    auto mesh = BuildMesh(soup);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::UnresolvedBoundary);
}

TEST(MeshBuilder_Reject, ClosedSurfacesTouchingAtAVertex)
{
    // Two tetrahedra sharing vertex 0 only.
    PolygonSoup soup;
    soup.Positions = {{0, 0, 0},  {1, 0, 0},  {0, 1, 0},  {0, 0, 1},
                      {-1, 0, 0}, {0, -1, 0}, {0, 0, -1}};
    soup.Faces = {{0, 1, 2}, {0, 2, 3}, {0, 3, 1}, {1, 3, 2},
                  {0, 4, 5}, {0, 5, 6}, {0, 6, 4}, {4, 6, 5}};

    auto mesh = BuildMesh(soup);
    ASSERT_FALSE(mesh.has_value());
    EXPECT_EQ(mesh.error(), Core::ErrorCode::NonManifoldVertex);
}

// =============================================================================
// Export
// =============================================================================

TEST(MeshBuilder_Export, FreshBuildExportsInputVerbatim)
{
    const PolygonSoup input = CubeSoup(0.5f);
    auto mesh = BuildOrFail(input);

    auto soup = ToPolygonSoup(mesh);
    ASSERT_TRUE(soup.has_value());
    EXPECT_EQ(soup->Positions, input.Positions);
    EXPECT_EQ(soup->Faces, input.Faces);
}

TEST(MeshBuilder_Export, RoundTripIsIdempotent)
{
    auto mesh = MakeIcosahedron();

    // Edit first so the stores contain freed slots.
    const HalfedgeHandle h = *mesh.Halfedge(FaceAt(mesh, 0));
    ASSERT_TRUE(mesh.CollapseEdge(h).has_value());

    auto first = ToPolygonSoup(mesh);
    ASSERT_TRUE(first.has_value());

    auto rebuilt = BuildMesh(*first);
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(rebuilt->VertexCount(), mesh.VertexCount());
    EXPECT_EQ(rebuilt->FaceCount(), mesh.FaceCount());

    auto second = ToPolygonSoup(*rebuilt);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(FaceSizes(*second), FaceSizes(*first));
    EXPECT_EQ(second->Faces, first->Faces);
}
