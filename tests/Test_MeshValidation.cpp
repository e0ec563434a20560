#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::Halfedge;

TEST(MeshValidation, BuiltMeshesAreConsistent)
{
    const std::vector<PolygonSoup> soups{
        SingleTriangleSoup(), TwoTriangleSquareSoup(), FanSoup(), BipyramidSoup(),
        SubdividedTriangleSoup(), RegularTetrahedronSoup(), CubeSoup(1.0f), IcosahedronSoup()};

    for (const PolygonSoup& soup : soups)
    {
        auto mesh = BuildOrFail(soup);
        auto ok = ValidateTopology(mesh);
        EXPECT_TRUE(ok.has_value()) << Core::ErrorCodeToString(ok.error());
    }
}

TEST(MeshValidation, EmptyMeshIsValid)
{
    Mesh mesh;
    EXPECT_TRUE(ValidateTopology(mesh).has_value());

    (void)mesh.AddVertex({0.0f, 0.0f, 0.0f});
    EXPECT_TRUE(ValidateTopology(mesh).has_value());
}

TEST(MeshValidation, NeighborhoodSkipsDeadVertices)
{
    auto mesh = MakeFan();
    const VertexHandle center = VertexAt(mesh, 4);
    const VertexHandle corner = VertexAt(mesh, 0);

    const auto h = mesh.FindHalfedge(corner, center);
    ASSERT_TRUE(h.has_value());
    ASSERT_TRUE(mesh.CollapseEdge(*h).has_value());

    const VertexHandle touched[] = {corner, center};
    EXPECT_TRUE(ValidateNeighborhood(mesh, touched).has_value());
}

TEST(MeshValidation, ClearedMeshInvalidatesHandles)
{
    auto mesh = MakeCube();
    const VertexHandle v = VertexAt(mesh, 0);
    const FaceHandle f = FaceAt(mesh, 0);

    mesh.Clear();
    EXPECT_EQ(mesh.VertexCount(), 0u);
    EXPECT_EQ(mesh.FaceCount(), 0u);
    EXPECT_FALSE(mesh.IsValid(v));
    EXPECT_FALSE(mesh.IsValid(f));
    EXPECT_TRUE(ValidateTopology(mesh).has_value());
}

TEST(MeshValidation, EditSequenceStaysConsistent)
{
    auto mesh = MakeIcosahedron();

    // Refine, then coarsen back down while flipping along the way.
    for (int round = 0; round < 4; ++round)
    {
        const FaceHandle f = *mesh.Faces().Handles().begin();
        const HalfedgeHandle h = mesh.Halfedge(f);
        const glm::vec3 mid = (mesh.Position(mesh.FromVertex(h)) + mesh.Position(mesh.ToVertex(h))) * 0.5f;
        ASSERT_TRUE(mesh.SplitEdge(h, mid, SplitParams{.TriangulateAdjacentFaces = true}).has_value());
        ASSERT_TRUE(ValidateTopology(mesh).has_value());
    }
    EXPECT_EQ(mesh.VertexCount(), 16u);
    EXPECT_EQ(mesh.FaceCount(), 28u);

    std::size_t flips = 0;
    for (const HalfedgeHandle h : mesh.Halfedges().Handles())
    {
        if (flips == 5) break;
        if (!mesh.CanFlip(h)) continue;
        ASSERT_TRUE(mesh.FlipEdge(h).has_value());
        ++flips;
    }
    EXPECT_TRUE(ValidateTopology(mesh).has_value());

    std::size_t collapses = 0;
    bool progressed = true;
    while (collapses < 4 && progressed)
    {
        progressed = false;
        for (const HalfedgeHandle h : mesh.Halfedges().Handles())
        {
            if (!mesh.CanCollapse(h)) continue;
            ASSERT_TRUE(mesh.CollapseEdge(h).has_value());
            ++collapses;
            progressed = true;
            break;
        }
    }

    EXPECT_EQ(collapses, 4u);
    EXPECT_EQ(mesh.VertexCount(), 12u);
    EXPECT_EQ(mesh.FaceCount(), 20u);
    EXPECT_EQ(mesh.EulerCharacteristic(), 2);
    auto ok = ValidateTopology(mesh);
    EXPECT_TRUE(ok.has_value()) << Core::ErrorCodeToString(ok.error());
}

TEST(MeshValidation, LogLevelThreshold)
{
    const Core::Log::Level previous = Core::Log::GetLevel();

    Core::Log::SetLevel(Core::Log::Level::Error);
    EXPECT_FALSE(Core::Log::IsEnabled(Core::Log::Level::Warning));
    EXPECT_TRUE(Core::Log::IsEnabled(Core::Log::Level::Error));

    // Rejections still report their code with logging quieted.
    auto mesh = MakeTetrahedron();
    auto r = mesh.CollapseEdge(mesh.Halfedge(FaceAt(mesh, 0)));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), Core::ErrorCode::CollapseWouldCreateNonManifold);

    Core::Log::SetLevel(previous);
    EXPECT_EQ(Core::Log::GetLevel(), previous);
}
