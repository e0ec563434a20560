#include <gtest/gtest.h>
#include <cstdint>
#include <format>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>

import Core;

// Tag types mirroring the mesh entity kinds
struct VertexTag {};
struct HalfedgeTag {};
struct FaceTag {};

using VertexHandle = Core::StrongHandle<VertexTag>;
using HalfedgeHandle = Core::StrongHandle<HalfedgeTag>;
using FaceHandle = Core::StrongHandle<FaceTag>;

// -----------------------------------------------------------------------------
// Basic Functionality
// -----------------------------------------------------------------------------

TEST(StrongHandle, DefaultConstructor_Invalid)
{
    VertexHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, VertexHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ParameterizedConstructor_Valid)
{
    VertexHandle h(42, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_TRUE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, 42u);
    EXPECT_EQ(h.Generation, 1u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    VertexHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Index, 0u);
}

// -----------------------------------------------------------------------------
// Comparison Operators
// -----------------------------------------------------------------------------

TEST(StrongHandle, Equality_SameValues)
{
    EXPECT_EQ(HalfedgeHandle(10, 5), HalfedgeHandle(10, 5));
}

TEST(StrongHandle, Equality_DifferentIndex)
{
    EXPECT_NE(HalfedgeHandle(10, 5), HalfedgeHandle(11, 5));
}

TEST(StrongHandle, Equality_DifferentGeneration)
{
    // A recycled slot must not compare equal to its previous occupant.
    EXPECT_NE(HalfedgeHandle(10, 5), HalfedgeHandle(10, 6));
}

TEST(StrongHandle, Ordering_SpaceshipOperator)
{
    FaceHandle h1(5, 1);
    FaceHandle h2(10, 1);
    FaceHandle h3(5, 2);

    // Index takes precedence in lexicographic comparison
    EXPECT_LT(h1, h2);
    EXPECT_LT(h1, h3);
}

// -----------------------------------------------------------------------------
// Hash Support (for unordered containers)
// -----------------------------------------------------------------------------

TEST(StrongHandle, Hashable_UnorderedSet)
{
    std::unordered_set<VertexHandle> handleSet;

    VertexHandle h1(1, 1);
    VertexHandle h2(2, 1);
    VertexHandle h3(1, 2);    // Same index, different generation
    VertexHandle h1Dup(1, 1); // Duplicate of h1

    handleSet.insert(h1);
    handleSet.insert(h2);
    handleSet.insert(h3);
    handleSet.insert(h1Dup);

    EXPECT_EQ(handleSet.size(), 3u);
    EXPECT_TRUE(handleSet.contains(h1));
    EXPECT_TRUE(handleSet.contains(h2));
    EXPECT_TRUE(handleSet.contains(h3));
}

TEST(StrongHandle, Hashable_UnorderedMap)
{
    std::unordered_map<FaceHandle, std::string> labels;

    FaceHandle f1(0, 1);
    FaceHandle f2(1, 1);

    labels[f1] = "Top";
    labels[f2] = "Bottom";

    EXPECT_EQ(labels[f1], "Top");
    EXPECT_EQ(labels[f2], "Bottom");

    labels[f1] = "Front";
    EXPECT_EQ(labels[f1], "Front");
    EXPECT_EQ(labels.size(), 2u);
}

TEST(StrongHandle, Hash_DifferentValuesProduceDifferentHashes)
{
    std::hash<VertexHandle> hasher;

    EXPECT_NE(hasher(VertexHandle(1, 1)), hasher(VertexHandle(2, 1)));
    EXPECT_NE(hasher(VertexHandle(1, 1)), hasher(VertexHandle(1, 2)));
}

// -----------------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------------

TEST(StrongHandle, Format_IndexAndGeneration)
{
    EXPECT_EQ(std::format("{}", HalfedgeHandle(7, 3)), "7#3");
    EXPECT_EQ(std::format("{}", HalfedgeHandle()), "<invalid>");
}

TEST(StrongHandle, Stream_IndexAndGeneration)
{
    std::ostringstream os;
    os << FaceHandle(12, 1) << ' ' << FaceHandle();
    EXPECT_EQ(os.str(), "12#1 <invalid>");
}

// -----------------------------------------------------------------------------
// Edge Cases
// -----------------------------------------------------------------------------

TEST(StrongHandle, MaxGeneration)
{
    VertexHandle h(0, std::numeric_limits<uint32_t>::max());
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Generation, std::numeric_limits<uint32_t>::max());
}

TEST(StrongHandle, MaxValidIndex)
{
    // INVALID_INDEX is max uint32, so max-1 should be valid
    VertexHandle h(VertexHandle::INVALID_INDEX - 1, 0);
    EXPECT_TRUE(h.IsValid());
}

TEST(StrongHandle, ConstexprDefaultConstruction)
{
    constexpr VertexHandle h;
    static_assert(!h.IsValid());
    EXPECT_FALSE(h.IsValid());
}

TEST(StrongHandle, ConstexprValueConstruction)
{
    constexpr VertexHandle h(100, 50);
    static_assert(h.IsValid());
    static_assert(h.Index == 100);
    static_assert(h.Generation == 50);
    EXPECT_TRUE(h.IsValid());
}

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------

TEST(ErrorCode, CategoriesFollowNumberedRanges)
{
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::Success), Core::ErrorCategory::None);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::NonManifoldEdge), Core::ErrorCategory::Input);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::UnresolvedBoundary), Core::ErrorCategory::Input);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::FlipRequiresTriangles), Core::ErrorCategory::TopologySafety);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::VertexStillReferenced), Core::ErrorCategory::TopologySafety);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::CorruptTopology), Core::ErrorCategory::InternalConsistency);
    EXPECT_EQ(Core::CategoryOf(Core::ErrorCode::InvalidArgument), Core::ErrorCategory::Generic);
}

TEST(ErrorCode, ToStringNamesEveryCode)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::NonManifoldEdge), "NonManifoldEdge");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::CollapseWouldCreateNonManifold),
              "CollapseWouldCreateNonManifold");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::DanglingHandle), "DanglingHandle");
}
