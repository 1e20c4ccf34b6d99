#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <glm/glm.hpp>

import Core.Error;
import Core.Logging;
import Geometry;
import Folding;

#include "TestMeshBuilders.h"

using Geometry::Halfedge::Mesh;
using Geometry::Halfedge::SplitSide;

namespace
{
    Mesh MakeUnitSquareSheet()
    {
        const std::vector<glm::dvec3> corners{
            {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {1.0, 1.0, 0.0}, {0.0, 1.0, 0.0}};
        return MakePolygonSheet(corners);
    }

    Geometry::HalfedgeHandle Between(const Mesh& mesh, const char* from, const char* to)
    {
        auto h = mesh.FindHalfedge(*mesh.FindVertex(from), *mesh.FindVertex(to));
        EXPECT_TRUE(h.has_value()) << from << " -> " << to;
        return h.value_or(Geometry::HalfedgeHandle{});
    }
}

// =============================================================================
// Core seed
// =============================================================================

TEST(HalfedgeKernel_Core, AddCoreCreatesSelfLoop)
{
    Mesh mesh;
    auto core = mesh.AddCore();
    ASSERT_TRUE(core.has_value());

    EXPECT_EQ(mesh.VertexCount(), 1u);
    EXPECT_EQ(mesh.EdgeCount(), 1u);
    EXPECT_EQ(mesh.LoopCount(), 2u);

    EXPECT_EQ(mesh.NextHalfedge(core->First), core->First);
    EXPECT_EQ(mesh.NextHalfedge(core->Second), core->Second);
    EXPECT_EQ(mesh.OppositeHalfedge(core->First), core->Second);
    EXPECT_NE(mesh.Loop(core->First), mesh.Loop(core->Second));
    EXPECT_EQ(mesh.Name(mesh.ToVertex(core->First)), "core");
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Core, DropCoreRemovesEverything)
{
    Mesh mesh;
    auto core = mesh.AddCore();
    ASSERT_TRUE(core.has_value());

    ASSERT_TRUE(mesh.DropCore(mesh.ToVertex(core->First)).has_value());
    EXPECT_EQ(mesh.VertexCount(), 0u);
    EXPECT_EQ(mesh.EdgeCount(), 0u);
    EXPECT_EQ(mesh.LoopCount(), 0u);
    EXPECT_FALSE(mesh.FindVertex("core").has_value());
}

TEST(HalfedgeKernel_Core, DropCoreRejectsOrdinaryVertex)
{
    Mesh mesh = MakeUnitSquareSheet();
    auto result = mesh.DropCore(*mesh.FindVertex("v0"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::TopologyViolation);
}

// =============================================================================
// Polygon sheets
// =============================================================================

TEST(HalfedgeKernel_Sheet, SquareSheetCounts)
{
    Mesh mesh = MakeUnitSquareSheet();

    EXPECT_EQ(mesh.VertexCount(), 4u);
    EXPECT_EQ(mesh.EdgeCount(), 4u);
    EXPECT_EQ(mesh.LoopCount(), 2u);
    EXPECT_EQ(mesh.FaceCount(), 1u);
    EXPECT_TRUE(mesh.HasBoundary());

    EXPECT_EQ(mesh.Valence(*mesh.FindLoop("face")).value(), 4u);
    EXPECT_EQ(mesh.Valence(mesh.BoundaryLoop()).value(), 4u);
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Sheet, FaceWalkMatchesCornerOrder)
{
    Mesh mesh = MakeUnitSquareSheet();
    EXPECT_EQ(LoopCycle(mesh, "face", "v0"), (std::vector<std::string>{"v0", "v1", "v2", "v3"}));
    EXPECT_EQ(LoopCycle(mesh, "boundary", "v0"), (std::vector<std::string>{"v0", "v3", "v2", "v1"}));

    const glm::dvec3 n = LoopNormal(mesh, "face");
    EXPECT_NEAR(n.z, 1.0, 1e-12);
}

TEST(HalfedgeKernel_Sheet, VertexValenceAndOutgoing)
{
    Mesh mesh = MakeDominoSheet();
    auto outgoing = mesh.OutgoingHalfedges(*mesh.FindVertex("v1"));
    ASSERT_TRUE(outgoing.has_value());
    EXPECT_EQ(outgoing->size(), 2u);

    for (Geometry::HalfedgeHandle h : *outgoing)
    {
        EXPECT_EQ(mesh.Name(mesh.FromVertex(h)), "v1");
    }
}

// =============================================================================
// Names
// =============================================================================

TEST(HalfedgeKernel_Names, RenameVertexRejectsTakenName)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto v1 = *mesh.FindVertex("v1");

    auto clash = mesh.RenameVertex(v1, "v2");
    ASSERT_FALSE(clash.has_value());
    EXPECT_EQ(clash.error().Code, Core::ErrorCode::DuplicateName);
    EXPECT_EQ(mesh.Name(v1), "v1");

    EXPECT_TRUE(mesh.RenameVertex(v1, "v1").has_value());
    EXPECT_TRUE(mesh.RenameVertex(v1, "corner").has_value());
    EXPECT_FALSE(mesh.FindVertex("v1").has_value());
    EXPECT_EQ(mesh.FindVertex("corner"), v1);
}

TEST(HalfedgeKernel_Names, MakeVertexRejectsTakenName)
{
    Mesh mesh = MakeUnitSquareSheet();
    auto result = mesh.MakeVertex("v3");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::DuplicateName);
}

TEST(HalfedgeKernel_Names, LoopNameCollisionGetsSuffix)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto face = *mesh.FindLoop("face");
    mesh.RenameLoop(face, "boundary");
    EXPECT_EQ(mesh.Name(face), "boundary#1");
    EXPECT_EQ(mesh.FindLoop("boundary#1"), face);
    EXPECT_TRUE(mesh.Check().has_value());
}

// =============================================================================
// Split / contract / drop
// =============================================================================

TEST(HalfedgeKernel_Split, SplitLoopCutsDominoIntoSquares)
{
    Mesh mesh = MakeDominoSheet();
    const auto intoV4 = Between(mesh, "v3", "v4");
    const auto intoV1 = Between(mesh, "v0", "v1");

    auto cut = mesh.SplitLoop(intoV4, intoV1, SplitSide::Left);
    ASSERT_TRUE(cut.has_value());

    EXPECT_EQ(mesh.LoopCount(), 3u);
    EXPECT_EQ(mesh.EdgeCount(), 7u);
    EXPECT_EQ(mesh.Name(mesh.FromVertex(cut->First)), "v4");
    EXPECT_EQ(mesh.Name(mesh.ToVertex(cut->First)), "v1");
    EXPECT_EQ(mesh.Name(mesh.Loop(cut->First)), "face.0");
    EXPECT_EQ(mesh.Name(mesh.Loop(cut->Second)), "face");

    EXPECT_EQ(LoopCycle(mesh, "face.0", "v1"), (std::vector<std::string>{"v1", "v2", "v3", "v4"}));
    EXPECT_EQ(LoopCycle(mesh, "face", "v4"), (std::vector<std::string>{"v4", "v5", "v0", "v1"}));
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Split, SplitLoopRejectsHalfedgesOfDifferentLoops)
{
    Mesh mesh = MakeDominoSheet();
    const auto inFace = Between(mesh, "v0", "v1");
    const auto inBoundary = mesh.OppositeHalfedge(inFace);

    auto cut = mesh.SplitLoop(inFace, inBoundary, SplitSide::Left);
    ASSERT_FALSE(cut.has_value());
    EXPECT_EQ(cut.error().Code, Core::ErrorCode::TopologyViolation);
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Split, SplitEdgeAcrossInsertsVertex)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto h = Between(mesh, "v0", "v1");

    auto split = mesh.SplitEdgeAcross(h);
    ASSERT_TRUE(split.has_value());

    EXPECT_EQ(mesh.VertexCount(), 5u);
    EXPECT_EQ(mesh.EdgeCount(), 5u);
    EXPECT_EQ(mesh.Valence(*mesh.FindLoop("face")).value(), 5u);
    EXPECT_EQ(mesh.Valence(mesh.BoundaryLoop()).value(), 5u);
    EXPECT_TRUE(mesh.FindVertex("v1.0").has_value());
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Split, SplitEdgeAlongAddsTwoSidedLoop)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto h = Between(mesh, "v0", "v1");

    auto split = mesh.SplitEdgeAlong(h);
    ASSERT_TRUE(split.has_value());

    EXPECT_EQ(mesh.LoopCount(), 3u);
    EXPECT_EQ(mesh.EdgeCount(), 5u);
    EXPECT_EQ(mesh.Name(mesh.Loop(h)), "face.0");
    EXPECT_EQ(mesh.Valence(*mesh.FindLoop("face.0")).value(), 2u);
    EXPECT_EQ(mesh.Valence(*mesh.FindLoop("face")).value(), 4u);
    EXPECT_EQ(mesh.Name(mesh.FromVertex(split->First)), "v1");
    EXPECT_EQ(mesh.Name(mesh.ToVertex(split->First)), "v0");
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Split, SplitVertexWithTakenChildNameLeavesMeshUntouched)
{
    Mesh mesh = MakeUnitSquareSheet();
    ASSERT_TRUE(mesh.RenameVertex(*mesh.FindVertex("v2"), "v0.1").has_value());
    const auto inFace = Between(mesh, "v3", "v0");
    const auto inBoundary = Between(mesh, "v1", "v0");

    auto split = mesh.SplitVertex(inFace, inBoundary, SplitSide::Both);
    ASSERT_FALSE(split.has_value());
    EXPECT_EQ(split.error().Code, Core::ErrorCode::DuplicateName);

    EXPECT_EQ(mesh.VertexCount(), 4u);
    EXPECT_EQ(mesh.EdgeCount(), 4u);
    EXPECT_FALSE(mesh.FindVertex("v0.0").has_value());
    EXPECT_EQ(mesh.Name(mesh.ToVertex(inFace)), "v0");
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Split, SplitVertexBothRetiresOriginal)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto inFace = Between(mesh, "v3", "v0");
    const auto inBoundary = Between(mesh, "v1", "v0");
    const glm::dvec3 origin = PositionOf(mesh, "v0");

    auto split = mesh.SplitVertex(inFace, inBoundary, SplitSide::Both);
    ASSERT_TRUE(split.has_value());

    EXPECT_FALSE(mesh.FindVertex("v0").has_value());
    EXPECT_EQ(mesh.VertexCount(), 5u);
    ExpectNear(PositionOf(mesh, "v0.0"), origin);
    ExpectNear(PositionOf(mesh, "v0.1"), origin);
    EXPECT_EQ(mesh.Name(mesh.FromVertex(split->First)), "v0.0");
    EXPECT_EQ(mesh.Name(mesh.ToVertex(split->First)), "v0.1");
    EXPECT_EQ(mesh.Loop(split->First), *mesh.FindLoop("face"));
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Contract, ContractEdgeMergesIntoFromVertex)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto h = Between(mesh, "v0", "v1");
    const auto v0 = *mesh.FindVertex("v0");

    auto survivor = mesh.ContractEdge(h);
    ASSERT_TRUE(survivor.has_value());
    EXPECT_EQ(*survivor, v0);

    EXPECT_EQ(mesh.VertexCount(), 3u);
    EXPECT_EQ(mesh.EdgeCount(), 3u);
    EXPECT_FALSE(mesh.FindVertex("v1").has_value());
    EXPECT_FALSE(mesh.IsLive(h));
    EXPECT_EQ(LoopCycle(mesh, "face", "v0"), (std::vector<std::string>{"v0", "v2", "v3"}));
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Contract, ContractSelfLoopFails)
{
    Mesh mesh;
    auto core = mesh.AddCore();
    ASSERT_TRUE(core.has_value());

    auto result = mesh.ContractEdge(core->First);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::TopologyViolation);
}

TEST(HalfedgeKernel_Drop, DropEdgeMergesSquaresBack)
{
    Mesh mesh = MakeDominoSheet();
    auto cut = mesh.SplitLoop(Between(mesh, "v3", "v4"), Between(mesh, "v0", "v1"), SplitSide::Left);
    ASSERT_TRUE(cut.has_value());

    auto merged = mesh.DropEdge(cut->First);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(*merged, *mesh.FindLoop("face"));
    EXPECT_FALSE(mesh.FindLoop("face.0").has_value());
    EXPECT_EQ(mesh.LoopCount(), 2u);
    EXPECT_EQ(mesh.Valence(*merged).value(), 6u);
    EXPECT_TRUE(mesh.Check().has_value());
}

TEST(HalfedgeKernel_Drop, DropDeadHalfedgeFails)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto h = Between(mesh, "v0", "v1");
    ASSERT_TRUE(mesh.ContractEdge(h).has_value());

    auto result = mesh.DropEdge(h);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::InvalidArgument);
}

TEST(HalfedgeKernel_Drop, DroppingTheBoundaryEdgeClosesTheSheet)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto onBoundary = mesh.OppositeHalfedge(Between(mesh, "v0", "v1"));
    ASSERT_TRUE(mesh.IsBoundary(onBoundary));

    ASSERT_TRUE(mesh.DropEdge(onBoundary).has_value());
    EXPECT_FALSE(mesh.HasBoundary());
    EXPECT_EQ(mesh.LoopCount(), 1u);
    EXPECT_EQ(mesh.FaceCount(), 1u);
}

TEST(HalfedgeKernel_Drop, DanglingEdgeIsRefused)
{
    // With v0-v1 gone the remaining edges form an open path v1-v2-v3-v0.
    Mesh mesh = MakeUnitSquareSheet();
    ASSERT_TRUE(mesh.DropEdge(mesh.OppositeHalfedge(Between(mesh, "v0", "v1"))).has_value());
    const auto dangling = Between(mesh, "v1", "v2");
    ASSERT_EQ(mesh.OutgoingHalfedges(*mesh.FindVertex("v1"))->size(), 1u);

    auto result = mesh.DropEdge(dangling);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::TopologyViolation);
    EXPECT_NE(result.error().Message.find("lie in loop face"), std::string::npos);
    EXPECT_EQ(mesh.EdgeCount(), 3u);
    EXPECT_TRUE(mesh.Check().has_value());
}

// =============================================================================
// Peers
// =============================================================================

TEST(HalfedgeKernel_Peers, SetPeersIsSymmetricAndOrdered)
{
    Mesh mesh = MakeUnitSquareSheet();
    const auto a = mesh.OppositeHalfedge(Between(mesh, "v0", "v1"));
    const auto b = mesh.OppositeHalfedge(Between(mesh, "v1", "v2"));
    const auto c = mesh.OppositeHalfedge(Between(mesh, "v2", "v3"));

    mesh.SetPeers(a, b);
    EXPECT_EQ(mesh.Peer(a), b);
    EXPECT_EQ(mesh.Peer(b), a);
    EXPECT_EQ(mesh.PeeredHalfedges(), (std::vector<Geometry::HalfedgeHandle>{a, b}));

    // Relinking a drops its old partner.
    mesh.SetPeers(a, c);
    EXPECT_FALSE(mesh.HasPeer(b));
    EXPECT_EQ(mesh.Peer(c), a);
    EXPECT_EQ(mesh.PeeredHalfedges(), (std::vector<Geometry::HalfedgeHandle>{a, c}));

    mesh.ClearPeer(c);
    EXPECT_FALSE(mesh.HasPeer(a));
    EXPECT_TRUE(mesh.PeeredHalfedges().empty());
}

// =============================================================================
// Copies and limits
// =============================================================================

TEST(HalfedgeKernel_Copy, CopyIsIndependent)
{
    Mesh original = MakeUnitSquareSheet();
    Mesh copy = original;

    const auto v2 = *copy.FindVertex("v2");
    copy.Position(v2) = glm::dvec3(5.0, 5.0, 5.0);
    ASSERT_TRUE(copy.RenameVertex(v2, "moved").has_value());
    ASSERT_TRUE(copy.ContractEdge(Between(copy, "v0", "v1")).has_value());

    ExpectNear(PositionOf(original, "v2"), glm::dvec3(1.0, 1.0, 0.0));
    EXPECT_EQ(original.VertexCount(), 4u);
    EXPECT_TRUE(original.Check().has_value());
    EXPECT_TRUE(copy.Check().has_value());
    EXPECT_EQ(copy.VertexCount(), 3u);
}

TEST(HalfedgeKernel_Limits, LoopWalkIsBounded)
{
    Mesh mesh = MakeDominoSheet();
    mesh.SetNeighborhoodLimit(4);

    auto walk = mesh.LoopHalfedges(*mesh.FindLoop("face"));
    ASSERT_FALSE(walk.has_value());
    EXPECT_EQ(walk.error().Code, Core::ErrorCode::NeighborhoodTooLarge);
}

TEST(HalfedgeKernel_Limits, FindHalfedgeRequiresUniqueMatch)
{
    Mesh mesh = MakeUnitSquareSheet();
    auto missing = mesh.FindHalfedge(*mesh.FindVertex("v0"), *mesh.FindVertex("v2"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().Code, Core::ErrorCode::NotUnique);
}
