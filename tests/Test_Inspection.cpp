#include <gtest/gtest.h>
#include <cstddef>
#include <limits>
#include <string>

#include <glm/glm.hpp>

import Core.Error;
import Core.Logging;
import Geometry;
import Folding;

#include "TestMeshBuilders.h"

using namespace Folding;

// =============================================================================
// Consistency
// =============================================================================

TEST(Inspection_Consistency, FreshStarPasses)
{
    const auto mesh = BuildExampleStar("icosahedron");
    EXPECT_TRUE(CheckConsistency(mesh, Tolerances{}).has_value());
    EXPECT_LT(MaxPeerLengthDrift(mesh), 1e-12);
}

TEST(Inspection_Consistency, BoundaryWithoutPeersFails)
{
    const auto mesh = MakeDominoSheet();
    auto ok = CheckConsistency(mesh, Tolerances{});
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().Code, Core::ErrorCode::PeerMismatch);
    EXPECT_NE(ok.error().Message.find("has no peer"), std::string::npos);
}

TEST(Inspection_Consistency, WarpedFaceFails)
{
    auto mesh = BuildExampleStar("icosahedron");
    mesh.Position(*mesh.FindVertex("b")).z = 0.3;

    auto ok = CheckConsistency(mesh, Tolerances{});
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().Code, Core::ErrorCode::NotFlat);
    EXPECT_NE(ok.error().Message.find("face star is not flat"), std::string::npos);
}

TEST(Inspection_Consistency, NonFinitePositionFails)
{
    auto mesh = BuildExampleStar("icosahedron");
    mesh.Position(*mesh.FindVertex("c")).y = std::numeric_limits<double>::quiet_NaN();

    auto ok = CheckConsistency(mesh, Tolerances{});
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().Code, Core::ErrorCode::DegenerateGeometry);
    EXPECT_NE(ok.error().Message.find("vertex c has a non-finite position"), std::string::npos);
}

TEST(Inspection_Consistency, PeerLengthsMustAgree)
{
    // Pull tip b 0.1 further out along [a^b] -> b: one side of its notch
    // grows by 0.1, the other by about 0.05.
    auto mesh = BuildExampleStar("icosahedron");
    const glm::dvec3 from = PositionOf(mesh, "[a^b]");
    glm::dvec3& b = mesh.Position(*mesh.FindVertex("b"));
    b += 0.1 * glm::normalize(b - from);

    EXPECT_NEAR(MaxPeerLengthDrift(mesh), 0.0479, 1e-3);

    auto strict = CheckConsistency(mesh, Tolerances{});
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().Code, Core::ErrorCode::PeerMismatch);
    EXPECT_NE(strict.error().Message.find("peer lengths differ"), std::string::npos);

    Tolerances loose;
    loose.PeerLength = 0.1;
    EXPECT_TRUE(CheckConsistency(mesh, loose).has_value());
}

TEST(Inspection_Consistency, ClearedPeerIsReported)
{
    auto mesh = BuildExampleStar("icosahedron");
    mesh.ClearPeer(mesh.PeeredHalfedges().front());

    auto ok = CheckConsistency(mesh, Tolerances{});
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().Code, Core::ErrorCode::PeerMismatch);
}

// =============================================================================
// Report
// =============================================================================

TEST(Inspection_Report, ListsLoopsCountsAndPeers)
{
    const auto mesh = BuildExampleStar("icosahedron");
    Core::Log::StringSink sink;
    ASSERT_TRUE(DescribeMesh(mesh, Tolerances{}, sink).has_value());

    EXPECT_TRUE(sink.Contains("loop star: "));
    EXPECT_TRUE(sink.Contains("loop boundary [boundary]: "));
    EXPECT_TRUE(sink.Contains("(22)"));
    EXPECT_TRUE(sink.Contains("vertex [k^a] #"));
    EXPECT_TRUE(sink.Contains("22 vertices (11 tips), 22 edges, 2 loops, 1 faces"));
    EXPECT_TRUE(sink.Contains("peers "));
    EXPECT_FALSE(sink.Contains("dihedral"));
    EXPECT_FALSE(sink.Contains("nearby"));
}

TEST(Inspection_Report, DihedralAngleOfBentHinge)
{
    auto mesh = BuildExampleStar("icosahedron");
    BendParams bend;
    bend.Angle = 0.5;
    bend.Path = {"a", "c"};
    ASSERT_TRUE(Bend(mesh, bend, Tolerances{}, Core::Log::DiscardSink()).has_value());

    Core::Log::StringSink sink;
    ASSERT_TRUE(DescribeMesh(mesh, Tolerances{}, sink).has_value());
    EXPECT_TRUE(sink.Contains("28.648 deg"));
}

TEST(Inspection_Report, NearbyVerticesAreListed)
{
    auto mesh = BuildExampleStar("icosahedron");
    mesh.Position(*mesh.FindVertex("b")) = PositionOf(mesh, "[a^b]") + glm::dvec3(1e-6, 0.0, 0.0);

    Core::Log::StringSink sink;
    ASSERT_TRUE(DescribeMesh(mesh, Tolerances{}, sink).has_value());
    EXPECT_TRUE(sink.Contains("nearby: "));
}

// =============================================================================
// Snapshot
// =============================================================================

TEST(Inspection_Snapshot, StarCounts)
{
    const auto mesh = BuildExampleStar("icosahedron");
    auto snapshot = TakeSnapshot(mesh);
    ASSERT_TRUE(snapshot.has_value());

    EXPECT_EQ(snapshot->Vertices.size(), 22u);
    EXPECT_EQ(snapshot->Edges.size(), 22u);
    EXPECT_EQ(snapshot->Loops.size(), 2u);
    EXPECT_EQ(snapshot->FaceCount(), 1u);
    EXPECT_EQ(snapshot->Boundary.size(), 22u);
    EXPECT_EQ(snapshot->Peers.size(), 11u);
}

TEST(Inspection_Snapshot, IndicesReferToVertices)
{
    const auto mesh = BuildExampleStar("thurston");
    auto snapshot = TakeSnapshot(mesh);
    ASSERT_TRUE(snapshot.has_value());

    for (const auto& [a, b] : snapshot->Peers)
    {
        ASSERT_LT(a.To, snapshot->Vertices.size());
        ASSERT_LT(b.To, snapshot->Vertices.size());
        // Peer halfedges meet head to tail at a star point.
        const std::size_t corner = a.To == b.From ? a.To : b.To;
        EXPECT_TRUE(a.To == b.From || b.To == a.From);
        EXPECT_FALSE(IsTipName(snapshot->Vertices[corner].Name));
    }
    for (std::size_t v : snapshot->Boundary) EXPECT_LT(v, snapshot->Vertices.size());
}

TEST(Inspection_Snapshot, FormatHasSectionHeaders)
{
    const auto mesh = BuildExampleStar("icosahedron");
    auto snapshot = TakeSnapshot(mesh);
    ASSERT_TRUE(snapshot.has_value());

    const std::string text = FormatSnapshot(*snapshot);
    EXPECT_NE(text.find("vertices 22\n"), std::string::npos);
    EXPECT_NE(text.find("edges 22\n"), std::string::npos);
    EXPECT_NE(text.find("loops 2 (1 faces)\n"), std::string::npos);
    EXPECT_NE(text.find("  boundary [boundary]:"), std::string::npos);
    EXPECT_NE(text.find("peers 11\n"), std::string::npos);
}
