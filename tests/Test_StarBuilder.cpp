#include <gtest/gtest.h>
#include <cmath>
#include <numbers>
#include <string>
#include <vector>

#include <glm/glm.hpp>

import Core.Error;
import Core.Logging;
import Geometry;
import Folding;

#include "TestMeshBuilders.h"

using namespace Folding;

namespace
{
    constexpr std::string_view kIcosahedronStar = R"(
a 9 8
b 7
c 6
d 5
e 4
f 3
g 2
h 1
i 12
j 11
k 10
)";
}

// =============================================================================
// Lattice steps and parsing
// =============================================================================

TEST(StarBuilder_Lattice, EvenStepsAreUnitOddStepsAreRootThree)
{
    for (int direction = 1; direction <= 12; ++direction)
    {
        auto step = StarBuilder::LatticeStep(direction);
        ASSERT_TRUE(step.has_value()) << direction;
        const double expected = direction % 2 == 0 ? 1.0 : std::numbers::sqrt3;
        EXPECT_NEAR(glm::length(*step), expected, 1e-12) << direction;
    }

    ExpectNear(StarBuilder::LatticeStep(12).value(), glm::dvec3(0.0, 1.0, 0.0), 1e-15);
    ExpectNear(StarBuilder::LatticeStep(3).value(), glm::dvec3(std::numbers::sqrt3, 0.0, 0.0), 1e-12);
}

TEST(StarBuilder_Lattice, OutOfRangeDirectionFails)
{
    EXPECT_FALSE(StarBuilder::LatticeStep(0).has_value());
    EXPECT_FALSE(StarBuilder::LatticeStep(13).has_value());
}

TEST(StarBuilder_Parse, ContentLinesSkipCommentsAndBlanks)
{
    const auto lines = StarBuilder::ContentLines("  a 1 2 \n\n// note\n# legacy\n\tb 3\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a 1 2");
    EXPECT_EQ(lines[1], "b 3");
}

TEST(StarBuilder_Parse, TokenizeSplitsOnWhitespace)
{
    const auto tokens = StarBuilder::Tokenize("bend2  +\tk a  b.0");
    EXPECT_EQ(tokens, (std::vector<std::string_view>{"bend2", "+", "k", "a", "b.0"}));
}

TEST(StarBuilder_Parse, InnerVertexIsRotatedEdge)
{
    auto definition = StarBuilder::ParseDefinition("a 4 2\nb 11\nc 7\n");
    ASSERT_TRUE(definition.has_value());
    ASSERT_EQ(definition->Edges.size(), 3u);

    // Edge a runs from the origin to (sqrt3, 0); its inner vertex is that
    // vector turned 60 degrees counter-clockwise.
    const StarBuilder::StarEdge& a = definition->Edges[0];
    EXPECT_EQ(a.Name, "a");
    ExpectNear(a.From, glm::dvec3(0.0));
    ExpectNear(a.Inner, glm::dvec3(std::numbers::sqrt3 / 2.0, 1.5, 0.0));
    ExpectNear(definition->End, glm::dvec3(0.0), 1e-12);
}

TEST(StarBuilder_Parse, RejectsNonIntegerStep)
{
    auto definition = StarBuilder::ParseDefinition("a 4 x\n");
    ASSERT_FALSE(definition.has_value());
    EXPECT_EQ(definition.error().Code, Core::ErrorCode::InvalidFormat);

    EXPECT_FALSE(StarBuilder::ParseDefinition("a 4.5\n").has_value());
}

TEST(StarBuilder_Parse, RejectsUnknownStep)
{
    auto definition = StarBuilder::ParseDefinition("a 4\nb 14\n");
    ASSERT_FALSE(definition.has_value());
    EXPECT_EQ(definition.error().Code, Core::ErrorCode::InvalidArgument);
    EXPECT_NE(definition.error().Message.find("unknown step 14 in edge b"), std::string::npos);
}

// =============================================================================
// Build
// =============================================================================

TEST(StarBuilder_Build, IcosahedronStarCounts)
{
    const auto mesh = BuildStar(kIcosahedronStar);

    EXPECT_EQ(mesh.VertexCount(), 22u);
    EXPECT_EQ(mesh.EdgeCount(), 22u);
    EXPECT_EQ(mesh.LoopCount(), 2u);
    EXPECT_EQ(mesh.FaceCount(), 1u);
    EXPECT_EQ(mesh.PeeredHalfedges().size(), 22u);
    EXPECT_TRUE(CheckConsistency(mesh, Tolerances{}).has_value());
}

TEST(StarBuilder_Build, StarAndBoundaryOrder)
{
    const auto mesh = BuildStar(kIcosahedronStar);

    EXPECT_EQ(LoopCycle(mesh, "star", "a"),
              (std::vector<std::string>{"a", "[a^b]", "b", "[b^c]", "c", "[c^d]", "d", "[d^e]", "e", "[e^f]", "f",
                                        "[f^g]", "g", "[g^h]", "h", "[h^i]", "i", "[i^j]", "j", "[j^k]", "k",
                                        "[k^a]"}));
    EXPECT_EQ(LoopCycle(mesh, "boundary", "k"),
              (std::vector<std::string>{"k", "[j^k]", "j", "[i^j]", "i", "[h^i]", "h", "[g^h]", "g", "[f^g]", "f",
                                        "[e^f]", "e", "[d^e]", "d", "[c^d]", "c", "[b^c]", "b", "[a^b]", "a",
                                        "[k^a]"}));
    EXPECT_FALSE(mesh.FindVertex("(star center)").has_value());
}

TEST(StarBuilder_Build, BoundaryPeersPairTheTwoHalvesOfEachOutlineEdge)
{
    const auto mesh = BuildStar(kIcosahedronStar);
    const auto k = *mesh.FindVertex("k");

    auto out = OutgoingInLoop(mesh, k, mesh.BoundaryLoop());
    ASSERT_TRUE(out.has_value());
    const auto in = mesh.PrevHalfedge(*out);

    EXPECT_EQ(mesh.Peer(in), *out);
    EXPECT_NEAR(EdgeLength(mesh, in), EdgeLength(mesh, *out), 1e-12);
}

TEST(StarBuilder_Build, ThurstonPositions)
{
    const auto mesh = BuildExampleStar("thurston");
    ASSERT_EQ(mesh.VertexCount(), 22u);

    ExpectNear(PositionOf(mesh, "[k^a]"), glm::dvec3(0.0, 0.0, 0.0));
    ExpectNear(PositionOf(mesh, "a"), glm::dvec3(-1.7320508, 0.0, 0.0));
    ExpectNear(PositionOf(mesh, "[a^b]"), glm::dvec3(-0.8660254, 1.5, 0.0));
    ExpectNear(PositionOf(mesh, "b"), glm::dvec3(-1.7320508, 1.0, 0.0));
    ExpectNear(PositionOf(mesh, "k"), glm::dvec3(-3.4641016, -1.0, 0.0));
}

TEST(StarBuilder_Build, StarFaceIsFlatAndFacesUp)
{
    const auto mesh = BuildStar(kIcosahedronStar);
    const glm::dvec3 n = LoopNormal(mesh, "star");
    EXPECT_NEAR(n.z, 1.0, 1e-12);
}

TEST(StarBuilder_Build, OpenOutlineFails)
{
    auto definition = StarBuilder::ParseDefinition("a 4\nb 6\n");
    ASSERT_TRUE(definition.has_value());

    Geometry::Halfedge::Mesh mesh;
    auto built = StarBuilder::Build(mesh, *definition, Tolerances{}, Core::Log::DiscardSink());
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().Code, Core::ErrorCode::PolygonNotClosed);
    EXPECT_EQ(mesh.VertexCount(), 0u);
}

TEST(StarBuilder_Build, ClosureToleranceIsConfigurable)
{
    // Ends 0.002 away from the origin, a squared offset of 4e-6.
    StarBuilder::StarDefinition definition;
    definition.Edges.push_back({"a", glm::dvec3(0.0), glm::dvec3(0.0)});
    definition.End = glm::dvec3(0.002, 0.0, 0.0);

    Geometry::Halfedge::Mesh strict;
    EXPECT_FALSE(StarBuilder::Build(strict, definition, Tolerances{}, Core::Log::DiscardSink()).has_value());

    Tolerances loose;
    loose.PolygonClosure = 1e-4;
    Geometry::Halfedge::Mesh relaxed;
    EXPECT_TRUE(StarBuilder::Build(relaxed, definition, loose, Core::Log::DiscardSink()).has_value());
}

TEST(StarBuilder_Build, DuplicateEdgeNameFails)
{
    auto definition = StarBuilder::ParseDefinition("a 4\nb 8\na 12\n");
    ASSERT_TRUE(definition.has_value());

    Geometry::Halfedge::Mesh mesh;
    auto built = StarBuilder::Build(mesh, *definition, Tolerances{}, Core::Log::DiscardSink());
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().Code, Core::ErrorCode::DuplicateName);
}

TEST(StarBuilder_Build, EmptyDefinitionFails)
{
    auto definition = StarBuilder::ParseDefinition("// nothing here\n");
    ASSERT_TRUE(definition.has_value());

    Geometry::Halfedge::Mesh mesh;
    auto built = StarBuilder::Build(mesh, *definition, Tolerances{}, Core::Log::DiscardSink());
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().Code, Core::ErrorCode::InvalidArgument);
}

TEST(StarBuilder_Build, RefusesNonEmptyMesh)
{
    auto mesh = BuildStar(kIcosahedronStar);
    auto definition = StarBuilder::ParseDefinition(kIcosahedronStar);
    ASSERT_TRUE(definition.has_value());

    auto built = StarBuilder::Build(mesh, *definition, Tolerances{}, Core::Log::DiscardSink());
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().Code, Core::ErrorCode::InvalidState);
}

TEST(StarBuilder_Build, TraceSummarizesStar)
{
    auto definition = StarBuilder::ParseDefinition(kIcosahedronStar);
    ASSERT_TRUE(definition.has_value());

    Geometry::Halfedge::Mesh mesh;
    Core::Log::StringSink sink;
    ASSERT_TRUE(StarBuilder::Build(mesh, *definition, Tolerances{}, sink).has_value());
    EXPECT_TRUE(sink.Contains("star with 11 edges"));
}
