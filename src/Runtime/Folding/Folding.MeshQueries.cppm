module;

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Folding:MeshQueries;

import Core.Error;
import Geometry;

export namespace Folding
{
    using Geometry::EdgeHandle;
    using Geometry::HalfedgeHandle;
    using Geometry::LoopHandle;
    using Geometry::VertexHandle;

    using VertexSet = std::set<VertexHandle>;

    // -------------------------------------------------------------------------
    // Vertex names
    // -------------------------------------------------------------------------

    // "x.0" + "x.1" -> "x"; anything else -> "[a|b]".
    [[nodiscard]] std::string MergeNames(std::string_view a, std::string_view b);

    // Name up to the first '.', i.e. without reattachment suffixes.
    [[nodiscard]] std::string_view BaseName(std::string_view name);

    // Star tips carry a '^' in their name.
    [[nodiscard]] bool IsTipName(std::string_view name);

    // -------------------------------------------------------------------------
    // Lookups
    // -------------------------------------------------------------------------

    [[nodiscard]] Core::Expected<bool> TouchesBoundary(const Geometry::Halfedge::Mesh& mesh, VertexHandle v);

    // Resolves a script-level vertex name. With requireBoundary the vertex
    // must have an outgoing halfedge on the boundary loop.
    [[nodiscard]] Core::Expected<VertexHandle> ResolveVertex(const Geometry::Halfedge::Mesh& mesh,
                                                             std::string_view name, bool requireBoundary);

    // The single non-boundary loop around p that also contains q. A loop met
    // twice around p counts twice.
    [[nodiscard]] Core::Expected<LoopHandle> FindUniqueFace(const Geometry::Halfedge::Mesh& mesh,
                                                            VertexHandle p, VertexHandle q);

    // Unique halfedge of `loop` pointing to v.
    [[nodiscard]] Core::Expected<HalfedgeHandle> IncomingInLoop(const Geometry::Halfedge::Mesh& mesh,
                                                                LoopHandle loop, VertexHandle v);

    // Unique halfedge leaving v inside `loop`.
    [[nodiscard]] Core::Expected<HalfedgeHandle> OutgoingInLoop(const Geometry::Halfedge::Mesh& mesh,
                                                                VertexHandle v, LoopHandle loop);

    // Vertices reachable from start over edges without entering `border`.
    [[nodiscard]] Core::Expected<VertexSet> CollectVertices(const Geometry::Halfedge::Mesh& mesh,
                                                            VertexHandle start, const VertexSet& border);

    [[nodiscard]] bool Intersects(const VertexSet& a, const VertexSet& b);

    [[nodiscard]] std::string DescribeVertices(const Geometry::Halfedge::Mesh& mesh, const VertexSet& vertices);

    // -------------------------------------------------------------------------
    // Loop geometry
    // -------------------------------------------------------------------------

    // Target positions of the loop's halfedges, in loop order.
    [[nodiscard]] Core::Expected<std::vector<glm::dvec3>> LoopPositions(const Geometry::Halfedge::Mesh& mesh,
                                                                        LoopHandle loop);

    [[nodiscard]] Core::Expected<glm::dvec3> LoopArea(const Geometry::Halfedge::Mesh& mesh, LoopHandle loop);

    [[nodiscard]] Core::Expected<bool> IsLoopFlat(const Geometry::Halfedge::Mesh& mesh, LoopHandle loop,
                                                  double tolerance);

    // In-plane vector perpendicular to h pointing into Loop(h) (scaled by the
    // loop area and edge length).
    [[nodiscard]] Core::Expected<glm::dvec3> FaceOrientation(const Geometry::Halfedge::Mesh& mesh, HalfedgeHandle h);

    // True when the loops on both sides of h have the same unit normal, or
    // when either is degenerate. Fails with NotFlat if either is not flat.
    [[nodiscard]] Core::Expected<bool> IsBetweenCoplanarLoops(const Geometry::Halfedge::Mesh& mesh,
                                                              HalfedgeHandle h, double tolerance);

    [[nodiscard]] double EdgeLength(const Geometry::Halfedge::Mesh& mesh, HalfedgeHandle h);

    // Rigid motion of a vertex set about a pivot.
    void RotateVertices(Geometry::Halfedge::Mesh& mesh, const VertexSet& vertices,
                        const glm::dquat& rotation, const glm::dvec3& pivot);
}
