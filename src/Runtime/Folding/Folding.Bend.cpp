module;

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Folding:Bend.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :MeshQueries;
import :Bend;

namespace Folding
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;
    using Geometry::Halfedge::SplitSide;

    namespace VA = Geometry::VectorAlgebra;

    namespace
    {
        // Splits the unique face holding a and b along the chord a-b. The new
        // loop lies on the side reached from b walking backwards to a and is
        // renamed "split(<label>)".
        Core::Result SplitFaceAlong(Mesh& mesh, VertexHandle a, VertexHandle b, const std::string& label)
        {
            auto face = FindUniqueFace(mesh, a, b);
            if (!face) return std::unexpected(face.error());
            auto intoB = IncomingInLoop(mesh, *face, b);
            if (!intoB) return std::unexpected(intoB.error());
            auto intoA = IncomingInLoop(mesh, *face, a);
            if (!intoA) return std::unexpected(intoA.error());

            auto split = mesh.SplitLoop(*intoB, *intoA, SplitSide::Left);
            if (!split) return std::unexpected(split.error());
            mesh.RenameLoop(mesh.Loop(split->First), "split(" + label + ")");
            return Core::Ok();
        }
    }

    // =========================================================================
    // Bend
    // =========================================================================
    Core::Expected<BendResult> Bend(Mesh& mesh, const BendParams& params, const Tolerances& tolerances,
                                    Core::Log::Sink& trace)
    {
        if (params.Path.size() < 2)
        {
            return Core::Err(ErrorCode::InvalidArgument, "bend needs at least two vertices, got {}",
                             params.Path.size());
        }

        std::vector<VertexHandle> path;
        path.reserve(params.Path.size());
        for (const std::string& name : params.Path)
        {
            auto v = ResolveVertex(mesh, name, true);
            if (!v) return std::unexpected(v.error());
            path.push_back(*v);
        }

        BendResult result;
        for (std::size_t i = 1; i < path.size(); ++i)
        {
            const VertexHandle prev = path[i - 1];
            const VertexHandle cur = path[i];
            if (prev == cur)
            {
                return Core::Err(ErrorCode::InvalidArgument, "bend path repeats vertex {}", mesh.Name(cur));
            }

            const glm::dvec3 direction = mesh.Position(cur) - mesh.Position(prev);
            if (glm::length(direction) < tolerances.Coincidence)
            {
                return Core::Err(ErrorCode::DegenerateGeometry, "bend axis {}-{} has zero length",
                                 mesh.Name(prev), mesh.Name(cur));
            }

            auto face = FindUniqueFace(mesh, prev, cur);
            if (!face) return std::unexpected(face.error());
            auto intoPrev = IncomingInLoop(mesh, *face, prev);
            if (!intoPrev) return std::unexpected(intoPrev.error());
            auto intoCur = IncomingInLoop(mesh, *face, cur);
            if (!intoCur) return std::unexpected(intoCur.error());

            auto beyond = CollectVertices(mesh, mesh.FromVertex(*intoCur), VertexSet{prev, cur});
            if (!beyond) return std::unexpected(beyond.error());

            auto split = mesh.SplitLoop(*intoCur, *intoPrev, SplitSide::Left);
            if (!split) return std::unexpected(split.error());
            mesh.RenameLoop(mesh.Loop(split->First), "split(" + mesh.Name(prev) + "-" + mesh.Name(cur) + ")");

            const glm::dquat rotation = VA::AxisRotation(glm::normalize(direction), params.Angle);
            RotateVertices(mesh, *beyond, rotation, mesh.Position(cur));

            Core::Log::Trace(trace, "bend {}-{} by {:.6f}: moved {}", mesh.Name(prev), mesh.Name(cur),
                             params.Angle, DescribeVertices(mesh, *beyond));

            ++result.Hinges;
            result.MovedVertices += beyond->size();
        }
        return result;
    }

    // =========================================================================
    // Bend2
    // =========================================================================
    Core::Expected<Bend2Result> Bend2(Mesh& mesh, const Bend2Params& params, const Tolerances& tolerances,
                                      Core::Log::Sink& trace)
    {
        auto p = ResolveVertex(mesh, params.P, true);
        if (!p) return std::unexpected(p.error());
        auto q = ResolveVertex(mesh, params.Q, true);
        if (!q) return std::unexpected(q.error());
        auto r = ResolveVertex(mesh, params.R, true);
        if (!r) return std::unexpected(r.error());

        if (*p == *q || *q == *r || *p == *r)
        {
            return Core::Err(ErrorCode::InvalidArgument, "bend2 needs three distinct vertices, got {} {} {}",
                             params.P, params.Q, params.R);
        }

        const LoopHandle boundary = mesh.BoundaryLoop();
        auto qOut = OutgoingInLoop(mesh, *q, boundary);
        if (!qOut) return std::unexpected(qOut.error());

        const HalfedgeHandle hqb = *qOut;
        const HalfedgeHandle hbq = mesh.PrevHalfedge(hqb);
        if (mesh.Peer(hbq) != hqb)
        {
            return Core::Err(ErrorCode::PeerMismatch, "cannot attach non-peers at {}", params.Q);
        }

        const VertexHandle t1 = mesh.ToVertex(hqb);
        const VertexHandle t2 = mesh.FromVertex(hbq);

        // s1 is whichever of p and r comes first along the boundary after q.
        VertexHandle s1{};
        VertexHandle s2{};
        {
            HalfedgeHandle h = hqb;
            for (std::size_t steps = 0;; ++steps)
            {
                if (steps > mesh.NeighborhoodLimit())
                {
                    return Core::Err(ErrorCode::NeighborhoodTooLarge,
                                     "neither {} nor {} found on the boundary after {}", params.P, params.R,
                                     params.Q);
                }
                if (mesh.ToVertex(h) == *p)
                {
                    s1 = *p;
                    s2 = *r;
                    break;
                }
                if (mesh.ToVertex(h) == *r)
                {
                    s1 = *r;
                    s2 = *p;
                    break;
                }
                h = mesh.NextHalfedge(h);
            }
        }

        if (auto ok = SplitFaceAlong(mesh, s1, *q, mesh.Name(*q) + "-" + mesh.Name(s1)); !ok)
        {
            return std::unexpected(ok.error());
        }
        if (auto ok = SplitFaceAlong(mesh, *q, s2, mesh.Name(*q) + "-" + mesh.Name(s2)); !ok)
        {
            return std::unexpected(ok.error());
        }

        const VertexSet hinges{s1, *q, s2};
        auto flap1 = CollectVertices(mesh, t1, hinges);
        if (!flap1) return std::unexpected(flap1.error());
        auto flap2 = CollectVertices(mesh, t2, hinges);
        if (!flap2) return std::unexpected(flap2.error());
        if (Intersects(*flap1, *flap2))
        {
            return Core::Err(ErrorCode::OverlappingParts, "overlapping parts: {} and {}",
                             DescribeVertices(mesh, *flap1), DescribeVertices(mesh, *flap2));
        }

        const glm::dvec3 ps1 = mesh.Position(s1);
        const glm::dvec3 pq = mesh.Position(*q);
        const glm::dvec3 ps2 = mesh.Position(s2);
        const glm::dvec3 pt1 = mesh.Position(t1);
        const glm::dvec3 pt2 = mesh.Position(t2);

        VA::SphereIntersectionParams sphereParams;
        sphereParams.DiscriminantTolerance = tolerances.Discriminant;

        auto meet = VA::IntersectThreeSpheres({ps1, glm::distance(ps1, pt1)},
                                              {pq, glm::distance(pq, pt1)},
                                              {ps2, glm::distance(ps2, pt2)},
                                              sphereParams);
        if (!meet)
        {
            return Core::Err(meet.error().Code, "bend2 {} {} {}: {}", mesh.Name(s1), mesh.Name(*q), mesh.Name(s2),
                             meet.error().Message);
        }
        const glm::dvec3 target = params.Choice == Bend2Choice::Plus ? meet->Points[1] : meet->Points[0];

        const glm::dvec3 pivot1 = VA::ProjectPointToLine(pt1, ps1, pq);
        RotateVertices(mesh, *flap1, VA::RotationBetween(pt1 - pivot1, target - pivot1), pivot1);

        const glm::dvec3 pivot2 = VA::ProjectPointToLine(pt2, ps2, pq);
        RotateVertices(mesh, *flap2, VA::RotationBetween(pt2 - pivot2, target - pivot2), pivot2);

        const double gap = glm::distance(mesh.Position(t1), mesh.Position(t2));
        if (gap >= tolerances.Coincidence)
        {
            return Core::Err(ErrorCode::AlignmentFailed, "tips not properly aligned: {} and {} are {:.3g} apart",
                             mesh.Name(t1), mesh.Name(t2), gap);
        }

        Core::Log::Trace(trace, "bend2 {} {} {}: flaps [{}] and [{}] meet at ({:.6f}, {:.6f}, {:.6f})",
                         mesh.Name(s1), mesh.Name(*q), mesh.Name(s2), DescribeVertices(mesh, *flap1),
                         DescribeVertices(mesh, *flap2), target.x, target.y, target.z);

        // Merge t2 into t1 and close the notch.
        const std::string name1 = mesh.Name(t1);
        const std::string name2 = mesh.Name(t2);

        auto bridge = mesh.SplitLoop(hqb, mesh.PrevHalfedge(hbq), SplitSide::Left);
        if (!bridge) return std::unexpected(bridge.error());
        auto survivor = mesh.ContractEdge(bridge->First);
        if (!survivor) return std::unexpected(survivor.error());
        auto dropped = mesh.DropEdge(hqb);
        if (!dropped) return std::unexpected(dropped.error());

        Bend2Result result;
        result.MergedTip = MergeNames(name2, name1);
        result.MovedVertices = flap1->size() + flap2->size();
        if (auto renamed = mesh.RenameVertex(*survivor, result.MergedTip); !renamed)
        {
            return std::unexpected(renamed.error());
        }

        auto hinge = mesh.FindHalfedge(*survivor, *q);
        if (!hinge) return std::unexpected(hinge.error());
        auto coplanar = IsBetweenCoplanarLoops(mesh, *hinge, tolerances.Coincidence);
        if (!coplanar) return std::unexpected(coplanar.error());
        if (*coplanar)
        {
            auto merged = mesh.DropEdge(*hinge);
            if (!merged) return std::unexpected(merged.error());
            result.HingeDropped = true;
        }

        Core::Log::Trace(trace, "bend2: merged tip {}{}", result.MergedTip,
                         result.HingeDropped ? ", coplanar hinge dropped" : "");
        return result;
    }
}
