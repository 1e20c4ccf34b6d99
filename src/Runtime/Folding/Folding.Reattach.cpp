module;

#include <expected>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Folding:Reattach.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :MeshQueries;
import :Reattach;

namespace Folding
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;
    using Geometry::Halfedge::SplitSide;

    namespace VA = Geometry::VectorAlgebra;

    Core::Expected<ReattachResult> Reattach(Mesh& mesh, const ReattachParams& params, const Tolerances& tolerances,
                                            Core::Log::Sink& trace)
    {
        if (!mesh.HasBoundary())
        {
            return Core::Err(ErrorCode::InvalidState, "reattach {} {}: mesh has no boundary", params.P, params.Q);
        }

        auto p = ResolveVertex(mesh, params.P, false);
        if (!p) return std::unexpected(p.error());
        auto q = ResolveVertex(mesh, params.Q, false);
        if (!q) return std::unexpected(q.error());
        if (*p == *q)
        {
            return Core::Err(ErrorCode::InvalidArgument, "reattach needs two distinct vertices, got {} twice",
                             params.P);
        }

        const LoopHandle boundary = mesh.BoundaryLoop();

        auto face = FindUniqueFace(mesh, *p, *q);
        if (!face) return std::unexpected(face.error());
        auto faceToP = IncomingInLoop(mesh, *face, *p);
        if (!faceToP) return std::unexpected(faceToP.error());
        auto faceToQ = IncomingInLoop(mesh, *face, *q);
        if (!faceToQ) return std::unexpected(faceToQ.error());
        auto boundaryToP = IncomingInLoop(mesh, boundary, *p);
        if (!boundaryToP) return std::unexpected(boundaryToP.error());
        auto boundaryToQ = IncomingInLoop(mesh, boundary, *q);
        if (!boundaryToQ) return std::unexpected(boundaryToQ.error());

        const HalfedgeHandle hbq = *boundaryToQ;
        const HalfedgeHandle hqb = mesh.NextHalfedge(hbq);
        if (mesh.Peer(hbq) != hqb || mesh.Peer(hqb) != hbq)
        {
            return Core::Err(ErrorCode::PeerMismatch, "cannot reattach at non-peers around {}", params.Q);
        }

        const VertexHandle t1 = mesh.FromVertex(hbq);
        const VertexHandle t2 = mesh.ToVertex(hqb);

        // -------------------------------------------------------------------------
        // Cut the face along p-q and open p towards the boundary.
        // -------------------------------------------------------------------------
        auto cutA = mesh.SplitLoop(*faceToP, *faceToQ, SplitSide::Right);
        if (!cutA) return std::unexpected(cutA.error());
        const HalfedgeHandle pqA = cutA->First;

        auto cutB = mesh.SplitLoop(pqA, *faceToP, SplitSide::Left);
        if (!cutB) return std::unexpected(cutB.error());
        const HalfedgeHandle qpB = cutB->First;

        auto opened = mesh.SplitVertex(qpB, *boundaryToP, SplitSide::Both);
        if (!opened) return std::unexpected(opened.error());
        auto absorbed = mesh.DropEdge(opened->First);
        if (!absorbed) return std::unexpected(absorbed.error());

        mesh.SetPeers(pqA, qpB);

        // -------------------------------------------------------------------------
        // Swing the smaller part about q onto the other.
        // -------------------------------------------------------------------------
        const VertexSet hub{*q};
        auto part1 = CollectVertices(mesh, t1, hub);
        if (!part1) return std::unexpected(part1.error());
        auto part2 = CollectVertices(mesh, t2, hub);
        if (!part2) return std::unexpected(part2.error());
        if (Intersects(*part1, *part2))
        {
            return Core::Err(ErrorCode::OverlappingParts, "parts not disjoint after cutting {}-{}: {} and {}",
                             params.P, params.Q, DescribeVertices(mesh, *part1), DescribeVertices(mesh, *part2));
        }

        const bool moveFirst = part1->size() <= part2->size();
        const VertexSet& part = moveFirst ? *part1 : *part2;
        const VertexHandle fromTip = moveFirst ? t1 : t2;
        const VertexHandle toTip = moveFirst ? t2 : t1;
        const HalfedgeHandle fromEdge = moveFirst ? hbq : hqb;
        const HalfedgeHandle toEdge = moveFirst ? hqb : hbq;

        const glm::dvec3 pivot = mesh.Position(*q);
        RotateVertices(mesh, part,
                       VA::RotationBetween(mesh.Position(fromTip) - pivot, mesh.Position(toTip) - pivot), pivot);

        auto fromSide = FaceOrientation(mesh, mesh.OppositeHalfedge(fromEdge));
        if (!fromSide) return std::unexpected(fromSide.error());
        auto toSide = FaceOrientation(mesh, mesh.OppositeHalfedge(toEdge));
        if (!toSide) return std::unexpected(toSide.error());
        RotateVertices(mesh, part, VA::RotationBetween(*fromSide, -*toSide), pivot);

        Core::Log::Trace(trace, "reattach {} {}: moved {}", params.P, params.Q, DescribeVertices(mesh, part));

        // -------------------------------------------------------------------------
        // Merge the tips and dissolve the seam.
        // -------------------------------------------------------------------------
        auto bridge = mesh.SplitLoop(hqb, mesh.PrevHalfedge(mesh.PrevHalfedge(hqb)), SplitSide::Left);
        if (!bridge) return std::unexpected(bridge.error());

        const std::string survivorName = mesh.Name(mesh.FromVertex(bridge->First));
        const std::string absorbedName = mesh.Name(mesh.ToVertex(bridge->First));

        auto survivor = mesh.ContractEdge(bridge->First);
        if (!survivor) return std::unexpected(survivor.error());

        ReattachResult result;
        result.MergedTip = MergeNames(survivorName, absorbedName);
        result.MovedVertices = part.size();
        if (auto renamed = mesh.RenameVertex(*survivor, result.MergedTip); !renamed)
        {
            return std::unexpected(renamed.error());
        }

        auto dropped = mesh.DropEdge(hqb);
        if (!dropped) return std::unexpected(dropped.error());

        auto coplanar = IsBetweenCoplanarLoops(mesh, hbq, tolerances.Coincidence);
        if (!coplanar) return std::unexpected(coplanar.error());
        if (!*coplanar)
        {
            return Core::Err(ErrorCode::NotCoplanar, "faces not coplanar across {}-{}",
                             mesh.Name(mesh.FromVertex(hbq)), mesh.Name(mesh.ToVertex(hbq)));
        }
        auto seam = mesh.DropEdge(hbq);
        if (!seam) return std::unexpected(seam.error());

        Core::Log::Trace(trace, "reattach {} {}: merged tip {}", params.P, params.Q, result.MergedTip);
        return result;
    }
}
