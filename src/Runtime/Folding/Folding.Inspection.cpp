module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <expected>
#include <format>
#include <map>
#include <numbers>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Folding:Inspection.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :MeshQueries;
import :Inspection;

namespace Folding
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;

    namespace
    {
        std::string FormatPoint(const glm::dvec3& p)
        {
            return std::format("({:.6f}, {:.6f}, {:.6f})", p.x, p.y, p.z);
        }

        std::string DescribeHalfedge(const Mesh& mesh, HalfedgeHandle h)
        {
            return std::format("{}->{}", mesh.Name(mesh.FromVertex(h)), mesh.Name(mesh.ToVertex(h)));
        }

        // Peer pairs in link order, each listed once by its first member.
        std::vector<std::pair<HalfedgeHandle, HalfedgeHandle>> PeerPairs(const Mesh& mesh)
        {
            std::vector<std::pair<HalfedgeHandle, HalfedgeHandle>> pairs;
            std::set<HalfedgeHandle> seen;
            for (HalfedgeHandle h : mesh.PeeredHalfedges())
            {
                if (seen.contains(h)) continue;
                const HalfedgeHandle peer = mesh.Peer(h);
                seen.insert(h);
                seen.insert(peer);
                pairs.emplace_back(h, peer);
            }
            return pairs;
        }
    }

    // =========================================================================
    // CheckConsistency
    // =========================================================================
    Core::Result CheckConsistency(const Mesh& mesh, const Tolerances& tolerances)
    {
        if (auto ok = mesh.Check(); !ok) return ok;

        // NaN coordinates would pass every flatness and length test below.
        for (VertexHandle v : mesh.Vertices())
        {
            if (!Geometry::Validation::IsFinite(mesh.Position(v)))
            {
                return Core::Err(ErrorCode::DegenerateGeometry, "vertex {} has a non-finite position", mesh.Name(v));
            }
        }

        for (LoopHandle l : mesh.Loops())
        {
            if (!mesh.IsFace(l)) continue;
            auto flat = IsLoopFlat(mesh, l, tolerances.Coincidence);
            if (!flat) return std::unexpected(flat.error());
            if (!*flat)
            {
                return Core::Err(ErrorCode::NotFlat, "face {} is not flat", mesh.Name(l));
            }
        }

        if (!mesh.HasBoundary())
        {
            if (!mesh.PeeredHalfedges().empty())
            {
                return Core::Err(ErrorCode::PeerMismatch, "{} peered halfedges remain without a boundary",
                                 mesh.PeeredHalfedges().size());
            }
            return Core::Ok();
        }

        auto boundary = mesh.LoopHalfedges(mesh.BoundaryLoop());
        if (!boundary) return std::unexpected(boundary.error());
        for (HalfedgeHandle h : *boundary)
        {
            if (!mesh.HasPeer(h))
            {
                return Core::Err(ErrorCode::PeerMismatch, "boundary halfedge {} has no peer",
                                 DescribeHalfedge(mesh, h));
            }
        }

        for (HalfedgeHandle h : mesh.PeeredHalfedges())
        {
            const HalfedgeHandle peer = mesh.Peer(h);
            if (!mesh.IsLive(h) || !mesh.IsLive(peer))
            {
                return Core::Err(ErrorCode::PeerMismatch, "peer link {} <-> {} references a dead halfedge",
                                 h.Index, peer.Index);
            }
            if (!mesh.IsBoundary(h))
            {
                return Core::Err(ErrorCode::PeerMismatch, "peered halfedge {} is not on the boundary",
                                 DescribeHalfedge(mesh, h));
            }
            if (mesh.Peer(peer) != h)
            {
                return Core::Err(ErrorCode::PeerMismatch, "peer of {} does not point back",
                                 DescribeHalfedge(mesh, h));
            }

            const double la = EdgeLength(mesh, h);
            const double lb = EdgeLength(mesh, peer);
            if (std::abs(la - lb) > tolerances.PeerLength)
            {
                return Core::Err(ErrorCode::PeerMismatch, "peer lengths differ: {} is {:.6g}, {} is {:.6g}",
                                 DescribeHalfedge(mesh, h), la, DescribeHalfedge(mesh, peer), lb);
            }
        }
        return Core::Ok();
    }

    double MaxPeerLengthDrift(const Mesh& mesh)
    {
        double drift = 0.0;
        for (HalfedgeHandle h : mesh.PeeredHalfedges())
        {
            drift = std::max(drift, std::abs(EdgeLength(mesh, h) - EdgeLength(mesh, mesh.Peer(h))));
        }
        return drift;
    }

    // =========================================================================
    // DescribeMesh
    // =========================================================================
    Core::Result DescribeMesh(const Mesh& mesh, const Tolerances& tolerances, Core::Log::Sink& sink)
    {
        // Loops
        for (LoopHandle l : mesh.Loops())
        {
            auto halfedges = mesh.LoopHalfedges(l);
            if (!halfedges) return std::unexpected(halfedges.error());

            std::string cycle;
            for (HalfedgeHandle h : *halfedges)
            {
                cycle += mesh.Name(mesh.ToVertex(h));
                cycle += ' ';
            }
            Core::Log::Trace(sink, "loop {}{}: {}({})", mesh.Name(l), mesh.IsFace(l) ? "" : " [boundary]",
                             cycle, halfedges->size());
        }

        // Vertices
        const std::vector<VertexHandle> vertices = mesh.Vertices();
        std::size_t tips = 0;
        for (VertexHandle v : vertices)
        {
            if (IsTipName(mesh.Name(v))) ++tips;

            auto outgoing = mesh.OutgoingHalfedges(v);
            if (!outgoing) return std::unexpected(outgoing.error());

            std::string neighbours;
            std::string loops;
            for (HalfedgeHandle h : *outgoing)
            {
                if (!neighbours.empty()) neighbours += ' ';
                neighbours += mesh.Name(mesh.ToVertex(h));
                if (!loops.empty()) loops += ' ';
                loops += mesh.Name(mesh.Loop(h));
            }
            Core::Log::Trace(sink, "vertex {} #{} {} -> [{}] in [{}]", mesh.Name(v), v.Index,
                             FormatPoint(mesh.Position(v)), neighbours, loops);
        }

        // Nearby pairs
        for (std::size_t i = 0; i < vertices.size(); ++i)
        {
            for (std::size_t j = i + 1; j < vertices.size(); ++j)
            {
                const double d = glm::distance(mesh.Position(vertices[i]), mesh.Position(vertices[j]));
                if (d < tolerances.NearbyVertex)
                {
                    Core::Log::Trace(sink, "nearby: {} and {} ({:.3g})", mesh.Name(vertices[i]),
                                     mesh.Name(vertices[j]), d);
                }
            }
        }

        Core::Log::Trace(sink, "{} vertices ({} tips), {} edges, {} loops, {} faces", mesh.VertexCount(), tips,
                         mesh.EdgeCount(), mesh.LoopCount(), mesh.FaceCount());

        // Dihedral angles between adjacent faces
        for (EdgeHandle e : mesh.Edges())
        {
            const HalfedgeHandle h = mesh.Halfedge(e, 0);
            const LoopHandle l1 = mesh.Loop(h);
            const LoopHandle l2 = mesh.Loop(mesh.OppositeHalfedge(h));
            if (l1 == l2 || !mesh.IsFace(l1) || !mesh.IsFace(l2)) continue;

            auto a1 = LoopArea(mesh, l1);
            if (!a1) return std::unexpected(a1.error());
            auto a2 = LoopArea(mesh, l2);
            if (!a2) return std::unexpected(a2.error());

            const double n1 = glm::length(*a1);
            const double n2 = glm::length(*a2);
            if (n1 < tolerances.Coincidence || n2 < tolerances.Coincidence) continue;

            const double c = std::clamp(glm::dot(*a1, *a2) / (n1 * n2), -1.0, 1.0);
            Core::Log::Trace(sink, "dihedral {}: {:.3f} deg", DescribeHalfedge(mesh, h),
                             std::acos(c) * 180.0 / std::numbers::pi);
        }

        // Peers
        for (const auto& [a, b] : PeerPairs(mesh))
        {
            Core::Log::Trace(sink, "peers {} <-> {} (lengths {:.6f} / {:.6f})", DescribeHalfedge(mesh, a),
                             DescribeHalfedge(mesh, b), EdgeLength(mesh, a), EdgeLength(mesh, b));
        }

        return Core::Ok();
    }

    // =========================================================================
    // Snapshot
    // =========================================================================

    std::size_t MeshSnapshot::FaceCount() const
    {
        return static_cast<std::size_t>(std::count_if(Loops.begin(), Loops.end(),
                                                      [](const SnapshotLoop& l) { return l.IsFace; }));
    }

    Core::Expected<MeshSnapshot> TakeSnapshot(const Mesh& mesh)
    {
        MeshSnapshot snapshot;
        std::map<VertexHandle, std::size_t> index;

        for (VertexHandle v : mesh.Vertices())
        {
            index.emplace(v, snapshot.Vertices.size());
            snapshot.Vertices.push_back({mesh.Name(v), mesh.Position(v)});
        }

        auto toHalfedge = [&](HalfedgeHandle h) {
            return SnapshotHalfedge{index.at(mesh.FromVertex(h)), index.at(mesh.ToVertex(h))};
        };

        for (EdgeHandle e : mesh.Edges())
        {
            const SnapshotHalfedge h = toHalfedge(mesh.Halfedge(e, 0));
            snapshot.Edges.emplace_back(h.From, h.To);
        }

        for (LoopHandle l : mesh.Loops())
        {
            auto halfedges = mesh.LoopHalfedges(l);
            if (!halfedges) return std::unexpected(halfedges.error());

            SnapshotLoop loop{mesh.Name(l), mesh.IsFace(l), {}};
            for (HalfedgeHandle h : *halfedges)
            {
                loop.Vertices.push_back(index.at(mesh.ToVertex(h)));
            }
            if (mesh.HasBoundary() && l == mesh.BoundaryLoop())
            {
                snapshot.Boundary = loop.Vertices;
            }
            snapshot.Loops.push_back(std::move(loop));
        }

        for (const auto& [a, b] : PeerPairs(mesh))
        {
            snapshot.Peers.emplace_back(toHalfedge(a), toHalfedge(b));
        }

        return snapshot;
    }

    std::string FormatSnapshot(const MeshSnapshot& snapshot)
    {
        std::string out;
        out += std::format("vertices {}\n", snapshot.Vertices.size());
        for (std::size_t i = 0; i < snapshot.Vertices.size(); ++i)
        {
            const SnapshotVertex& v = snapshot.Vertices[i];
            out += std::format("  {:3} {} {}\n", i, v.Name, FormatPoint(v.Position));
        }

        out += std::format("edges {}\n", snapshot.Edges.size());
        for (const auto& [a, b] : snapshot.Edges)
        {
            out += std::format("  {} {}\n", a, b);
        }

        out += std::format("loops {} ({} faces)\n", snapshot.Loops.size(), snapshot.FaceCount());
        for (const SnapshotLoop& loop : snapshot.Loops)
        {
            out += std::format("  {}{}:", loop.Name, loop.IsFace ? "" : " [boundary]");
            for (std::size_t v : loop.Vertices) out += std::format(" {}", v);
            out += '\n';
        }

        out += std::format("peers {}\n", snapshot.Peers.size());
        for (const auto& [a, b] : snapshot.Peers)
        {
            out += std::format("  {}->{} <-> {}->{}\n", a.From, a.To, b.From, b.To);
        }
        return out;
    }
}
