module;

#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Folding:Relaxation.Impl;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;
import :MeshQueries;
import :Relaxation;

namespace Folding
{
    using Core::ErrorCode;
    using Geometry::Halfedge::Mesh;
    using Geometry::Halfedge::SplitSide;

    namespace
    {
        // Target distance per constrained partner vertex.
        using Connections = std::map<VertexHandle, double>;

        Core::Result RequireTriangles(const Mesh& mesh)
        {
            for (LoopHandle l : mesh.Loops())
            {
                if (!mesh.IsFace(l)) continue;
                auto valence = mesh.Valence(l);
                if (!valence) return std::unexpected(valence.error());
                if (*valence != 3)
                {
                    return Core::Err(ErrorCode::NotTriangulated, "non-triangle face {} {}", mesh.Name(l), *valence);
                }
            }
            return Core::Ok();
        }

        Core::Expected<std::vector<VertexHandle>> DistinctBoundaryVertices(const Mesh& mesh)
        {
            auto halfedges = mesh.LoopHalfedges(mesh.BoundaryLoop());
            if (!halfedges) return std::unexpected(halfedges.error());

            std::vector<VertexHandle> out;
            VertexSet seen;
            for (HalfedgeHandle h : *halfedges)
            {
                if (seen.insert(mesh.ToVertex(h)).second) out.push_back(mesh.ToVertex(h));
            }
            return out;
        }

        bool ShouldCoincide(std::string_view a, std::string_view b)
        {
            return BaseName(a) == BaseName(b) || (IsTipName(a) && IsTipName(b));
        }

        Core::Expected<std::vector<std::pair<VertexHandle, Connections>>> BuildConnections(const Mesh& mesh)
        {
            auto boundary = DistinctBoundaryVertices(mesh);
            if (!boundary) return std::unexpected(boundary.error());

            std::vector<std::pair<VertexHandle, Connections>> connections;
            for (VertexHandle va : mesh.Vertices())
            {
                Connections c;

                auto outgoing = mesh.OutgoingHalfedges(va);
                if (!outgoing) return std::unexpected(outgoing.error());
                for (HalfedgeHandle h : *outgoing)
                {
                    c[mesh.ToVertex(h)] = EdgeLength(mesh, h);
                }

                for (VertexHandle vb : *boundary)
                {
                    if (vb == va) continue;
                    if (!ShouldCoincide(mesh.Name(va), mesh.Name(vb))) continue;
                    // An edge length cannot relax to zero.
                    if (c.contains(vb))
                    {
                        return Core::Err(ErrorCode::InvalidState, "contract: {} and {} must coincide but share an edge",
                                         mesh.Name(va), mesh.Name(vb));
                    }
                    c[vb] = 0.0;
                }
                connections.emplace_back(va, std::move(c));
            }
            return connections;
        }
    }

    // =========================================================================
    // Contract
    // =========================================================================
    Core::Expected<ContractResult> Contract(Mesh& mesh, const ContractParams& params, const Tolerances& tolerances,
                                            Core::Log::Sink& trace)
    {
        if (params.Iterations < 1)
        {
            return Core::Err(ErrorCode::InvalidArgument, "contract needs at least one iteration");
        }
        if (!mesh.HasBoundary())
        {
            return Core::Err(ErrorCode::InvalidState, "contract: mesh has no boundary left");
        }
        if (auto ok = RequireTriangles(mesh); !ok) return std::unexpected(ok.error());

        auto connections = BuildConnections(mesh);
        if (!connections) return std::unexpected(connections.error());

        ContractResult result;
        std::vector<glm::dvec3> targets(connections->size());

        for (std::size_t iteration = 0; iteration < params.Iterations; ++iteration)
        {
            for (std::size_t i = 0; i < connections->size(); ++i)
            {
                const auto& [va, partners] = (*connections)[i];
                const glm::dvec3 pa = mesh.Position(va);

                glm::dvec3 sum(0.0);
                for (const auto& [vb, length] : partners)
                {
                    const glm::dvec3 pb = mesh.Position(vb);
                    if (length == 0.0)
                    {
                        sum += pb;
                        continue;
                    }
                    double d = glm::distance(pa, pb);
                    if (d == 0.0) d = 1.0;
                    sum += pb + (length / d) * (pa - pb);
                }
                targets[i] = partners.empty() ? pa : sum / static_cast<double>(partners.size());
            }

            double badness = 0.0;
            for (std::size_t i = 0; i < connections->size(); ++i)
            {
                const VertexHandle va = (*connections)[i].first;
                badness += glm::distance(mesh.Position(va), targets[i]);
                mesh.Position(va) = targets[i];
            }
            result.Badness.push_back(badness);

            if (badness == 0.0) break;
        }

        Core::Log::Trace(trace, "contract: {} iterations, badness {:.3g} -> {:.3g}", result.Badness.size(),
                         result.Badness.front(), result.Badness.back());
        if (result.Badness.back() > tolerances.PeerLength)
        {
            Core::Log::Warn("contract stopped with badness {:.3g} after {} iterations", result.Badness.back(),
                            result.Badness.size());
        }

        auto glued = GluePeers(mesh, trace);
        if (!glued) return std::unexpected(glued.error());
        result.GluedPairs = *glued;
        return result;
    }

    // =========================================================================
    // GluePeers
    // =========================================================================
    Core::Expected<std::size_t> GluePeers(Mesh& mesh, Core::Log::Sink& trace)
    {
        if (!mesh.HasBoundary())
        {
            return Core::Err(ErrorCode::InvalidState, "glue: mesh has no boundary left");
        }

        std::size_t glued = 0;
        while (mesh.PeeredHalfedges().size() > 2)
        {
            HalfedgeHandle a{};
            HalfedgeHandle b{};
            for (HalfedgeHandle h : mesh.PeeredHalfedges())
            {
                const HalfedgeHandle peer = mesh.Peer(h);
                if (mesh.ToVertex(h) == mesh.FromVertex(peer))
                {
                    a = h;
                    b = peer;
                    break;
                }
            }
            if (!a.IsValid())
            {
                return Core::Err(ErrorCode::PeerMismatch, "no adjacent peers among {} peered halfedges",
                                 mesh.PeeredHalfedges().size());
            }

            auto zip = mesh.SplitLoop(mesh.PrevHalfedge(a), b, SplitSide::Right);
            if (!zip) return std::unexpected(zip.error());

            const HalfedgeHandle seam = zip->First;
            const std::string toName = mesh.Name(mesh.ToVertex(seam));
            const std::string fromName = mesh.Name(mesh.FromVertex(seam));

            auto survivor = mesh.ContractEdge(seam);
            if (!survivor) return std::unexpected(survivor.error());
            if (auto renamed = mesh.RenameVertex(*survivor, MergeNames(toName, fromName)); !renamed)
            {
                return std::unexpected(renamed.error());
            }

            auto dropped = mesh.DropEdge(a);
            if (!dropped) return std::unexpected(dropped.error());

            Core::Log::Trace(trace, "glued {} + {} -> {}", toName, fromName, mesh.Name(*survivor));
            ++glued;
        }

        const HalfedgeHandle a = mesh.Halfedge(mesh.BoundaryLoop());
        const HalfedgeHandle b = mesh.NextHalfedge(a);
        if (mesh.Peer(a) != b || mesh.Peer(b) != a)
        {
            return Core::Err(ErrorCode::PeerMismatch, "last boundary pair {}->{} and {}->{} are not peers",
                             mesh.Name(mesh.FromVertex(a)), mesh.Name(mesh.ToVertex(a)),
                             mesh.Name(mesh.FromVertex(b)), mesh.Name(mesh.ToVertex(b)));
        }

        auto closed = mesh.DropEdge(a);
        if (!closed) return std::unexpected(closed.error());
        ++glued;

        Core::Log::Trace(trace, "glued {} peer pairs, mesh closed", glued);
        return glued;
    }
}
