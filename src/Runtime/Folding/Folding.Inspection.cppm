module;

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Folding:Inspection;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;

export namespace Folding
{
    // =========================================================================
    // Consistency check
    // =========================================================================
    //
    // Kernel Check() plus the invariants that need geometry or peers:
    //   - every face loop is flat within Coincidence,
    //   - with a boundary, every boundary halfedge has a peer, every peer sits
    //     on the boundary, links are reciprocal and peer lengths agree within
    //     PeerLength,
    //   - without a boundary, no peers remain.
    [[nodiscard]] Core::Result CheckConsistency(const Geometry::Halfedge::Mesh& mesh, const Tolerances& tolerances);

    // =========================================================================
    // Mesh report
    // =========================================================================
    //
    // Human-readable dump: loops with their vertex cycles, vertices with
    // position, neighbours and loops, nearby vertex pairs, counts, dihedral
    // angles of interior edges and the peer pairs. One sink record per line.
    [[nodiscard]] Core::Result DescribeMesh(const Geometry::Halfedge::Mesh& mesh, const Tolerances& tolerances,
                                            Core::Log::Sink& sink);

    // Largest absolute length difference over all peer pairs; 0 without peers.
    [[nodiscard]] double MaxPeerLengthDrift(const Geometry::Halfedge::Mesh& mesh);

    // =========================================================================
    // Snapshot
    // =========================================================================

    struct SnapshotVertex
    {
        std::string Name;
        glm::dvec3 Position{0.0};
    };

    struct SnapshotLoop
    {
        std::string Name;
        bool IsFace{true};
        std::vector<std::size_t> Vertices;  // indices into MeshSnapshot::Vertices, loop order
    };

    // Directed edge between two snapshot vertices.
    struct SnapshotHalfedge
    {
        std::size_t From{0};
        std::size_t To{0};
    };

    // Plain copy of the mesh state with every handle replaced by a dense index.
    struct MeshSnapshot
    {
        std::vector<SnapshotVertex> Vertices;
        std::vector<std::pair<std::size_t, std::size_t>> Edges;
        std::vector<SnapshotLoop> Loops;       // faces and the boundary
        std::vector<std::size_t> Boundary;     // empty once the mesh is closed
        std::vector<std::pair<SnapshotHalfedge, SnapshotHalfedge>> Peers;  // each pair once

        [[nodiscard]] std::size_t FaceCount() const;
    };

    [[nodiscard]] Core::Expected<MeshSnapshot> TakeSnapshot(const Geometry::Halfedge::Mesh& mesh);

    [[nodiscard]] std::string FormatSnapshot(const MeshSnapshot& snapshot);
}
