module;

#include <cstddef>
#include <vector>

export module Folding:Relaxation;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;

export namespace Folding
{
    // =========================================================================
    // contract <iterations>
    // =========================================================================
    //
    // Jacobi-style relaxation of a fully triangulated sheet towards a closed
    // surface, followed by gluing every peer pair.
    //
    // Each vertex keeps a map of target distances: its mesh neighbours at
    // their current distance, plus distance 0 to every boundary vertex that
    // should end up on top of it (same base name up to the first '.', or both
    // being tips). Per iteration every vertex moves to the mean of the
    // positions its targets propose:
    //   len == 0 : pos(vb)
    //   len  > 0 : pos(vb) + len / |va - vb| * (va - vb)
    // All moves are computed from the same snapshot and applied together.
    struct ContractParams
    {
        std::size_t Iterations{1};
    };

    struct ContractResult
    {
        // Sum of displacement lengths, one entry per executed iteration.
        std::vector<double> Badness;

        // Peer pairs merged, including the final one that removes the boundary.
        std::size_t GluedPairs{0};
    };

    [[nodiscard]] Core::Expected<ContractResult> Contract(Geometry::Halfedge::Mesh& mesh,
                                                          const ContractParams& params,
                                                          const Tolerances& tolerances,
                                                          Core::Log::Sink& trace);

    // -------------------------------------------------------------------------
    // Peer gluing
    // -------------------------------------------------------------------------
    //
    // While more than one pair is left, picks the first pair (in link order)
    // meeting head to tail, zips it shut and merges the two end vertices. The
    // last pair must be the whole two-edge boundary, which is dropped.
    // Returns the number of pairs glued.
    [[nodiscard]] Core::Expected<std::size_t> GluePeers(Geometry::Halfedge::Mesh& mesh, Core::Log::Sink& trace);
}
