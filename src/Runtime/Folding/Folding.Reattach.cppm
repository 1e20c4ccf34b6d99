module;

#include <cstddef>
#include <string>

export module Folding:Reattach;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;

export namespace Folding
{
    // =========================================================================
    // reattach <p> <q>
    // =========================================================================
    //
    // Cuts the unique face shared by p and q along p-q, opening a new slit
    // from the boundary at p to q (p splits into "p.0" and "p.1", and the two
    // sides of the slit become peers), then closes the existing notch at q:
    // the smaller of the two parts hanging off q is rotated about q until the
    // tips next to q coincide and the faces on either side of the seam are
    // coplanar, and the tips are merged.
    //
    // The notch at q must be an adjacent peer pair on the boundary. The
    // planar shape of the sheet is preserved; only its cut pattern changes.
    struct ReattachParams
    {
        std::string P;
        std::string Q;
    };

    struct ReattachResult
    {
        std::string MergedTip;
        std::size_t MovedVertices{0};
    };

    [[nodiscard]] Core::Expected<ReattachResult> Reattach(Geometry::Halfedge::Mesh& mesh,
                                                          const ReattachParams& params,
                                                          const Tolerances& tolerances,
                                                          Core::Log::Sink& trace);
}
