module;

#include <cstddef>
#include <string>
#include <vector>

export module Folding:Bend;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;

export namespace Folding
{
    // =========================================================================
    // bend <angle> <v1> <v2> [<v3> ...]
    // =========================================================================
    //
    // For each consecutive pair (prev, cur) of the path, the unique face
    // holding both is split along prev-cur and everything reachable from the
    // far side without crossing prev or cur is rotated about the line through
    // cur parallel to cur - prev by Angle radians (right-hand rule). A
    // positive angle folds the far region away from the face normal.
    //
    // All vertices must touch the boundary. New loops are named
    // "split(prev-cur)".
    struct BendParams
    {
        double Angle{0.0};                  // radians
        std::vector<std::string> Path;      // at least two vertex names
    };

    struct BendResult
    {
        std::size_t Hinges{0};              // number of face splits
        std::size_t MovedVertices{0};       // summed over all hinges
    };

    [[nodiscard]] Core::Expected<BendResult> Bend(Geometry::Halfedge::Mesh& mesh, const BendParams& params,
                                                  const Tolerances& tolerances, Core::Log::Sink& trace);

    // =========================================================================
    // bend2 <+|-> <p> <q> <r>
    // =========================================================================
    //
    // Closes the notch at q: q's outgoing boundary halfedge and its
    // predecessor must be peers. The faces are split along q-p and q-r, the
    // two flaps carrying the tips t1 and t2 next to q are rotated about those
    // hinges until both tips meet at a common point, the tips are merged and
    // the peer pair disappears from the boundary.
    //
    // The meeting point is one of the two intersections of the spheres
    // (s1, |s1 t1|), (q, |q t1|), (s2, |s2 t2|), where s1 is whichever of p
    // and r comes first walking the boundary from q. With
    // n = (q - s1) x (s2 - s1), Plus picks the intersection x with
    // n . (x - s1) < 0 and Minus the other one.
    //
    // The hinge t-q left behind is dropped when the loops on both sides turn
    // out coplanar.
    enum class Bend2Choice
    {
        Plus,
        Minus
    };

    struct Bend2Params
    {
        Bend2Choice Choice{Bend2Choice::Plus};
        std::string P;
        std::string Q;
        std::string R;
    };

    struct Bend2Result
    {
        std::string MergedTip;              // name of the merged tip vertex
        std::size_t MovedVertices{0};
        bool HingeDropped{false};
    };

    [[nodiscard]] Core::Expected<Bend2Result> Bend2(Geometry::Halfedge::Mesh& mesh, const Bend2Params& params,
                                                    const Tolerances& tolerances, Core::Log::Sink& trace);
}
