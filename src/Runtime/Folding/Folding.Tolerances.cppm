module;

#include <cstddef>

export module Folding:Tolerances;

export namespace Folding
{
    // Numeric thresholds shared by every folding operator. The values depend
    // on mesh scale; the defaults suit unit lattice steps.
    struct Tolerances
    {
        // Two points coincide, a loop is flat, two unit normals agree.
        double Coincidence{1e-8};

        // Vertex pairs closer than this are reported by the mesh report.
        double NearbyVertex{1e-4};

        // Allowed difference between the lengths of two peer halfedges.
        double PeerLength{1e-3};

        // Allowed squared norm of the star outline's closing offset.
        double PolygonClosure{1e-6};

        // Negative sphere-intersection discriminants above -Discriminant are
        // treated as tangency.
        double Discriminant{1e-10};

        // Upper bound on any vertex rotation or loop walk.
        std::size_t NeighborhoodLimit{50};
    };
}
