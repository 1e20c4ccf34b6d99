module;

#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Folding:StarBuilder;

import Core.Error;
import Core.Logging;
import Geometry;
import :Tolerances;

export namespace Folding::StarBuilder
{
    // =========================================================================
    // Star definition
    // =========================================================================
    //
    // One line per outer-polygon edge: "<name> <step> [<step> ...]". Steps are
    // clock directions 1..12 on a triangular lattice: even directions move one
    // unit, odd directions move sqrt(3) units, 12 o'clock is +y. Blank lines
    // and lines starting with "//" or "#" are skipped.
    //
    // For every edge the star gets a tip at the edge start and an inner vertex
    // named after the edge at start + rot60ccw(end - start).

    struct StarEdge
    {
        std::string Name;
        glm::dvec3 From{0.0};   // tip position
        glm::dvec3 Inner{0.0};  // inner vertex position
    };

    struct StarDefinition
    {
        std::vector<StarEdge> Edges;

        // Position reached after the last step; the origin for a closed outline.
        glm::dvec3 End{0.0};
    };

    // Offset of one lattice step. Fails for directions outside 1..12.
    [[nodiscard]] Core::Expected<glm::dvec3> LatticeStep(int clockDirection);

    // Meaningful lines of a polygon or script text, trimmed.
    [[nodiscard]] std::vector<std::string_view> ContentLines(std::string_view text);

    // Whitespace-separated tokens of one line.
    [[nodiscard]] std::vector<std::string_view> Tokenize(std::string_view line);

    [[nodiscard]] Core::Expected<StarDefinition> ParseDefinition(std::string_view text);

    // Builds the single-face star and its boundary into an empty mesh. Tips
    // are named "[x^y]" where x is the inner vertex reached along the
    // boundary and y the one reached along the star. Each boundary edge pair
    // belonging to one outline edge becomes a peer pair.
    [[nodiscard]] Core::Result Build(Geometry::Halfedge::Mesh& mesh,
                                     const StarDefinition& definition,
                                     const Tolerances& tolerances,
                                     Core::Log::Sink& trace);
}
